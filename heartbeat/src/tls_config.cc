// Copyright (c) 2025 <Your Name>
#include "heartbeat/tls_config.hpp"

namespace heartbeat {

TlsConfig::Builder::Builder(const TlsConfig& base)
    : ca_file_(base.ca_file_),
      cert_file_(base.cert_file_),
      key_file_(base.key_file_),
      server_name_(base.server_name_),
      verify_peer_(base.verify_peer_) {}

TlsConfig::Builder& TlsConfig::Builder::CaFile(const std::string& path) {
  ca_file_ = path;
  return *this;
}

TlsConfig::Builder& TlsConfig::Builder::CertFile(const std::string& path) {
  cert_file_ = path;
  return *this;
}

TlsConfig::Builder& TlsConfig::Builder::KeyFile(const std::string& path) {
  key_file_ = path;
  return *this;
}

TlsConfig::Builder& TlsConfig::Builder::ServerName(const std::string& name) {
  server_name_ = name;
  return *this;
}

TlsConfig::Builder& TlsConfig::Builder::VerifyPeer(bool v) {
  verify_peer_ = v;
  return *this;
}

TlsConfig TlsConfig::Builder::Build() const {
  return TlsConfig(ca_file_, cert_file_, key_file_, server_name_,
                   verify_peer_);
}

std::ostream& operator<<(std::ostream& os, const TlsConfig& c) {
  os << "ca=" << (c.ca_file_.empty() ? "-" : c.ca_file_)
     << " cert=" << (c.cert_file_.empty() ? "-" : c.cert_file_)
     << " key=" << (c.key_file_.empty() ? "-" : c.key_file_)
     << " server_name=" << (c.server_name_.empty() ? "-" : c.server_name_)
     << " verify=" << (c.verify_peer_ ? "on" : "off");
  return os;
}

}  // namespace heartbeat
