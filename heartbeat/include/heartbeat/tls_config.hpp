// Copyright (c) 2025 <Your Name>
/**
 * @file tls_config.hpp
 * @brief Immutable TLS settings for heartbeat connections.
 */
#pragma once

#include <ostream>
#include <string>
#include <utility>

namespace heartbeat {

/**
 * @brief File-based TLS configuration (PEM).
 *
 * Clients need a CA file to verify the peer (or VerifyPeer(false) for
 * tests). Servers need a certificate and private key; when a server also
 * has a CA file and VerifyPeer(true), clients must present a certificate.
 */
class TlsConfig {
 public:
  class Builder {
   public:
    Builder() = default;
    explicit Builder(const TlsConfig& base);

    /** CA bundle used to verify the peer certificate. */
    Builder& CaFile(const std::string& path);
    /** Certificate chain presented to the peer. */
    Builder& CertFile(const std::string& path);
    /** Private key matching CertFile. */
    Builder& KeyFile(const std::string& path);
    /** Expected host name of the server (defaults to the dialed host). */
    Builder& ServerName(const std::string& name);
    /** Verify the peer certificate (default: true). */
    Builder& VerifyPeer(bool v);

    TlsConfig Build() const;

   private:
    std::string ca_file_;
    std::string cert_file_;
    std::string key_file_;
    std::string server_name_;
    bool verify_peer_ = true;
  };

  TlsConfig() = default;

  const std::string& CaFile() const { return ca_file_; }
  const std::string& CertFile() const { return cert_file_; }
  const std::string& KeyFile() const { return key_file_; }
  const std::string& ServerName() const { return server_name_; }
  bool VerifyPeer() const { return verify_peer_; }

  friend std::ostream& operator<<(std::ostream& os, const TlsConfig& c);

 private:
  TlsConfig(std::string ca, std::string cert, std::string key,
            std::string server_name, bool verify)
      : ca_file_(std::move(ca)),
        cert_file_(std::move(cert)),
        key_file_(std::move(key)),
        server_name_(std::move(server_name)),
        verify_peer_(verify) {}

  std::string ca_file_;
  std::string cert_file_;
  std::string key_file_;
  std::string server_name_;
  bool verify_peer_ = true;
};

}  // namespace heartbeat
