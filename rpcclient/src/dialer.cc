// Copyright (c) 2025 <Your Name>
#include "rpcclient/dialer.hpp"

#include "heartbeat/platform/socket_interface.hpp"
#include "heartbeat/tls_context.hpp"

namespace rpcclient {

TcpDialer::TcpDialer(int connect_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms), use_tls_(false) {}

TcpDialer::TcpDialer(int connect_timeout_ms, const heartbeat::TlsConfig& tls)
    : connect_timeout_ms_(connect_timeout_ms), use_tls_(true) {
  tls_ = heartbeat::TlsContext::Create(heartbeat::TlsContext::Role::kClient,
                                       tls, &tls_error_);
}

TcpDialer::~TcpDialer() = default;

std::unique_ptr<heartbeat::Conn> TcpDialer::Dial(const std::string& addr,
                                                 std::string* err) {
  if (use_tls_ && !tls_) {
    if (err) *err = "TLS setup failed: " + tls_error_;
    return nullptr;
  }
  heartbeat::platform::Endpoint to;
  if (!heartbeat::platform::ParseEndpoint(addr, &to)) {
    if (err) *err = "invalid address \"" + addr + "\"";
    return nullptr;
  }
  return heartbeat::Dial(to, tls_.get(), connect_timeout_ms_, err);
}

}  // namespace rpcclient
