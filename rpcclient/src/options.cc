// Copyright (c) 2025 <Your Name>
#include "rpcclient/options.hpp"

#include <utility>

#include "rpcclient/dialer.hpp"

namespace rpcclient {

Options::Builder::Builder()
    : heartbeat_interval_ms_(Options::kDefaultHeartbeatIntervalMs),
      connect_timeout_ms_(Options::kDefaultConnectTimeoutMs),
      use_tls_(false) {}

Options::Builder::Builder(const Options& base)
    : heartbeat_interval_ms_(base.heartbeat_interval_ms_),
      connect_timeout_ms_(base.connect_timeout_ms_),
      retry_(base.retry_),
      use_tls_(base.use_tls_),
      tls_(base.tls_),
      dialer_(base.dialer_),
      log_sink_cb_(base.log_callback_) {}

Options::Builder& Options::Builder::HeartbeatIntervalMs(int v) {
  heartbeat_interval_ms_ = v > 0 ? v : Options::kDefaultHeartbeatIntervalMs;
  return *this;
}

Options::Builder& Options::Builder::ConnectTimeoutMs(int v) {
  connect_timeout_ms_ = v > 0 ? v : Options::kDefaultConnectTimeoutMs;
  return *this;
}

Options::Builder& Options::Builder::Retry(const RetryOptions& v) {
  retry_ = v;
  return *this;
}

Options::Builder& Options::Builder::Tls(const heartbeat::TlsConfig& v) {
  use_tls_ = true;
  tls_ = v;
  return *this;
}

Options::Builder& Options::Builder::Transport(
    std::shared_ptr<rpcclient::Dialer> v) {
  dialer_ = std::move(v);
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  Options o;
  o.heartbeat_interval_ms_ = heartbeat_interval_ms_;
  o.connect_timeout_ms_ = connect_timeout_ms_;
  o.retry_ = retry_;
  o.use_tls_ = use_tls_;
  o.tls_ = tls_;
  o.dialer_ = dialer_;
  o.log_callback_ = log_sink_cb_;
  return o;
}

Options::Options()
    : heartbeat_interval_ms_(kDefaultHeartbeatIntervalMs),
      connect_timeout_ms_(kDefaultConnectTimeoutMs),
      use_tls_(false) {}

std::ostream& operator<<(std::ostream& os, const Options& o) {
  os << "heartbeat_interval_ms=" << o.heartbeat_interval_ms_
     << " connect_timeout_ms=" << o.connect_timeout_ms_ << " retry={"
     << o.retry_ << "} tls=" << (o.use_tls_ ? "on" : "off");
  if (o.dialer_) os << " dialer=custom";
  return os;
}

}  // namespace rpcclient
