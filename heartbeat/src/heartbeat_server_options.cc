// Copyright (c) 2025 <Your Name>
#include <utility>

#include "heartbeat/heartbeat_server.hpp"

namespace heartbeat {

Options::Builder::Builder() {
  use_tls_ = false;
  handshake_timeout_ms_ = Options::kDefaultHandshakeTimeoutMs;
  backlog_ = Options::kDefaultBacklog;
}

Options::Builder::Builder(const Options& base) {
  use_tls_ = base.use_tls_;
  tls_ = base.tls_;
  handshake_timeout_ms_ = base.handshake_timeout_ms_;
  backlog_ = base.backlog_;
  on_ping_ = base.on_ping_;
  log_sink_cb_ = base.log_callback_;
}

Options::Builder& Options::Builder::Tls(const TlsConfig& cfg) {
  use_tls_ = true;
  tls_ = cfg;
  return *this;
}

Options::Builder& Options::Builder::HandshakeTimeoutMs(int v) {
  handshake_timeout_ms_ = v > 0 ? v : Options::kDefaultHandshakeTimeoutMs;
  return *this;
}

Options::Builder& Options::Builder::Backlog(int v) {
  backlog_ = v > 0 ? v : Options::kDefaultBacklog;
  return *this;
}

Options::Builder& Options::Builder::OnPing(PingCallback cb) {
  on_ping_ = std::move(cb);
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  return Options(use_tls_, tls_, handshake_timeout_ms_, backlog_, on_ping_,
                 log_sink_cb_);
}

Options::Options() {
  use_tls_ = false;
  handshake_timeout_ms_ = kDefaultHandshakeTimeoutMs;
  backlog_ = kDefaultBacklog;
}

Options::Options(bool use_tls, const TlsConfig& tls, int handshake_timeout_ms,
                 int backlog, PingCallback on_ping, LogCallback log_cb) {
  use_tls_ = use_tls;
  tls_ = tls;
  handshake_timeout_ms_ = handshake_timeout_ms;
  backlog_ = backlog;
  on_ping_ = std::move(on_ping);
  log_callback_ = std::move(log_cb);
}

bool Options::UseTls() const { return use_tls_; }

const TlsConfig& Options::Tls() const { return tls_; }

int Options::HandshakeTimeoutMs() const { return handshake_timeout_ms_; }

int Options::Backlog() const { return backlog_; }

const Options::PingCallback& Options::OnPing() const { return on_ping_; }

const Options::LogCallback& Options::LogSink() const { return log_callback_; }

std::ostream& operator<<(std::ostream& os, const Options& o) {
  os << "tls=" << (o.use_tls_ ? "on" : "off");
  if (o.use_tls_) os << " (" << o.tls_ << ")";
  os << " handshake_timeout_ms=" << o.handshake_timeout_ms_
     << " backlog=" << o.backlog_;
  return os;
}

}  // namespace heartbeat
