// Copyright (c) 2025 <Your Name>
/**
 * @file options.hpp
 * @brief Immutable configuration shared by a ClientRegistry and its clients.
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include "heartbeat/tls_config.hpp"
#include "rpcclient/retry.hpp"

namespace rpcclient {

class Dialer;

/**
 * @brief Immutable options for ClientRegistry.
 *
 * Use the Builder to construct instances. All fields are read-only via
 * getters.
 */
class Options {
 public:
  using LogCallback = std::function<void(const std::string&)>;

  /**
   * @brief Fluent builder for Options.
   */
  class Builder {
   public:
    Builder();
    explicit Builder(const Options& base);

    /** Interval between heartbeats (default: 3000 ms). */
    Builder& HeartbeatIntervalMs(int v);
    /** TCP connect and TLS handshake bound (default: 5000 ms). */
    Builder& ConnectTimeoutMs(int v);
    /** Retry policy for clients created without an override. */
    Builder& Retry(const RetryOptions& v);
    /** Wrap connections in TLS (default: plain TCP). */
    Builder& Tls(const heartbeat::TlsConfig& v);
    /** Custom transport factory; overrides ConnectTimeoutMs and Tls. */
    Builder& Transport(std::shared_ptr<rpcclient::Dialer> v);
    /** Sink for log messages (default: none). */
    Builder& LogSink(LogCallback cb);

    Options Build() const;

   private:
    int heartbeat_interval_ms_;
    int connect_timeout_ms_;
    RetryOptions retry_;
    bool use_tls_;
    heartbeat::TlsConfig tls_;
    std::shared_ptr<rpcclient::Dialer> dialer_;
    LogCallback log_sink_cb_;
  };

  Options();

  /** @name Getters (immutable) */
  ///@{
  int HeartbeatIntervalMs() const { return heartbeat_interval_ms_; }
  std::chrono::milliseconds HeartbeatInterval() const {
    return std::chrono::milliseconds(heartbeat_interval_ms_);
  }
  /** Heartbeat call timeout: twice the interval. */
  std::chrono::milliseconds HeartbeatTimeout() const {
    return 2 * HeartbeatInterval();
  }
  int ConnectTimeoutMs() const { return connect_timeout_ms_; }
  const RetryOptions& Retry() const { return retry_; }
  bool UseTls() const { return use_tls_; }
  const heartbeat::TlsConfig& Tls() const { return tls_; }
  const std::shared_ptr<rpcclient::Dialer>& Transport() const {
    return dialer_;
  }
  const LogCallback& LogSink() const { return log_callback_; }
  ///@}

  static constexpr int kDefaultHeartbeatIntervalMs = 3000;
  static constexpr int kDefaultConnectTimeoutMs = 5000;

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const Options& o);

 private:
  int heartbeat_interval_ms_;
  int connect_timeout_ms_;
  RetryOptions retry_;
  bool use_tls_;
  heartbeat::TlsConfig tls_;
  std::shared_ptr<rpcclient::Dialer> dialer_;
  LogCallback log_callback_;
};

}  // namespace rpcclient
