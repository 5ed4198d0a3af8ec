// Copyright (c) 2025 <Your Name>
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include "heartbeat/export.hpp"
#include "heartbeat/heartbeat_types.hpp"
#include "heartbeat/time_source.hpp"
#include "heartbeat/tls_config.hpp"

namespace heartbeat {

/**
 * Immutable configuration options for HeartbeatServer.
 */
class Options {
 public:
  using LogCallback = std::function<void(const std::string&)>;
  /** Invoked for every well-formed Ping before the reply is sent. */
  using PingCallback = std::function<void(const PingRequest&)>;

  class Builder {
   public:
    Builder();
    explicit Builder(const Options& base);
    /** Serve TLS with the given certificate/key (default: plain TCP). */
    Builder& Tls(const TlsConfig& cfg);
    /** Deadline for a client's TLS handshake (default: 5000 ms). */
    Builder& HandshakeTimeoutMs(int v);
    /** Listen backlog (default: 64). */
    Builder& Backlog(int v);
    Builder& OnPing(PingCallback cb);
    Builder& LogSink(LogCallback cb);
    Options Build() const;

   private:
    bool use_tls_;
    TlsConfig tls_;
    int handshake_timeout_ms_;
    int backlog_;
    PingCallback on_ping_;
    LogCallback log_sink_cb_;
  };

  Options();

  bool UseTls() const;
  const TlsConfig& Tls() const;
  int HandshakeTimeoutMs() const;
  int Backlog() const;
  const PingCallback& OnPing() const;
  const LogCallback& LogSink() const;

  static constexpr int kDefaultHandshakeTimeoutMs = 5000;
  static constexpr int kDefaultBacklog = 64;

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const Options& o);

 private:
  Options(bool use_tls, const TlsConfig& tls, int handshake_timeout_ms,
          int backlog, PingCallback on_ping, LogCallback log_cb);

  bool use_tls_;
  TlsConfig tls_;
  int handshake_timeout_ms_;
  int backlog_;
  PingCallback on_ping_;
  LogCallback log_callback_;
};

struct ServerStats {
  uint64_t connections_accepted = 0;  ///< Connections that reached serving
  uint64_t active_connections = 0;    ///< Connections currently served
  uint64_t requests_received = 0;     ///< Well-formed request frames
  uint64_t responses_sent = 0;        ///< Responses written successfully
  uint64_t recv_errors = 0;           ///< Malformed frames or read errors
  uint64_t send_errors = 0;           ///< Failed response writes
  uint64_t handshake_failures = 0;    ///< Rejected TLS handshakes
  uint64_t unknown_methods = 0;       ///< Requests for other methods
  std::string last_error;             ///< Latest error message
};

/**
 * Heartbeat responder (TCP/IPv4, optional TLS).
 *
 * Answers Heartbeat.Ping with the local clock reading of the TimeSource so
 * that callers can estimate this node's clock offset. Each connection is
 * served on its own thread.
 */
class HEARTBEAT_API HeartbeatServer {
 public:
  HeartbeatServer();
  ~HeartbeatServer();

  HeartbeatServer(const HeartbeatServer&) = delete;
  HeartbeatServer& operator=(const HeartbeatServer&) = delete;

  /**
   * @brief Starts serving on the given TCP port.
   * @param port TCP port to bind (0 = ephemeral, see Port()).
   * @param time_source Clock reported as ServerTime (default: MonotonicClock).
   * @param options Immutable configuration snapshot (defaults applied).
   * @return true on success, false on failure (see GetStats().last_error).
   */
  bool Start(uint16_t port = 26257, TimeSource* time_source = nullptr,
             const Options& options = Options());

  /** Stops the server and closes every connection. Safe to call twice. */
  void Stop();

  /** Bound port while running, 0 otherwise. */
  uint16_t Port() const;

  /** Returns latest statistics snapshot (thread-safe). */
  ServerStats GetStats() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace heartbeat
