// Copyright (c) 2025 <Your Name>
/**
 * @file dialer.hpp
 * @brief Opens transports to peers for Client.
 */
#pragma once

#include <memory>
#include <string>

#include "heartbeat/conn.hpp"
#include "heartbeat/tls_config.hpp"

namespace heartbeat {
class TlsContext;
}  // namespace heartbeat

namespace rpcclient {

/**
 * @brief Transport factory.
 *
 * Every failure is treated as retryable by Client.
 */
class Dialer {
 public:
  virtual ~Dialer() = default;

  /**
   * @brief Opens a connection to addr ("host:port").
   * @param err Output: failure description.
   * @return Connection, or nullptr on failure.
   */
  virtual std::unique_ptr<heartbeat::Conn> Dial(const std::string& addr,
                                                std::string* err) = 0;
};

/**
 * @brief Dialer for TCP, TLS-wrapped when a TlsConfig is given.
 */
class TcpDialer : public Dialer {
 public:
  /** Plain TCP. */
  explicit TcpDialer(int connect_timeout_ms);

  /**
   * TLS over TCP. If the credentials cannot be loaded every Dial() fails
   * with the load error.
   */
  TcpDialer(int connect_timeout_ms, const heartbeat::TlsConfig& tls);

  ~TcpDialer() override;

  std::unique_ptr<heartbeat::Conn> Dial(const std::string& addr,
                                        std::string* err) override;

 private:
  int connect_timeout_ms_;
  bool use_tls_;
  std::shared_ptr<heartbeat::TlsContext> tls_;
  std::string tls_error_;
};

}  // namespace rpcclient
