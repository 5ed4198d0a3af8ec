// Copyright (c) 2025 <Your Name>
/**
 * @file tls_context.hpp
 * @brief OpenSSL context wrapper producing TLS connections.
 */
#pragma once

#include <memory>
#include <string>

#include "heartbeat/conn.hpp"
#include "heartbeat/export.hpp"
#include "heartbeat/tls_config.hpp"

namespace heartbeat {

/**
 * @brief Loaded TLS credentials for one role.
 *
 * Created once from a TlsConfig and shared by every connection of that
 * role. Thread-safe after creation.
 */
class HEARTBEAT_API TlsContext {
 public:
  enum class Role { kClient, kServer };

  ~TlsContext();

  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;

  /**
   * @brief Loads certificates and keys named by config.
   * @param role Client or server side of the handshake.
   * @param config TLS file settings.
   * @param err Output: OpenSSL error text on failure.
   * @return Context, or nullptr on failure.
   */
  static std::shared_ptr<TlsContext> Create(Role role, const TlsConfig& config,
                                            std::string* err);

  /**
   * @brief Runs the TLS handshake over a connected socket.
   * @param socket Connected TCP socket (ownership transferred).
   * @param peer_name Host name checked against the server certificate
   *        (client role; ignored when ServerName() is configured).
   * @param timeout_ms Handshake deadline.
   * @param err Output: failure description.
   * @return Encrypted connection, or nullptr on failure.
   */
  std::unique_ptr<Conn> Handshake(std::unique_ptr<platform::ISocket> socket,
                                  const std::string& peer_name, int timeout_ms,
                                  std::string* err) const;

  Role GetRole() const;

 private:
  struct Impl;
  explicit TlsContext(std::unique_ptr<Impl> impl);
  std::unique_ptr<Impl> impl_;
};

}  // namespace heartbeat
