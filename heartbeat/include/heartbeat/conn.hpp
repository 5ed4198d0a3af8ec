// Copyright (c) 2025 <Your Name>
/**
 * @file conn.hpp
 * @brief Byte-stream connection used by the heartbeat RPC.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "heartbeat/export.hpp"
#include "heartbeat/platform/socket_interface.hpp"

namespace heartbeat {

class TlsContext;

/**
 * @brief Reliable byte stream to one peer (plain TCP or TLS).
 *
 * One reader and any number of writers may use a Conn concurrently; writes
 * are serialized internally. Close() may be called from any thread and
 * makes blocked reads and writes return false. The descriptor itself is
 * released when the Conn is destroyed.
 */
class HEARTBEAT_API Conn {
 public:
  virtual ~Conn() = default;

  /**
   * @brief Writes the whole buffer.
   * @return false on error or after Close().
   */
  virtual bool Write(const std::vector<uint8_t>& data) = 0;

  /**
   * @brief Reads exactly n bytes.
   * @return false on error, EOF or Close(). GetLastError() returns
   *         "Connection closed" when the peer closed the stream.
   */
  virtual bool ReadFull(uint8_t* buf, size_t n) = 0;

  /** Shuts the stream down. Idempotent. */
  virtual void Close() = 0;

  virtual bool IsClosed() const = 0;
  virtual platform::Endpoint LocalEndpoint() const = 0;
  virtual platform::Endpoint RemoteEndpoint() const = 0;
  virtual std::string GetLastError() const = 0;
};

/**
 * @brief Wraps a connected socket without encryption.
 */
HEARTBEAT_API std::unique_ptr<Conn> NewPlainConn(
    std::unique_ptr<platform::ISocket> socket);

/**
 * @brief Opens a connection to a peer.
 *
 * Connects over TCP and, when tls is non-null, performs a client TLS
 * handshake. Every failure here is a dial failure that callers may retry.
 *
 * @param to Peer endpoint.
 * @param tls Client TLS context, or nullptr for plain TCP.
 * @param timeout_ms Bound for connect and for the handshake.
 * @param err Output: failure description.
 * @return Connection, or nullptr on failure.
 */
HEARTBEAT_API std::unique_ptr<Conn> Dial(const platform::Endpoint& to,
                                         const TlsContext* tls,
                                         int timeout_ms, std::string* err);

}  // namespace heartbeat
