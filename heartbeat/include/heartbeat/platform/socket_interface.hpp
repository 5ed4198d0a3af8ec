// Copyright (c) 2025 <Your Name>
/**
 * @file socket_interface.hpp
 * @brief Platform-independent TCP socket interface.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace heartbeat {
namespace platform {

/** Endpoint information (host and port). */
struct Endpoint {
  std::string address;  ///< IPv4 literal or host name (e.g. "192.168.1.1")
  uint16_t port;

  Endpoint() : port(0) {}
  Endpoint(const std::string& addr, uint16_t p) : address(addr), port(p) {}

  /** Formats as "host:port". */
  std::string ToString() const;
};

/**
 * @brief Parses "host:port" into an Endpoint.
 * @return false when the port is missing, not numeric or out of range.
 */
bool ParseEndpoint(const std::string& host_port, Endpoint* out);

/** Platform-independent stream socket interface. */
class ISocket {
 public:
  virtual ~ISocket() = default;

  /**
   * Creates the underlying TCP socket.
   * @return true on success.
   */
  virtual bool Initialize() = 0;

  /**
   * Binds to the given port on all interfaces (0 = ephemeral).
   * @return true on success.
   */
  virtual bool Bind(uint16_t port) = 0;

  /** Marks the socket as listening. */
  virtual bool Listen(int backlog) = 0;

  /**
   * Accepts one pending connection. Call after WaitReadable() reported the
   * listening socket readable.
   * @return Connected socket, or nullptr on failure.
   */
  virtual std::unique_ptr<ISocket> Accept() = 0;

  /**
   * Connects to a remote endpoint, resolving host names to IPv4.
   * @param to Remote endpoint.
   * @param timeout_ms Upper bound for the connection attempt.
   * @return true once the connection is established.
   */
  virtual bool Connect(const Endpoint& to, int timeout_ms) = 0;

  /**
   * Waits until data can be read (or a peer is pending on a listener).
   * @param timeout_us Timeout in microseconds.
   * @return true if readable, false on timeout or error.
   */
  virtual bool WaitReadable(int64_t timeout_us) = 0;

  /** Waits until the socket can be written. */
  virtual bool WaitWritable(int64_t timeout_us) = 0;

  /**
   * Receives up to max_size bytes.
   * @param data Output buffer, resized to the number of bytes read.
   * @return false on error or when the peer closed the connection
   *         (GetLastError() returns "Connection closed").
   */
  virtual bool Receive(std::vector<uint8_t>* data, size_t max_size) = 0;

  /**
   * Sends the whole buffer, retrying partial writes.
   * @return true if every byte was written.
   */
  virtual bool SendAll(const uint8_t* data, size_t size) = 0;

  /** Switches O_NONBLOCK on or off. */
  virtual bool SetNonBlocking(bool enabled) = 0;

  /** Shuts down both directions; wakes threads blocked on the socket. */
  virtual void Shutdown() = 0;

  /** Closes the descriptor. */
  virtual void Close() = 0;

  /** Latest error description. */
  virtual std::string GetLastError() const = 0;

  /** True while the descriptor is open. */
  virtual bool IsValid() const = 0;

  /** Raw descriptor, for TLS libraries that drive the socket themselves. */
  virtual int NativeHandle() const = 0;

  virtual Endpoint LocalEndpoint() const = 0;
  virtual Endpoint RemoteEndpoint() const = 0;
};

/**
 * Creates the platform-specific ISocket implementation.
 */
std::unique_ptr<ISocket> CreatePlatformSocket();

}  // namespace platform
}  // namespace heartbeat
