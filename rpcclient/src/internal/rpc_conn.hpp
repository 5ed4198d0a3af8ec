// Copyright (c) 2025 <Your Name>
/**
 * @file rpc_conn.hpp
 * @brief Request/response multiplexer over one heartbeat connection.
 *
 * Requests are written by the caller's thread; a background receive thread
 * reads response frames and completes the matching Call by sequence number.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "heartbeat/conn.hpp"

namespace rpcclient {
namespace internal {

/** Error reported for calls on a closed or broken connection. */
constexpr char kErrShutdown[] = "connection is shut down";

/**
 * @brief One outstanding RPC.
 *
 * Completed exactly once, either with a reply body or with an error.
 */
class Call {
 public:
  Call() = default;
  Call(const Call&) = delete;
  Call& operator=(const Call&) = delete;

  /**
   * @brief Waits for completion.
   * @return true if the call completed within timeout.
   */
  bool WaitFor(std::chrono::nanoseconds timeout) const;

  /** Waits for completion without a bound. */
  void Wait() const;

  bool Done() const;
  /** True when completed without error. */
  bool Ok() const;
  /** Error text; empty on success or while pending. */
  std::string Error() const;
  /** Reply body; valid once Done(). */
  std::vector<uint8_t> Reply() const;

 private:
  friend class RpcConn;
  void Complete(const std::string& error, std::vector<uint8_t> reply);

  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
  bool done_ = false;
  std::string error_;
  std::vector<uint8_t> reply_;
};

/**
 * @brief RPC client side of a connection.
 *
 * Go() never blocks on the reply. Once the connection breaks or Close() is
 * called, every pending call and every later Go() completes with an error.
 */
class RpcConn {
 public:
  using LogCallback = std::function<void(const std::string&)>;

  /**
   * @brief Takes ownership of conn and starts the receive thread.
   */
  RpcConn(std::unique_ptr<heartbeat::Conn> conn, LogCallback log_callback);
  ~RpcConn();

  RpcConn(const RpcConn&) = delete;
  RpcConn& operator=(const RpcConn&) = delete;

  /**
   * @brief Issues a request asynchronously.
   * @param method Method name (e.g. heartbeat::kPingMethod).
   * @param body Encoded request.
   * @return Call completed by the receive thread.
   */
  std::shared_ptr<Call> Go(const std::string& method,
                           std::vector<uint8_t> body);

  /**
   * @brief Closes the connection and fails pending calls.
   *
   * Joins the receive thread. Safe to call multiple times. Must not be
   * called from the receive thread.
   */
  void Close();

  bool IsShutdown() const;

  heartbeat::platform::Endpoint LocalEndpoint() const;
  heartbeat::platform::Endpoint RemoteEndpoint() const;

 private:
  /** Reads response frames until EOF, error or Close(). */
  void ReceiveLoop();

  /** Marks the connection shut down and fails all pending calls. */
  void Terminate(const std::string& error);

  void LogError(const std::string& msg);

  std::unique_ptr<heartbeat::Conn> conn_;
  LogCallback log_callback_;
  std::thread recv_thread_;

  mutable std::mutex mtx_;  ///< Protects pending_, seq_, shutdown_
  std::map<uint64_t, std::shared_ptr<Call>> pending_;
  uint64_t seq_ = 0;
  bool shutdown_ = false;
  std::string shutdown_error_;

  std::mutex close_mtx_;
  bool closed_ = false;
};

}  // namespace internal
}  // namespace rpcclient
