// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Heartbeating connection to one peer.
 *
 * A Client dials its peer with exponential backoff, verifies the transport
 * with one heartbeat, announces readiness, then heartbeats on a fixed
 * interval. Each heartbeat also measures the peer's clock offset and
 * publishes it to the registry's OffsetMonitor. Any heartbeat error closes
 * the Client; a later ClientRegistry::GetOrCreate() for the same address
 * starts a new one.
 *
 * Clients are created only by ClientRegistry.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

#include "heartbeat/remote_offset.hpp"
#include "heartbeat/time_source.hpp"
#include "rpcclient/options.hpp"
#include "rpcclient/retry.hpp"

namespace rpcclient {

class ClientRegistry;
class Dialer;
class OffsetMonitor;

namespace internal {
class RpcConn;
}  // namespace internal

/**
 * @brief Connection and clock-offset state for one peer address.
 *
 * All accessors are thread-safe. Mutable state is written by the Client's
 * own background thread, except for the closed state which Close() sets.
 */
class Client {
 public:
  /**
   * @brief Connection lifecycle.
   *
   * kDialing -> kVerifying -> kReady, falling back to kDialing when the
   * verification heartbeat fails. kClosed is terminal and reachable from
   * every state. A transport exists only in kVerifying and kReady.
   */
  enum class State { kDialing, kVerifying, kReady, kClosed };

  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /** Peer address this Client was created for. */
  const std::string& Addr() const { return addr_; }

  /** Local address of the current transport ("" before the first dial). */
  std::string LocalAddr() const;

  /** True while a transport is installed and the Client is open. */
  bool IsConnected() const;

  /** True while the latest heartbeat completed within the timeout. */
  bool IsHealthy() const;

  bool IsClosed() const;

  State GetState() const;

  /** Latest offset estimate (zero before the first heartbeat). */
  heartbeat::RemoteOffset RemoteOffset() const;

  /**
   * @brief Resolved once, after the first successful heartbeat.
   *
   * Never resolved if the Client closes first.
   */
  std::shared_future<void> Ready() const { return ready_future_; }

  /** Resolved once, when the Client closes. */
  std::shared_future<void> Closed() const { return closed_future_; }

  /** Waits for Ready(); returns false on timeout. */
  bool WaitReady(std::chrono::milliseconds timeout) const;

  /** Waits for Closed(); returns false on timeout. */
  bool WaitClosed(std::chrono::milliseconds timeout) const;

  /**
   * @brief Closes the Client and removes it from its registry.
   *
   * Marks it unhealthy and closed, resolves Closed(), wakes the background
   * thread and releases the transport. Calls in flight complete with an
   * error that is discarded. Idempotent and safe from any thread.
   */
  void Close();

  friend std::ostream& operator<<(std::ostream& os, State s);

 private:
  friend class ClientRegistry;

  Client(std::string addr, const RetryOptions& retry, ClientRegistry* registry,
         heartbeat::TimeSource* clock, OffsetMonitor* monitor,
         std::shared_ptr<Dialer> dialer, const Options& options);

  /** Starts the background thread. Called by the registry once. */
  void Start();

  /** Background thread body: dial-retry, then the heartbeat loop. */
  void Run();

  /** One dial attempt followed by the verification heartbeat. */
  RetryStatus Connect(std::string* err);

  /** Heartbeats every interval until an error or Close(). */
  void HeartbeatLoop();

  /**
   * @brief One heartbeat round.
   *
   * A call that completes within the timeout is measured and published
   * even when it failed.
   * @return false if the call failed; err holds the reason.
   */
  bool Heartbeat(std::string* err);

  /** Sleeps for d unless closed first; returns false if closed. */
  bool WaitUnlessClosed(std::chrono::milliseconds d);

  /** Drops rpc if it is still the installed transport and closes it. */
  void DropTransport(const std::shared_ptr<internal::RpcConn>& rpc);

  /** Marks closed and resolves Closed(). Caller holds mtx_. */
  bool MarkClosedLocked();

  /** Releases the transport after MarkClosedLocked(). */
  void ReleaseTransport();

  bool TaskDone() const;
  void JoinTask();

  void Log(const std::string& msg) const;

  const std::string addr_;
  const RetryOptions retry_;
  ClientRegistry* const registry_;
  heartbeat::TimeSource* const clock_;
  OffsetMonitor* const monitor_;
  const std::shared_ptr<Dialer> dialer_;
  const std::chrono::milliseconds interval_;
  const Options::LogCallback log_callback_;

  mutable std::mutex mtx_;
  std::condition_variable wake_cv_;
  State state_ = State::kDialing;
  std::shared_ptr<internal::RpcConn> rpc_;
  std::string local_addr_;
  bool healthy_ = false;
  bool closed_ = false;
  bool ready_fired_ = false;
  heartbeat::RemoteOffset offset_;

  std::promise<void> ready_promise_;
  std::promise<void> closed_promise_;
  std::shared_future<void> ready_future_;
  std::shared_future<void> closed_future_;

  std::thread task_;
  bool task_done_ = false;  ///< Guarded by mtx_
};

}  // namespace rpcclient
