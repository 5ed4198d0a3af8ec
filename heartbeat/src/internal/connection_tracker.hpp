// Copyright (c) 2025 <Your Name>
/**
 * @file connection_tracker.hpp
 * @brief Bookkeeping for server-side connections and their threads.
 *
 * Every accepted connection is served by a dedicated thread. The tracker
 * keeps the connection and its thread together so that Stop() can close
 * all streams and join every thread, and so that finished threads are
 * joined without waiting for shutdown.
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "heartbeat/conn.hpp"

namespace heartbeat {
namespace internal {

/**
 * @brief Tracks live connections served by HeartbeatServer.
 *
 * Thread-safe: All public methods are protected by an internal mutex.
 */
class ConnectionTracker {
 public:
  /**
   * @brief Served connection record.
   */
  struct Entry {
    std::mutex mtx;
    std::shared_ptr<Conn> conn;  ///< Null until Attach() for TLS
    bool closing = false;        ///< Set by CloseAll()
    std::thread worker;
    std::atomic<bool> done{false};  ///< Set by the worker before it returns
  };

  ~ConnectionTracker() { CloseAll(); }

  /**
   * @brief Registers a connection and starts its worker.
   *
   * conn may be null when the worker establishes it first (TLS handshake)
   * and hands it over with Attach(). The worker receives the entry and
   * must set entry->done as its last action.
   */
  template <typename Fn>
  void Add(std::shared_ptr<Conn> conn, Fn&& serve) {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.emplace_back(new Entry);
    Entry* e = entries_.back().get();
    e->conn = std::move(conn);
    e->worker = std::thread(std::forward<Fn>(serve), e);
  }

  /**
   * @brief Publishes a connection established by the worker.
   * @return false if CloseAll() already ran; conn is closed then.
   */
  static bool Attach(Entry* e, std::shared_ptr<Conn> conn) {
    std::lock_guard<std::mutex> lock(e->mtx);
    if (e->closing) {
      conn->Close();
      return false;
    }
    e->conn = std::move(conn);
    return true;
  }

  /** Joins and forgets workers that have finished. */
  void PruneFinished() {
    std::vector<std::unique_ptr<Entry>> finished;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = std::stable_partition(
          entries_.begin(), entries_.end(),
          [](const std::unique_ptr<Entry>& e) { return !e->done.load(); });
      for (auto f = it; f != entries_.end(); ++f) {
        finished.push_back(std::move(*f));
      }
      entries_.erase(it, entries_.end());
    }
    for (auto& e : finished) {
      if (e->worker.joinable()) e->worker.join();
    }
  }

  /**
   * @brief Closes every connection and joins every worker.
   *
   * A worker still in its handshake is joined once the handshake ends,
   * which is bounded by the handshake timeout.
   */
  void CloseAll() {
    std::vector<std::unique_ptr<Entry>> all;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      all.swap(entries_);
    }
    for (auto& e : all) {
      std::lock_guard<std::mutex> lock(e->mtx);
      e->closing = true;
      if (e->conn) e->conn->Close();
    }
    for (auto& e : all) {
      if (e->worker.joinable()) e->worker.join();
    }
  }

  /** Number of connections whose worker is still running. */
  size_t ActiveCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<size_t>(
        std::count_if(entries_.begin(), entries_.end(),
                      [](const std::unique_ptr<Entry>& e) {
                        return !e->done.load();
                      }));
  }

 private:
  mutable std::mutex mtx_;
  std::vector<std::unique_ptr<Entry>> entries_;
};

}  // namespace internal
}  // namespace heartbeat
