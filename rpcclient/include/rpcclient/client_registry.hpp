// Copyright (c) 2025 <Your Name>
/**
 * @file client_registry.hpp
 * @brief Deduplicated set of peer connections.
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "heartbeat/time_source.hpp"
#include "rpcclient/client.hpp"
#include "rpcclient/options.hpp"
#include "rpcclient/retry.hpp"

namespace rpcclient {

class Dialer;
class OffsetMonitor;

/**
 * @brief Owns at most one live Client per peer address.
 *
 * Construct one per process (or per test) and pass it to every component
 * that talks to peers. The registry owns each Client until the Client's
 * background thread has exited; the destructor closes every Client and
 * joins all threads.
 */
class ClientRegistry {
 public:
  /**
   * @param clock Local clock for offset measurement (default clock if null).
   * @param monitor Receives offsets (may be null); must outlive the registry.
   * @param options Immutable configuration snapshot.
   */
  ClientRegistry(heartbeat::TimeSource* clock, OffsetMonitor* monitor,
                 const Options& options = Options());
  ~ClientRegistry();

  ClientRegistry(const ClientRegistry&) = delete;
  ClientRegistry& operator=(const ClientRegistry&) = delete;

  /**
   * @brief Returns the Client for addr, creating and starting it if absent.
   *
   * Concurrent callers for the same address get the same instance. The
   * returned Client may still be dialing; observe Client::Ready().
   *
   * @param addr Peer address ("host:port").
   * @param retry Dial retry policy; Options::Retry() when null.
   */
  std::shared_ptr<Client> GetOrCreate(const std::string& addr,
                                      const RetryOptions* retry = nullptr);

  /** Returns the live Client for addr, or nullptr. Never creates one. */
  std::shared_ptr<Client> Lookup(const std::string& addr) const;

  /** Number of live Clients. */
  size_t Size() const;

  /** Closes every live Client. */
  void CloseAll();

  const Options& GetOptions() const { return options_; }

 private:
  friend class Client;

  /**
   * @brief Marks c closed and removes it from the map.
   *
   * The map entry is erased only if c still occupies its address slot.
   * @return false if c was already closed.
   */
  bool Remove(Client* c);

  /** Releases retired Clients whose thread has exited. Caller holds mtx_. */
  void ReapRetiredLocked(std::vector<std::shared_ptr<Client>>* reaped);

  void Log(const std::string& msg) const;

  heartbeat::TimeSource* clock_;
  OffsetMonitor* monitor_;
  const Options options_;
  std::shared_ptr<Dialer> dialer_;

  mutable std::mutex mtx_;
  std::map<std::string, std::shared_ptr<Client>> clients_;
  std::vector<std::shared_ptr<Client>> retired_;
};

}  // namespace rpcclient
