// Copyright (c) 2025 <Your Name>
/**
 * @file offset_monitor.hpp
 * @brief Sink for per-peer clock offset measurements.
 */
#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "heartbeat/remote_offset.hpp"

namespace rpcclient {

/**
 * @brief Receives the offset of each peer after every heartbeat round.
 *
 * Called from client background threads; implementations must be
 * thread-safe and must not block.
 */
class OffsetMonitor {
 public:
  virtual ~OffsetMonitor() = default;

  /**
   * @brief Records the latest estimate for a peer.
   * @param addr Peer address key (as passed to ClientRegistry::GetOrCreate).
   * @param offset Estimate, or the infinite sentinel on timeout.
   */
  virtual void UpdateOffset(const std::string& addr,
                            const heartbeat::RemoteOffset& offset) = 0;
};

/**
 * @brief OffsetMonitor keeping the latest estimate per address.
 *
 * Does not combine estimates across peers.
 */
class RemoteClockMonitor : public OffsetMonitor {
 public:
  void UpdateOffset(const std::string& addr,
                    const heartbeat::RemoteOffset& offset) override;

  /**
   * @brief Latest estimate for addr.
   * @return false if nothing was recorded for addr.
   */
  bool GetOffset(const std::string& addr, heartbeat::RemoteOffset* out) const;

  /** Snapshot of all recorded estimates. */
  std::map<std::string, heartbeat::RemoteOffset> GetOffsets() const;

  /** Total number of UpdateOffset() calls. */
  uint64_t UpdateCount() const;

 private:
  mutable std::mutex mtx_;
  std::map<std::string, heartbeat::RemoteOffset> offsets_;
  uint64_t updates_ = 0;
};

}  // namespace rpcclient
