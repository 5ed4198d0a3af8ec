// Copyright (c) 2025 <Your Name>
#include "rpcclient/offset_monitor.hpp"

namespace rpcclient {

void RemoteClockMonitor::UpdateOffset(const std::string& addr,
                                      const heartbeat::RemoteOffset& offset) {
  std::lock_guard<std::mutex> lk(mtx_);
  offsets_[addr] = offset;
  ++updates_;
}

bool RemoteClockMonitor::GetOffset(const std::string& addr,
                                   heartbeat::RemoteOffset* out) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = offsets_.find(addr);
  if (it == offsets_.end()) return false;
  if (out) *out = it->second;
  return true;
}

std::map<std::string, heartbeat::RemoteOffset> RemoteClockMonitor::GetOffsets()
    const {
  std::lock_guard<std::mutex> lk(mtx_);
  return offsets_;
}

uint64_t RemoteClockMonitor::UpdateCount() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return updates_;
}

}  // namespace rpcclient
