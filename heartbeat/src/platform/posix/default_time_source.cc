// Copyright (c) 2025 <Your Name>
/**
 * @file default_time_source.cc (POSIX)
 * @brief POSIX implementation - creates MonotonicClock instance.
 */
#include "heartbeat/platform/default_time_source.hpp"

#include <memory>

#include "heartbeat/monotonic_clock.hpp"

namespace heartbeat {
namespace platform {

std::unique_ptr<TimeSource> CreateDefaultTimeSource() {
  return std::make_unique<MonotonicClock>();
}

TimeSource& GetDefaultTimeSource() {
  static MonotonicClock clock;
  return clock;
}

}  // namespace platform
}  // namespace heartbeat
