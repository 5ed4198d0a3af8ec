// Copyright (c) 2025 <Your Name>
/**
 * @file monotonic_clock.hpp
 * @brief POSIX monotonic clock-based TimeSource implementation.
 *
 * Uses clock_gettime(CLOCK_MONOTONIC) for elapsed time measurement and
 * clock_gettime(CLOCK_REALTIME) for the absolute anchor. A node can be
 * made to run skewed with SetAbsolute() or SetRate().
 */
#pragma once

#include <memory>

#include "heartbeat/export.hpp"
#include "heartbeat/time_source.hpp"

namespace heartbeat {

/**
 * @brief TimeSource backed by POSIX clock_gettime().
 *
 * Thread-safe: All methods use internal locking.
 */
class HEARTBEAT_API MonotonicClock : public TimeSource {
 public:
  MonotonicClock();
  ~MonotonicClock() override;

  // Non-copyable, non-movable
  MonotonicClock(const MonotonicClock&) = delete;
  MonotonicClock& operator=(const MonotonicClock&) = delete;
  MonotonicClock(MonotonicClock&&) = delete;
  MonotonicClock& operator=(MonotonicClock&&) = delete;

  // TimeSource interface implementation
  TimeSpec Now() override;
  void SetAbsolute(const TimeSpec& time) override;
  void SetRate(double rate) override;
  void ResetToRealTime() override;
  double GetRate() const override;

  /**
   * @brief Shift the clock by a signed offset relative to its current value.
   * @param offset_nanos Nanoseconds to add (negative moves backwards).
   */
  void Skew(int64_t offset_nanos);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace heartbeat
