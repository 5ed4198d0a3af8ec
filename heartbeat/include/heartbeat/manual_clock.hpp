// Copyright (c) 2025 <Your Name>
/**
 * @file manual_clock.hpp
 * @brief TimeSource whose value only changes when told to.
 */
#pragma once

#include <atomic>
#include <cstdint>

#include "heartbeat/time_source.hpp"

namespace heartbeat {

/**
 * @brief Deterministic TimeSource for tests and simulations.
 *
 * Now() returns the last value stored with Set()/Increment(). Rate is not
 * emulated. Thread-safe.
 */
class ManualClock : public TimeSource {
 public:
  explicit ManualClock(int64_t unix_nanos = 0) : nanos_(unix_nanos) {}

  TimeSpec Now() override { return TimeSpec::FromNanos(nanos_.load()); }
  void SetAbsolute(const TimeSpec& time) override {
    nanos_.store(time.ToNanos());
  }
  void SetRate(double /*rate*/) override {}
  void ResetToRealTime() override {}

  /** Set the clock to unix_nanos. */
  void Set(int64_t unix_nanos) { nanos_.store(unix_nanos); }

  /** Advance the clock by delta_nanos. */
  void Increment(int64_t delta_nanos) { nanos_.fetch_add(delta_nanos); }

 private:
  std::atomic<int64_t> nanos_;
};

}  // namespace heartbeat
