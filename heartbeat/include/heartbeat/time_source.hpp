// Copyright (c) 2025 <Your Name>
/**
 * @file time_source.hpp
 * @brief Minimal time source interface (UNIX wall-time provider).
 */
#pragma once

#include "heartbeat/time_spec.hpp"

namespace heartbeat {

/**
 * Interface for time sources.
 * Provides current time as UNIX epoch time with nanosecond precision.
 *
 * Heartbeat clients read it immediately before issuing a Ping and right
 * after its completion; the peer reads it to fill ServerTime. Elapsed time
 * between two readings must not be affected by OS clock steps.
 */
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  /** Returns the current time since the UNIX epoch. */
  virtual TimeSpec Now() = 0;

  /** Sets absolute time (used to simulate a skewed node). */
  virtual void SetAbsolute(const TimeSpec& time) = 0;

  /** Sets progression rate multiplier (1.0 = real time). */
  virtual void SetRate(double /*rate*/) = 0;

  /**
   * @brief Resets time source to real-time (system clock) with rate 1.0.
   */
  virtual void ResetToRealTime() = 0;

  /**
   * @brief Returns current progression rate multiplier.
   *
   * Default implementations may return 1.0 if unknown.
   */
  virtual double GetRate() const { return 1.0; }

  /** Convenience: Now() in nanoseconds since the UNIX epoch. */
  int64_t NowNanos() { return Now().ToNanos(); }
};

}  // namespace heartbeat
