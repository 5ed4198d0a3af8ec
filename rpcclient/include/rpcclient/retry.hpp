// Copyright (c) 2025 <Your Name>
/**
 * @file retry.hpp
 * @brief Exponential backoff retry loop used for connection establishment.
 */
#pragma once

#include <chrono>
#include <functional>
#include <ostream>
#include <string>

namespace rpcclient {

/**
 * @brief Outcome of one attempt inside RetryWithBackoff().
 */
enum class RetryStatus {
  kBreak,     ///< Done; stop retrying with success.
  kReset,     ///< Restart the backoff schedule and attempt count.
  kContinue,  ///< Failed; wait the next delay and try again.
};

/**
 * @brief Backoff schedule and attempt budget.
 *
 * A sequence copies its options when it starts, so later changes do not
 * affect it.
 */
struct RetryOptions {
  std::chrono::milliseconds backoff{kDefaultBackoff};          ///< First delay
  std::chrono::milliseconds max_backoff{kDefaultMaxBackoff};  ///< Delay cap
  double multiplier = kDefaultMultiplier;  ///< Growth per failed attempt
  int max_attempts = 0;                    ///< 0 = unlimited
  std::string tag;                         ///< Prefix for log messages

  static constexpr std::chrono::milliseconds kDefaultBackoff{1000};
  static constexpr std::chrono::milliseconds kDefaultMaxBackoff{30000};
  static constexpr double kDefaultMultiplier = 2.0;

  friend std::ostream& operator<<(std::ostream& os, const RetryOptions& o);
};

/**
 * @brief Successive retry delays.
 *
 * Delays start at backoff, grow by multiplier and are clamped to
 * max_backoff. They never decrease and never exceed the cap. A multiplier
 * below 1 is treated as 1.
 */
class Backoff {
 public:
  explicit Backoff(const RetryOptions& opts);

  /** Returns the delay to wait now and advances the schedule. */
  std::chrono::milliseconds Next();

  /** Restarts the schedule at the initial delay. */
  void Reset();

 private:
  double initial_ms_;
  double max_ms_;
  double multiplier_;
  double current_ms_;
};

/**
 * @brief Result of RetryWithBackoff().
 */
struct RetryResult {
  bool success = false;  ///< An attempt returned kBreak
  bool stopped = false;  ///< The wait function asked to stop
  int attempts = 0;      ///< Number of attempts made
  std::string error;     ///< Last attempt error, or budget exhaustion
};

using RetryFn = std::function<RetryStatus(std::string* err)>;

/** Waits for a delay; returns false to abandon the sequence. */
using RetryWaitFn = std::function<bool(std::chrono::milliseconds)>;

/**
 * @brief Runs fn until it breaks, the budget is spent, or wait() refuses.
 *
 * After each kContinue the loop checks max_attempts and then waits the next
 * backoff delay. kReset restarts the schedule and the attempt count and
 * retries at once.
 *
 * @param opts Backoff schedule (copied).
 * @param fn Attempt; may fill err with a description of its failure.
 * @param wait Delay function; sleeps when empty.
 * @param log Optional sink for per-attempt failures, prefixed with the tag.
 */
RetryResult RetryWithBackoff(
    const RetryOptions& opts, const RetryFn& fn,
    const RetryWaitFn& wait = RetryWaitFn(),
    const std::function<void(const std::string&)>& log = nullptr);

}  // namespace rpcclient
