// Copyright (c) 2025 <Your Name>
#include "rpcclient/retry.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <thread>

namespace rpcclient {

std::ostream& operator<<(std::ostream& os, const RetryOptions& o) {
  os << "backoff_ms=" << o.backoff.count()
     << " max_backoff_ms=" << o.max_backoff.count()
     << " multiplier=" << o.multiplier << " max_attempts=";
  if (o.max_attempts > 0) {
    os << o.max_attempts;
  } else {
    os << "unlimited";
  }
  return os;
}

Backoff::Backoff(const RetryOptions& opts) {
  initial_ms_ = static_cast<double>(std::max<int64_t>(0, opts.backoff.count()));
  max_ms_ = static_cast<double>(std::max<int64_t>(0, opts.max_backoff.count()));
  if (max_ms_ < initial_ms_) max_ms_ = initial_ms_;
  multiplier_ = opts.multiplier < 1.0 ? 1.0 : opts.multiplier;
  current_ms_ = initial_ms_;
}

std::chrono::milliseconds Backoff::Next() {
  const double delay = std::min(current_ms_, max_ms_);
  current_ms_ = std::min(current_ms_ * multiplier_, max_ms_);
  return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

void Backoff::Reset() { current_ms_ = initial_ms_; }

RetryResult RetryWithBackoff(
    const RetryOptions& opts, const RetryFn& fn, const RetryWaitFn& wait,
    const std::function<void(const std::string&)>& log) {
  const RetryOptions options = opts;
  Backoff backoff(options);
  RetryResult result;
  int count = 0;

  for (;;) {
    std::string err;
    RetryStatus status = fn(&err);
    ++result.attempts;

    if (status == RetryStatus::kBreak) {
      result.success = true;
      result.error.clear();
      return result;
    }

    if (status == RetryStatus::kReset) {
      backoff.Reset();
      count = 0;
      continue;
    }

    ++count;
    result.error = err;
    if (!err.empty() && log) {
      log(options.tag.empty() ? err : options.tag + ": " + err);
    }
    if (options.max_attempts > 0 && count >= options.max_attempts) {
      std::ostringstream oss;
      oss << (options.tag.empty() ? "retry" : options.tag) << " failed after "
          << count << " attempts";
      if (!err.empty()) oss << ": " << err;
      result.error = oss.str();
      return result;
    }

    const std::chrono::milliseconds delay = backoff.Next();
    if (wait) {
      if (!wait(delay)) {
        result.stopped = true;
        return result;
      }
    } else {
      std::this_thread::sleep_for(delay);
    }
  }
}

}  // namespace rpcclient
