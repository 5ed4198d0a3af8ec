// Copyright (c) 2025 <Your Name>
/**
 * @file monotonic_clock.cc
 * @brief POSIX-specific implementation using clock_gettime().
 */
#include "heartbeat/monotonic_clock.hpp"

#include <time.h>

#include <chrono>
#include <mutex>

namespace heartbeat {

struct MonotonicClock::Impl {
  mutable std::mutex mtx_;
  int64_t mono_t0_nsec_{0};  // Monotonic anchor (nanoseconds)
  TimeSpec start_time_{};    // Absolute time at anchor
  double rate_{1.0};         // Time rate multiplier

  // Current CLOCK_REALTIME as TimeSpec
  static TimeSpec CurrentUnix() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    auto sec = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nsec =
        std::chrono::duration_cast<std::chrono::nanoseconds>(duration - sec);
    return TimeSpec(sec.count(), static_cast<uint32_t>(nsec.count()));
  }

  // Current CLOCK_MONOTONIC in nanoseconds
  static int64_t MonotonicNow() {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1'000'000'000LL +
           static_cast<int64_t>(ts.tv_nsec);
  }

  // start_time_ + rate_ * (mono_now - anchor); caller holds mtx_.
  TimeSpec NowLocked(int64_t mono_now) const {
    int64_t elapsed_nsec = mono_now - mono_t0_nsec_;
    if (rate_ == 1.0) {
      return start_time_ + TimeSpec::FromNanos(elapsed_nsec);
    }
    TimeSpec elapsed_time =
        TimeSpec::FromDouble(static_cast<double>(elapsed_nsec) / 1e9);
    return start_time_ + (elapsed_time * rate_);
  }

  // Re-anchor at mono_now to time; caller holds mtx_.
  void AnchorLocked(int64_t mono_now, const TimeSpec& time) {
    mono_t0_nsec_ = mono_now;
    start_time_ = time;
  }
};

MonotonicClock::MonotonicClock() : impl_(std::make_unique<Impl>()) {
  ResetToRealTime();
}

MonotonicClock::~MonotonicClock() = default;

TimeSpec MonotonicClock::Now() {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  return impl_->NowLocked(Impl::MonotonicNow());
}

void MonotonicClock::SetRate(double new_rate) {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  int64_t mono_now = Impl::MonotonicNow();
  impl_->AnchorLocked(mono_now, impl_->NowLocked(mono_now));
  impl_->rate_ = new_rate;
}

void MonotonicClock::SetAbsolute(const TimeSpec& time) {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  impl_->AnchorLocked(Impl::MonotonicNow(), time);
}

void MonotonicClock::Skew(int64_t offset_nanos) {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  int64_t mono_now = Impl::MonotonicNow();
  TimeSpec now = impl_->NowLocked(mono_now);
  impl_->AnchorLocked(mono_now,
                      TimeSpec::FromNanos(now.ToNanos() + offset_nanos));
}

void MonotonicClock::ResetToRealTime() {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  impl_->AnchorLocked(Impl::MonotonicNow(), Impl::CurrentUnix());
  impl_->rate_ = 1.0;
}

double MonotonicClock::GetRate() const {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  return impl_->rate_;
}

}  // namespace heartbeat
