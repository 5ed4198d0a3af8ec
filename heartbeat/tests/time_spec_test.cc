// Copyright (c) 2025 <Your Name>
/**
 * @test TimeSpec basic operations
 * @brief Test TimeSpec construction, normalization, arithmetic and the
 *        nanosecond conversions used on the wire.
 */
#include "heartbeat/time_spec.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "heartbeat/manual_clock.hpp"
#include "heartbeat/monotonic_clock.hpp"

using heartbeat::TimeSpec;

TEST(TimeSpecTest, DefaultConstruction) {
  TimeSpec t;
  EXPECT_EQ(t.sec, 0);
  EXPECT_EQ(t.nsec, 0u);
}

TEST(TimeSpecTest, Normalization) {
  TimeSpec t(1, 1500000000u);  // 1.5 billion nsec = 1.5 sec overflow
  t.Normalize();
  EXPECT_EQ(t.sec, 2);
  EXPECT_EQ(t.nsec, 500000000u);
}

TEST(TimeSpecTest, AdditionAndSubtractionWithBorrow) {
  TimeSpec a(10, 300000000u);  // 10.3 sec
  TimeSpec b(5, 900000000u);   // 5.9 sec
  TimeSpec sum = a + b;
  EXPECT_EQ(sum.sec, 16);
  EXPECT_EQ(sum.nsec, 200000000u);

  TimeSpec diff = a - b;
  EXPECT_EQ(diff.sec, 4);
  EXPECT_EQ(diff.nsec, 400000000u);
}

TEST(TimeSpecTest, Comparison) {
  TimeSpec a(10, 500000000u);
  TimeSpec b(10, 500000000u);
  TimeSpec c(10, 600000000u);
  TimeSpec d(11, 0u);

  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_LT(a, c);
  EXPECT_LT(c, d);
  EXPECT_GT(d, a);
}

TEST(TimeSpecTest, NanosConversion) {
  TimeSpec a(1735689600, 123456789u);
  EXPECT_EQ(a.ToNanos(), 1735689600123456789LL);
  EXPECT_EQ(TimeSpec::FromNanos(1735689600123456789LL), a);
}

TEST(TimeSpecTest, NegativeNanosFloorSeconds) {
  // -1.5 s is sec=-2, nsec=0.5e9 so that nsec stays non-negative.
  TimeSpec t = TimeSpec::FromNanos(-1500000000LL);
  EXPECT_EQ(t.sec, -2);
  EXPECT_EQ(t.nsec, 500000000u);
  EXPECT_EQ(t.ToNanos(), -1500000000LL);
}

TEST(TimeSpecTest, ToNanosSaturates) {
  TimeSpec far(std::numeric_limits<int64_t>::max() / 1000, 0);
  EXPECT_EQ(far.ToNanos(), std::numeric_limits<int64_t>::max());
}

TEST(TimeSpecTest, AbsDiff) {
  TimeSpec a(10, 500000000u);
  TimeSpec b(5, 300000000u);

  TimeSpec diff1 = heartbeat::AbsDiff(a, b);
  TimeSpec diff2 = heartbeat::AbsDiff(b, a);

  EXPECT_EQ(diff1.sec, 5);
  EXPECT_EQ(diff1.nsec, 200000000u);
  EXPECT_EQ(diff1, diff2);
}

TEST(ManualClockTest, SetAndIncrement) {
  heartbeat::ManualClock clock(1000);
  EXPECT_EQ(clock.NowNanos(), 1000);
  clock.Increment(250);
  EXPECT_EQ(clock.NowNanos(), 1250);
  clock.Set(-5);
  EXPECT_EQ(clock.NowNanos(), -5);
}

/**
 * @test MonotonicClockTest.SkewShiftsClock
 * @brief Skew() moves the clock by the requested amount.
 *
 * @steps
 * 1. Read a reference MonotonicClock and a skewed one back to back.
 *
 * @expected The skewed clock leads by about 5 s (within 100 ms).
 */
TEST(MonotonicClockTest, SkewShiftsClock) {
  heartbeat::MonotonicClock reference;
  heartbeat::MonotonicClock skewed;
  skewed.Skew(5000000000LL);
  int64_t delta = skewed.NowNanos() - reference.NowNanos();
  EXPECT_NEAR(static_cast<double>(delta), 5e9, 1e8);
}
