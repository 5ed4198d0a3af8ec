// Copyright (c) 2025 <Your Name>
/**
 * @test Retry with backoff
 * @brief Delay schedule and retry loop control flow. Waits are recorded
 *        instead of slept.
 */
#include "rpcclient/retry.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

namespace rpcclient {
namespace {

using std::chrono::milliseconds;

RetryOptions FastOptions() {
  RetryOptions o;
  o.backoff = milliseconds(10);
  o.max_backoff = milliseconds(80);
  o.multiplier = 2.0;
  return o;
}

}  // namespace

TEST(BackoffTest, DefaultsMatchDocumentedSchedule) {
  RetryOptions o;
  EXPECT_EQ(o.backoff, milliseconds(1000));
  EXPECT_EQ(o.max_backoff, milliseconds(30000));
  EXPECT_DOUBLE_EQ(o.multiplier, 2.0);
  EXPECT_EQ(o.max_attempts, 0);

  Backoff b(o);
  EXPECT_EQ(b.Next(), milliseconds(1000));
  EXPECT_EQ(b.Next(), milliseconds(2000));
  EXPECT_EQ(b.Next(), milliseconds(4000));
  EXPECT_EQ(b.Next(), milliseconds(8000));
  EXPECT_EQ(b.Next(), milliseconds(16000));
  EXPECT_EQ(b.Next(), milliseconds(30000));
  EXPECT_EQ(b.Next(), milliseconds(30000));
}

/**
 * @test BackoffTest.NeverDecreasesNorExceedsCap
 * @brief Delays are bounded by [backoff, max_backoff] and monotone.
 *
 * @steps
 * 1. Draw 50 delays with a non-integer multiplier.
 *
 * @expected Each delay is within bounds and not smaller than the previous.
 */
TEST(BackoffTest, NeverDecreasesNorExceedsCap) {
  RetryOptions o = FastOptions();
  o.multiplier = 1.7;
  Backoff b(o);
  milliseconds prev(0);
  for (int i = 0; i < 50; ++i) {
    milliseconds d = b.Next();
    EXPECT_GE(d, o.backoff);
    EXPECT_LE(d, o.max_backoff);
    EXPECT_GE(d, prev);
    prev = d;
  }
  EXPECT_EQ(prev, o.max_backoff);
}

TEST(BackoffTest, MultiplierBelowOneIsFlat) {
  RetryOptions o = FastOptions();
  o.multiplier = 0.5;
  Backoff b(o);
  for (int i = 0; i < 5; ++i) EXPECT_EQ(b.Next(), milliseconds(10));
}

TEST(BackoffTest, ResetRestartsSchedule) {
  Backoff b(FastOptions());
  b.Next();
  b.Next();
  EXPECT_EQ(b.Next(), milliseconds(40));
  b.Reset();
  EXPECT_EQ(b.Next(), milliseconds(10));
}

TEST(RetryTest, SucceedsAfterFailures) {
  std::vector<milliseconds> waits;
  int calls = 0;
  RetryResult r = RetryWithBackoff(
      FastOptions(),
      [&](std::string* err) {
        if (++calls < 4) {
          *err = "refused";
          return RetryStatus::kContinue;
        }
        return RetryStatus::kBreak;
      },
      [&](milliseconds d) {
        waits.push_back(d);
        return true;
      });

  EXPECT_TRUE(r.success);
  EXPECT_FALSE(r.stopped);
  EXPECT_EQ(r.attempts, 4);
  EXPECT_TRUE(r.error.empty());
  ASSERT_EQ(waits.size(), 3u);
  EXPECT_EQ(waits[0], milliseconds(10));
  EXPECT_EQ(waits[1], milliseconds(20));
  EXPECT_EQ(waits[2], milliseconds(40));
}

/**
 * @test RetryTest.ExhaustsMaxAttempts
 * @brief A bounded budget stops after exactly max_attempts failures.
 *
 * @expected Three attempts, two waits, and an error naming the tag, the
 *           attempt count and the last failure.
 */
TEST(RetryTest, ExhaustsMaxAttempts) {
  RetryOptions o = FastOptions();
  o.max_attempts = 3;
  o.tag = "connection attempt";
  int waits = 0;
  std::vector<std::string> logged;
  RetryResult r = RetryWithBackoff(
      o,
      [](std::string* err) {
        *err = "connection refused";
        return RetryStatus::kContinue;
      },
      [&](milliseconds) {
        ++waits;
        return true;
      },
      [&](const std::string& msg) { logged.push_back(msg); });

  EXPECT_FALSE(r.success);
  EXPECT_FALSE(r.stopped);
  EXPECT_EQ(r.attempts, 3);
  EXPECT_EQ(waits, 2);
  EXPECT_EQ(r.error,
            "connection attempt failed after 3 attempts: connection refused");
  ASSERT_EQ(logged.size(), 3u);
  EXPECT_EQ(logged[0], "connection attempt: connection refused");
}

TEST(RetryTest, ResetRestartsCountAndDelay) {
  RetryOptions o = FastOptions();
  o.max_attempts = 2;
  std::vector<milliseconds> waits;
  int calls = 0;
  RetryResult r = RetryWithBackoff(
      o,
      [&](std::string* err) {
        ++calls;
        if (calls == 2) return RetryStatus::kReset;
        if (calls == 4) return RetryStatus::kBreak;
        *err = "fail";
        return RetryStatus::kContinue;
      },
      [&](milliseconds d) {
        waits.push_back(d);
        return true;
      });

  // Without the reset the budget of two would end at the third call.
  EXPECT_TRUE(r.success);
  EXPECT_EQ(r.attempts, 4);
  ASSERT_EQ(waits.size(), 2u);
  EXPECT_EQ(waits[0], milliseconds(10));
  EXPECT_EQ(waits[1], milliseconds(10));
}

TEST(RetryTest, WaitRefusalStops) {
  int calls = 0;
  RetryResult r = RetryWithBackoff(
      FastOptions(),
      [&](std::string* err) {
        ++calls;
        *err = "down";
        return RetryStatus::kContinue;
      },
      [](milliseconds) { return false; });

  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.stopped);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(r.error, "down");
}

TEST(RetryTest, OptionsAreCopiedAtStart) {
  RetryOptions o = FastOptions();
  o.max_attempts = 2;
  int calls = 0;
  RetryResult r = RetryWithBackoff(
      o,
      [&](std::string* err) {
        ++calls;
        o.max_attempts = 100;
        *err = "x";
        return RetryStatus::kContinue;
      },
      [](milliseconds) { return true; });
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(r.attempts, 2);
}

TEST(RetryTest, OptionsStreamUnlimited) {
  std::ostringstream oss;
  oss << RetryOptions();
  EXPECT_EQ(oss.str(),
            "backoff_ms=1000 max_backoff_ms=30000 multiplier=2 "
            "max_attempts=unlimited");
}

}  // namespace rpcclient
