/**
 * @file UsageRate_uTest.cpp
 * @brief Unit tests for tickrate::cpu usage-rate computation.
 *
 * Notes:
 *  - All tick tuples are synthetic; results are exact.
 *  - Covers warm-up, unchanged, regression, normal and clamped intervals.
 */

#include "src/cpu/inc/UsageRate.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using tickrate::cpu::AGGREGATE_KEY;
using tickrate::cpu::computeBreakdown;
using tickrate::cpu::computeUsagePercent;
using tickrate::cpu::coreKey;
using tickrate::cpu::CpuTicks;
using tickrate::cpu::CpuUsageBreakdown;
using tickrate::cpu::RateStatus;
using tickrate::cpu::toString;
using tickrate::cpu::UsageRateCalculator;
using tickrate::cpu::UsageSample;

namespace {

/// Tuple with the given busy (user) and idle ticks.
CpuTicks makeTicks(std::uint64_t user, std::uint64_t idle) {
  CpuTicks t{};
  t.user = user;
  t.idle = idle;
  return t;
}

} // namespace

class UsageRateCalculatorTest : public ::testing::Test {
protected:
  UsageRateCalculator calc_{};
};

/* ----------------------------- Warm-up ----------------------------- */

/** @test First sample returns 0 and establishes the baseline. */
TEST_F(UsageRateCalculatorTest, FirstSampleWarmUp) {
  const CpuTicks T1 = makeTicks(100, 900);

  const UsageSample S = calc_.sampleDetailed(AGGREGATE_KEY, T1);
  EXPECT_EQ(S.percent, 0.0);
  EXPECT_EQ(S.status, RateStatus::WARM_UP);
  EXPECT_FALSE(S.valid());

  ASSERT_TRUE(calc_.store().get(AGGREGATE_KEY).has_value());
  EXPECT_EQ(*calc_.store().get(AGGREGATE_KEY), T1);
}

/* ----------------------------- Normal Intervals ----------------------------- */

/** @test 30 idle of 100 elapsed ticks yields 70%. */
TEST_F(UsageRateCalculatorTest, ProportionalPercent) {
  const CpuTicks T1 = makeTicks(1000, 5000);
  const CpuTicks T2 = makeTicks(1070, 5030);

  EXPECT_EQ(calc_.sample(AGGREGATE_KEY, T1), 0.0);

  const UsageSample S = calc_.sampleDetailed(AGGREGATE_KEY, T2);
  EXPECT_EQ(S.status, RateStatus::OK);
  EXPECT_DOUBLE_EQ(S.percent, 70.0);
  EXPECT_TRUE(S.valid());
}

/** @test iowait counts as idle. */
TEST_F(UsageRateCalculatorTest, IowaitCountsAsIdle) {
  CpuTicks t1{};
  t1.user = 100;
  t1.idle = 100;
  t1.iowait = 100;
  CpuTicks t2 = t1;
  t2.user += 50;
  t2.idle += 25;
  t2.iowait += 25;

  (void)calc_.sample(AGGREGATE_KEY, t1);
  EXPECT_DOUBLE_EQ(calc_.sample(AGGREGATE_KEY, t2), 50.0);
}

/** @test Fully busy and fully idle intervals hit the bounds exactly. */
TEST_F(UsageRateCalculatorTest, BoundsExact) {
  (void)calc_.sample("busy", makeTicks(0, 0));
  EXPECT_DOUBLE_EQ(calc_.sample("busy", makeTicks(100, 0)), 100.0);

  (void)calc_.sample("idle", makeTicks(0, 0));
  EXPECT_DOUBLE_EQ(calc_.sample("idle", makeTicks(0, 100)), 0.0);
}

/** @test Each call measures from the previous call, not the first. */
TEST_F(UsageRateCalculatorTest, BaselineAdvances) {
  (void)calc_.sample(AGGREGATE_KEY, makeTicks(0, 0));
  EXPECT_DOUBLE_EQ(calc_.sample(AGGREGATE_KEY, makeTicks(50, 50)), 50.0);
  EXPECT_DOUBLE_EQ(calc_.sample(AGGREGATE_KEY, makeTicks(60, 140)), 10.0);
}

/* ----------------------------- Degenerate Intervals ----------------------------- */

/** @test Identical tuples return 0 and keep the baseline. */
TEST_F(UsageRateCalculatorTest, IdenticalTuplesZero) {
  const CpuTicks T1 = makeTicks(400, 600);
  (void)calc_.sample(AGGREGATE_KEY, T1);

  const UsageSample S = calc_.sampleDetailed(AGGREGATE_KEY, T1);
  EXPECT_EQ(S.percent, 0.0);
  EXPECT_EQ(S.status, RateStatus::NO_ELAPSED);
  EXPECT_EQ(*calc_.store().get(AGGREGATE_KEY), T1);
}

/** @test Counters going backward return 0 and re-baseline on the new tuple. */
TEST_F(UsageRateCalculatorTest, RegressionRebaselines) {
  const CpuTicks T1 = makeTicks(5000, 5000);
  const CpuTicks T0 = makeTicks(10, 10); // host rebooted
  const CpuTicks T2 = makeTicks(40, 80);

  (void)calc_.sample(AGGREGATE_KEY, T1);

  const UsageSample S = calc_.sampleDetailed(AGGREGATE_KEY, T0);
  EXPECT_EQ(S.percent, 0.0);
  EXPECT_EQ(S.status, RateStatus::COUNTER_REGRESSION);
  EXPECT_EQ(*calc_.store().get(AGGREGATE_KEY), T0);

  // Measured against T0: 30 busy + 70 idle
  EXPECT_DOUBLE_EQ(calc_.sample(AGGREGATE_KEY, T2), 30.0);
}

/** @test Idle going backward while total grows is also a regression. */
TEST_F(UsageRateCalculatorTest, IdleRegressionDetected) {
  (void)calc_.sample(AGGREGATE_KEY, makeTicks(100, 500));

  const UsageSample S = calc_.sampleDetailed(AGGREGATE_KEY, makeTicks(700, 400));
  EXPECT_EQ(S.status, RateStatus::COUNTER_REGRESSION);
  EXPECT_EQ(S.percent, 0.0);
}

/** @test Idle delta exceeding total delta clamps to 0 instead of going negative. */
TEST_F(UsageRateCalculatorTest, IdleExceedingTotalClampedToZero) {
  // user revised down by 5 while idle advanced by 10: dTotal=5, dIdle=10
  (void)calc_.sample(AGGREGATE_KEY, makeTicks(100, 100));

  const UsageSample S = calc_.sampleDetailed(AGGREGATE_KEY, makeTicks(95, 110));
  EXPECT_EQ(S.status, RateStatus::OK);
  EXPECT_EQ(S.percent, 0.0);
}

/** @test Results stay within [0, 100] across adversarial sequences. */
TEST_F(UsageRateCalculatorTest, AlwaysWithinBounds) {
  const std::vector<CpuTicks> SEQUENCE = {
      makeTicks(0, 0),       makeTicks(10, 0),         makeTicks(5, 20),
      makeTicks(5, 20),      makeTicks(1, 1),          makeTicks(1'000'000, 3),
      makeTicks(999'990, 40), makeTicks(~0ULL / 4, 50), makeTicks(0, ~0ULL / 4),
  };

  for (const CpuTicks& T : SEQUENCE) {
    const double PCT = calc_.sample(AGGREGATE_KEY, T);
    EXPECT_GE(PCT, 0.0);
    EXPECT_LE(PCT, 100.0);
  }
}

/* ----------------------------- Key Independence ----------------------------- */

/** @test Per-core and aggregate keys keep separate baselines. */
TEST_F(UsageRateCalculatorTest, KeysIndependent) {
  (void)calc_.sample(coreKey(0), makeTicks(0, 0));
  (void)calc_.sample(coreKey(1), makeTicks(0, 0));

  // Core 0 advancing does not move core 1 or create an aggregate baseline
  EXPECT_DOUBLE_EQ(calc_.sample(coreKey(0), makeTicks(25, 75)), 25.0);
  EXPECT_FALSE(calc_.store().contains(AGGREGATE_KEY));
  EXPECT_EQ(*calc_.store().get(coreKey(1)), makeTicks(0, 0));

  EXPECT_DOUBLE_EQ(calc_.sample(coreKey(1), makeTicks(90, 10)), 90.0);
  EXPECT_EQ(calc_.sampleDetailed(AGGREGATE_KEY, makeTicks(1, 1)).status, RateStatus::WARM_UP);
}

/** @test A core appearing later starts in warm-up. */
TEST_F(UsageRateCalculatorTest, NewCoreStartsWarm) {
  (void)calc_.sample(coreKey(0), makeTicks(0, 0));
  EXPECT_EQ(calc_.sampleDetailed(coreKey(4), makeTicks(10, 10)).status, RateStatus::WARM_UP);
  EXPECT_EQ(calc_.sampleDetailed(coreKey(0), makeTicks(10, 10)).status, RateStatus::OK);
}

/** @test Two calculators never share baselines. */
TEST(UsageRateIsolationTest, CalculatorsIsolated) {
  UsageRateCalculator hostA;
  UsageRateCalculator hostB;

  (void)hostA.sample(AGGREGATE_KEY, makeTicks(0, 0));
  EXPECT_EQ(hostB.sampleDetailed(AGGREGATE_KEY, makeTicks(50, 50)).status, RateStatus::WARM_UP);
  EXPECT_DOUBLE_EQ(hostA.sample(AGGREGATE_KEY, makeTicks(50, 50)), 50.0);
}

/** @test reset() returns a key to warm-up; resetAll() clears everything. */
TEST_F(UsageRateCalculatorTest, ResetForgetsBaseline) {
  (void)calc_.sample(AGGREGATE_KEY, makeTicks(0, 0));
  (void)calc_.sample(coreKey(0), makeTicks(0, 0));

  calc_.reset(AGGREGATE_KEY);
  EXPECT_EQ(calc_.sampleDetailed(AGGREGATE_KEY, makeTicks(5, 5)).status, RateStatus::WARM_UP);
  EXPECT_TRUE(calc_.store().contains(coreKey(0)));

  calc_.resetAll();
  EXPECT_EQ(calc_.store().size(), 0U);
}

/* ----------------------------- Concurrency ----------------------------- */

/** @test Concurrent samples on one key each measure a distinct interval. */
TEST_F(UsageRateCalculatorTest, ConcurrentSameKeyConsistent) {
  constexpr int THREADS = 4;
  constexpr int PER_THREAD = 1000;

  // Every tuple advances both busy and idle equally, so any valid interval is 50%
  std::vector<std::thread> workers;
  std::vector<int> invalid(THREADS, 0);
  for (int t = 0; t < THREADS; ++t) {
    workers.emplace_back([this, t, &invalid] {
      for (int i = 0; i < PER_THREAD; ++i) {
        const std::uint64_t N = static_cast<std::uint64_t>(t) * PER_THREAD + i;
        const UsageSample S = calc_.sampleDetailed(AGGREGATE_KEY, makeTicks(N, N));
        if (S.status == RateStatus::OK && S.percent != 50.0) {
          ++invalid[t];
        }
        EXPECT_GE(S.percent, 0.0);
        EXPECT_LE(S.percent, 100.0);
      }
    });
  }
  for (std::thread& w : workers) {
    w.join();
  }

  for (int t = 0; t < THREADS; ++t) {
    EXPECT_EQ(invalid[t], 0) << "thread " << t;
  }
}

/* ----------------------------- Pure Functions ----------------------------- */

/** @test computeUsagePercent reports status through the optional pointer. */
TEST(ComputeUsagePercentTest, StatusOut) {
  RateStatus status = RateStatus::WARM_UP;
  EXPECT_DOUBLE_EQ(computeUsagePercent(makeTicks(0, 0), makeTicks(3, 1), &status), 75.0);
  EXPECT_EQ(status, RateStatus::OK);

  EXPECT_EQ(computeUsagePercent(makeTicks(3, 1), makeTicks(3, 1), &status), 0.0);
  EXPECT_EQ(status, RateStatus::NO_ELAPSED);

  EXPECT_EQ(computeUsagePercent(makeTicks(3, 1), makeTicks(2, 1), &status), 0.0);
  EXPECT_EQ(status, RateStatus::COUNTER_REGRESSION);

  EXPECT_DOUBLE_EQ(computeUsagePercent(makeTicks(0, 0), makeTicks(1, 1)), 50.0);
}

/** @test Breakdown splits the interval by state. */
TEST(ComputeBreakdownTest, PerStateShares) {
  CpuTicks t1{};
  CpuTicks t2{};
  t2.user = 40;
  t2.system = 10;
  t2.idle = 45;
  t2.iowait = 5;

  const CpuUsageBreakdown B = computeBreakdown(t1, t2);
  EXPECT_DOUBLE_EQ(B.user, 40.0);
  EXPECT_DOUBLE_EQ(B.system, 10.0);
  EXPECT_DOUBLE_EQ(B.idle, 45.0);
  EXPECT_DOUBLE_EQ(B.iowait, 5.0);
  EXPECT_DOUBLE_EQ(B.active(), 50.0);
}

/** @test Breakdown is all zeros for regression and zero elapsed. */
TEST(ComputeBreakdownTest, DegenerateZero) {
  const CpuUsageBreakdown SAME = computeBreakdown(makeTicks(5, 5), makeTicks(5, 5));
  EXPECT_EQ(SAME.active(), 0.0);
  EXPECT_EQ(SAME.idle, 0.0);

  const CpuUsageBreakdown BACK = computeBreakdown(makeTicks(5, 5), makeTicks(1, 1));
  EXPECT_EQ(BACK.active(), 0.0);
  EXPECT_EQ(BACK.idle, 0.0);
}

/** @test sampleBreakdown warms up per key and then reports shares. */
TEST_F(UsageRateCalculatorTest, SampleBreakdown) {
  EXPECT_EQ(calc_.sampleBreakdown("breakdown", makeTicks(0, 0)).active(), 0.0);
  const CpuUsageBreakdown B = calc_.sampleBreakdown("breakdown", makeTicks(20, 80));
  EXPECT_DOUBLE_EQ(B.user, 20.0);
  EXPECT_DOUBLE_EQ(B.idle, 80.0);
  EXPECT_FALSE(calc_.store().contains(AGGREGATE_KEY));
}

/* ----------------------------- toString ----------------------------- */

/** @test Status strings are distinct and stable. */
TEST(RateStatusTest, ToString) {
  EXPECT_STREQ(toString(RateStatus::OK), "OK");
  EXPECT_STREQ(toString(RateStatus::WARM_UP), "WARM_UP");
  EXPECT_STREQ(toString(RateStatus::NO_ELAPSED), "NO_ELAPSED");
  EXPECT_STREQ(toString(RateStatus::COUNTER_REGRESSION), "COUNTER_REGRESSION");
}

/** @test UsageSample and breakdown summaries are readable. */
TEST(UsageSampleTest, ToString) {
  UsageSample s{};
  s.percent = 42.0;
  s.status = RateStatus::OK;
  EXPECT_EQ(s.toString(), "42.0% (OK)");

  const CpuUsageBreakdown B{};
  EXPECT_NE(B.toString().find("active"), std::string::npos);
}
