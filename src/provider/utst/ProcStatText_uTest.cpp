/**
 * @file ProcStatText_uTest.cpp
 * @brief Unit tests for tickrate::provider /proc/stat text extraction.
 *
 * Notes:
 *  - Inputs are synthetic /proc/stat excerpts; results are exact.
 */

#include "src/provider/inc/ProcStatText.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using tickrate::cpu::CpuTicks;
using tickrate::provider::AcquireStatus;
using tickrate::provider::CoreTicks;
using tickrate::provider::extractAggregate;
using tickrate::provider::extractCores;

namespace {

const std::string FULL_TEXT = "cpu  400 10 200 3000 50 5 6 7 8 9\n"
                              "cpu0 100 5 50 1500 25 2 3 3 4 4\n"
                              "cpu1 300 5 150 1500 25 3 3 4 4 5\n"
                              "intr 123456 0 0 0\n"
                              "ctxt 987654\n"
                              "btime 1700000000\n";

} // namespace

/* ----------------------------- Aggregate ----------------------------- */

/** @test Aggregate line is extracted with every column in order. */
TEST(ProcStatTextTest, AggregateFromFullText) {
  CpuTicks t{};
  ASSERT_EQ(extractAggregate(FULL_TEXT, t), AcquireStatus::OK);
  EXPECT_EQ(t.user, 400U);
  EXPECT_EQ(t.nice, 10U);
  EXPECT_EQ(t.system, 200U);
  EXPECT_EQ(t.idle, 3000U);
  EXPECT_EQ(t.iowait, 50U);
  EXPECT_EQ(t.irq, 5U);
  EXPECT_EQ(t.softirq, 6U);
  EXPECT_EQ(t.steal, 7U);
  EXPECT_EQ(t.guest, 8U);
  EXPECT_EQ(t.guestNice, 9U);
}

/** @test Single-line input (remote head -n 1) is enough. */
TEST(ProcStatTextTest, AggregateSingleLineNoNewline) {
  CpuTicks t{};
  ASSERT_EQ(extractAggregate("cpu 1 2 3 4", t), AcquireStatus::OK);
  EXPECT_EQ(t.user, 1U);
  EXPECT_EQ(t.idle, 4U);
  EXPECT_EQ(t.iowait, 0U);
}

/** @test Missing aggregate line is MALFORMED and output untouched. */
TEST(ProcStatTextTest, AggregateMissing) {
  CpuTicks t{};
  t.user = 77;
  EXPECT_EQ(extractAggregate("cpu0 1 2 3 4\nintr 5\n", t), AcquireStatus::MALFORMED);
  EXPECT_EQ(t.user, 77U);
}

/** @test Empty text is MALFORMED. */
TEST(ProcStatTextTest, AggregateEmpty) {
  CpuTicks t{};
  EXPECT_EQ(extractAggregate("", t), AcquireStatus::MALFORMED);
}

/** @test A truncated aggregate line is MALFORMED, not zero-filled. */
TEST(ProcStatTextTest, AggregateTooFewFields) {
  CpuTicks t{};
  EXPECT_EQ(extractAggregate("cpu 1 2 3\n", t), AcquireStatus::MALFORMED);
}

/** @test Non-numeric field is MALFORMED. */
TEST(ProcStatTextTest, AggregateNonNumeric) {
  CpuTicks t{};
  EXPECT_EQ(extractAggregate("cpu 1 2 x 4\n", t), AcquireStatus::MALFORMED);
}

/* ----------------------------- Cores ----------------------------- */

/** @test Per-core lines are extracted; aggregate and other lines are skipped. */
TEST(ProcStatTextTest, CoresFromFullText) {
  std::vector<CoreTicks> cores;
  ASSERT_EQ(extractCores(FULL_TEXT, cores), AcquireStatus::OK);
  ASSERT_EQ(cores.size(), 2U);
  EXPECT_EQ(cores[0].cpuId, 0U);
  EXPECT_EQ(cores[0].ticks.user, 100U);
  EXPECT_EQ(cores[1].cpuId, 1U);
  EXPECT_EQ(cores[1].ticks.user, 300U);
  EXPECT_EQ(cores[1].ticks.guestNice, 5U);
}

/** @test Offline CPUs leave gaps; ids are preserved and sorted. */
TEST(ProcStatTextTest, CoresSparseAndUnordered) {
  std::vector<CoreTicks> cores;
  ASSERT_EQ(extractCores("cpu5 1 1 1 1\ncpu0 2 2 2 2\ncpu3 3 3 3 3\n", cores), AcquireStatus::OK);
  ASSERT_EQ(cores.size(), 3U);
  EXPECT_EQ(cores[0].cpuId, 0U);
  EXPECT_EQ(cores[1].cpuId, 3U);
  EXPECT_EQ(cores[2].cpuId, 5U);
  EXPECT_EQ(cores[2].ticks.user, 1U);
}

/** @test No per-core lines is MALFORMED. */
TEST(ProcStatTextTest, CoresNone) {
  std::vector<CoreTicks> cores{CoreTicks{9, CpuTicks{}}};
  EXPECT_EQ(extractCores("cpu 1 2 3 4\n", cores), AcquireStatus::MALFORMED);
  ASSERT_EQ(cores.size(), 1U);
  EXPECT_EQ(cores[0].cpuId, 9U);
}

/** @test One bad core line fails the whole read. */
TEST(ProcStatTextTest, CoresOneMalformed) {
  std::vector<CoreTicks> cores;
  EXPECT_EQ(extractCores("cpu0 1 2 3 4\ncpu1 1 2\n", cores), AcquireStatus::MALFORMED);
  EXPECT_TRUE(cores.empty());
}

/** @test Duplicate core ids are MALFORMED. */
TEST(ProcStatTextTest, CoresDuplicate) {
  std::vector<CoreTicks> cores;
  EXPECT_EQ(extractCores("cpu0 1 2 3 4\ncpu0 5 6 7 8\n", cores), AcquireStatus::MALFORMED);
}
