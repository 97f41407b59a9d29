/**
 * @file LocalLinuxTicksSource_uTest.cpp
 * @brief Unit tests for tickrate::provider::LocalLinuxTicksSource.
 *
 * Notes:
 *  - Fixture files are written under /tmp; live /proc/stat tests skip when absent.
 */

#include "src/provider/inc/LocalLinuxTicksSource.hpp"

#include <gtest/gtest.h>

#include <unistd.h> // mkstemp, close, unlink, access

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using tickrate::cpu::CpuInfo;
using tickrate::cpu::CpuTicks;
using tickrate::cpu::LoadAverage;
using tickrate::provider::AcquireStatus;
using tickrate::provider::CoreTicks;
using tickrate::provider::LocalLinuxTicksSource;
using tickrate::provider::PROC_CPUINFO_PATH;
using tickrate::provider::PROC_LOADAVG_PATH;
using tickrate::provider::PROC_STAT_PATH;
using tickrate::provider::SourceKind;

class LocalLinuxTicksSourceTest : public ::testing::Test {
protected:
  void TearDown() override {
    for (const std::string& path : paths_) {
      ::unlink(path.c_str());
    }
  }

  /// Write content to a fresh temp file and return its path.
  std::string writeFixture(const std::string& content) {
    char name[] = "/tmp/tickrate_procstat_XXXXXX";
    const int FD = ::mkstemp(name);
    EXPECT_GE(FD, 0);
    paths_.emplace_back(name);
    std::FILE* file = ::fdopen(FD, "w");
    EXPECT_NE(file, nullptr);
    if (file != nullptr) {
      std::fputs(content.c_str(), file);
      std::fclose(file);
    }
    return paths_.back();
  }

  std::vector<std::string> paths_{};
};

/** @test Default path and reported identity. */
TEST_F(LocalLinuxTicksSourceTest, Identity) {
  const LocalLinuxTicksSource SRC{};
  EXPECT_EQ(SRC.statPath(), PROC_STAT_PATH);
  EXPECT_EQ(SRC.kind(), SourceKind::LOCAL_LINUX);
  EXPECT_EQ(SRC.describe(), "local:/proc/stat");
}

/** @test Aggregate and cores are read from a fixture file. */
TEST_F(LocalLinuxTicksSourceTest, ReadsFixture) {
  LocalLinuxTicksSource src{writeFixture("cpu  30 0 20 50 0 0 0 0 0 0\n"
                                         "cpu0 10 0 10 30 0 0 0 0 0 0\n"
                                         "cpu1 20 0 10 20 0 0 0 0 0 0\n"
                                         "intr 1 2 3\n"
                                         "cpu9 this line is past the cpu block\n")};

  CpuTicks agg{};
  ASSERT_EQ(src.sampleAggregate(agg), AcquireStatus::OK);
  EXPECT_EQ(agg.user, 30U);
  EXPECT_EQ(agg.total(), 100U);

  std::vector<CoreTicks> cores;
  ASSERT_EQ(src.sampleCores(cores), AcquireStatus::OK);
  ASSERT_EQ(cores.size(), 2U);
  EXPECT_EQ(cores[1].cpuId, 1U);
  EXPECT_EQ(cores[1].ticks.user, 20U);
}

/** @test Every read reflects the file's current content. */
TEST_F(LocalLinuxTicksSourceTest, RereadsEachCall) {
  LocalLinuxTicksSource src{writeFixture("cpu 1 0 0 9\ncpu0 1 0 0 9\n")};
  CpuTicks agg{};
  ASSERT_EQ(src.sampleAggregate(agg), AcquireStatus::OK);
  EXPECT_EQ(agg.user, 1U);

  std::FILE* file = std::fopen(paths_.back().c_str(), "w");
  ASSERT_NE(file, nullptr);
  std::fputs("cpu 5 0 0 15\ncpu0 5 0 0 15\n", file);
  std::fclose(file);

  ASSERT_EQ(src.sampleAggregate(agg), AcquireStatus::OK);
  EXPECT_EQ(agg.user, 5U);
}

/** @test Missing file is SOURCE_UNAVAILABLE and output untouched. */
TEST_F(LocalLinuxTicksSourceTest, MissingFile) {
  LocalLinuxTicksSource src{"/nonexistent/tickrate/stat"};
  CpuTicks agg{};
  agg.user = 42;
  EXPECT_EQ(src.sampleAggregate(agg), AcquireStatus::SOURCE_UNAVAILABLE);
  EXPECT_EQ(agg.user, 42U);

  std::vector<CoreTicks> cores;
  EXPECT_EQ(src.sampleCores(cores), AcquireStatus::SOURCE_UNAVAILABLE);
  EXPECT_TRUE(cores.empty());
}

/** @test Empty file is MALFORMED, never a zero tuple. */
TEST_F(LocalLinuxTicksSourceTest, EmptyFile) {
  LocalLinuxTicksSource src{writeFixture("")};
  CpuTicks agg{};
  EXPECT_EQ(src.sampleAggregate(agg), AcquireStatus::MALFORMED);
}

/** @test Truncated aggregate line is MALFORMED. */
TEST_F(LocalLinuxTicksSourceTest, TruncatedFile) {
  LocalLinuxTicksSource src{writeFixture("cpu 1 2\n")};
  CpuTicks agg{};
  EXPECT_EQ(src.sampleAggregate(agg), AcquireStatus::MALFORMED);
}

/** @test Live /proc/stat yields a non-zero aggregate and at least one core. */
TEST_F(LocalLinuxTicksSourceTest, LiveProcStat) {
  if (::access(PROC_STAT_PATH, R_OK) != 0) {
    GTEST_SKIP() << "/proc/stat not readable";
  }
  LocalLinuxTicksSource src{};
  CpuTicks agg{};
  ASSERT_EQ(src.sampleAggregate(agg), AcquireStatus::OK);
  EXPECT_GT(agg.total(), 0U);

  std::vector<CoreTicks> cores;
  ASSERT_EQ(src.sampleCores(cores), AcquireStatus::OK);
  EXPECT_FALSE(cores.empty());
}

/* ----------------------------- cpuinfo / loadavg ----------------------------- */

/** @test Info and clocks come from the cpuinfo file, load from the loadavg file. */
TEST_F(LocalLinuxTicksSourceTest, ReadsCpuInfoAndLoadAvg) {
  const std::string STAT = writeFixture("cpu 1 0 0 9\n");
  const std::string INFO = writeFixture("processor\t: 0\n"
                                        "vendor_id\t: AuthenticAMD\n"
                                        "model name\t: AMD EPYC 7B13\n"
                                        "cpu MHz\t\t: 2450.000\n"
                                        "cache size\t: 512 KB\n"
                                        "\n"
                                        "processor\t: 1\n"
                                        "cpu MHz\t\t: 3100.500\n");
  const std::string LOAD = writeFixture("0.25 0.50 0.75 1/200 4242\n");
  LocalLinuxTicksSource src{STAT, INFO, LOAD};

  CpuInfo info{};
  ASSERT_EQ(src.readInfo(info), AcquireStatus::OK);
  EXPECT_EQ(info.model, "AMD EPYC 7B13");
  EXPECT_EQ(info.vendor, "AuthenticAMD");
  EXPECT_EQ(info.threads, 2U);
  EXPECT_EQ(info.cacheBytes, 512U * 1024U);

  std::vector<double> mhz;
  ASSERT_EQ(src.sampleFrequencies(mhz), AcquireStatus::OK);
  ASSERT_EQ(mhz.size(), 2U);
  EXPECT_DOUBLE_EQ(mhz[1], 3100.5);

  LoadAverage la{};
  ASSERT_EQ(src.sampleLoadAverage(la), AcquireStatus::OK);
  EXPECT_DOUBLE_EQ(la.load5, 0.50);
}

/** @test cpuinfo without clock lines reports UNSUPPORTED for frequencies only. */
TEST_F(LocalLinuxTicksSourceTest, NoClockUnsupported) {
  const std::string INFO = writeFixture("processor\t: 0\nBogoMIPS\t: 50.00\n");
  LocalLinuxTicksSource src{PROC_STAT_PATH, INFO};

  std::vector<double> mhz{7.0};
  EXPECT_EQ(src.sampleFrequencies(mhz), AcquireStatus::UNSUPPORTED);
  ASSERT_EQ(mhz.size(), 1U);

  CpuInfo info{};
  EXPECT_EQ(src.readInfo(info), AcquireStatus::OK);
  EXPECT_EQ(info.cores, 1U);
}

/** @test Missing files are SOURCE_UNAVAILABLE; garbage is MALFORMED. */
TEST_F(LocalLinuxTicksSourceTest, CpuInfoAndLoadAvgFailures) {
  LocalLinuxTicksSource missing{PROC_STAT_PATH, "/nonexistent/tickrate/cpuinfo",
                                "/nonexistent/tickrate/loadavg"};
  CpuInfo info{};
  std::vector<double> mhz;
  LoadAverage la{};
  EXPECT_EQ(missing.readInfo(info), AcquireStatus::SOURCE_UNAVAILABLE);
  EXPECT_EQ(missing.sampleFrequencies(mhz), AcquireStatus::SOURCE_UNAVAILABLE);
  EXPECT_EQ(missing.sampleLoadAverage(la), AcquireStatus::SOURCE_UNAVAILABLE);

  const std::string JUNK = writeFixture("not a proc file\n");
  LocalLinuxTicksSource junk{PROC_STAT_PATH, JUNK, JUNK};
  EXPECT_EQ(junk.readInfo(info), AcquireStatus::MALFORMED);
  EXPECT_EQ(junk.sampleFrequencies(mhz), AcquireStatus::MALFORMED);
  EXPECT_EQ(junk.sampleLoadAverage(la), AcquireStatus::MALFORMED);
}

/** @test Live /proc/cpuinfo and /proc/loadavg parse where present. */
TEST_F(LocalLinuxTicksSourceTest, LiveCpuInfoAndLoadAvg) {
  if (::access(PROC_CPUINFO_PATH, R_OK) != 0 || ::access(PROC_LOADAVG_PATH, R_OK) != 0) {
    GTEST_SKIP() << "/proc/cpuinfo or /proc/loadavg not readable";
  }
  LocalLinuxTicksSource src{};
  CpuInfo info{};
  ASSERT_EQ(src.readInfo(info), AcquireStatus::OK);
  EXPECT_GT(info.threads, 0U);

  LoadAverage la{};
  ASSERT_EQ(src.sampleLoadAverage(la), AcquireStatus::OK);
  EXPECT_GE(la.load1, 0.0);
}
