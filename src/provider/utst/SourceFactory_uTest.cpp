/**
 * @file SourceFactory_uTest.cpp
 * @brief Unit tests for tickrate::provider source construction.
 */

#include "src/provider/inc/SourceFactory.hpp"

#include <gtest/gtest.h>

#include <memory>

using tickrate::provider::AcquireStatus;
using tickrate::provider::isSourceKindAvailable;
using tickrate::provider::makeTicksSource;
using tickrate::provider::nativeSourceKind;
using tickrate::provider::SourceConfig;
using tickrate::provider::SourceKind;
using tickrate::provider::TicksSource;
using tickrate::provider::toString;

/** @test The native kind is always available. */
TEST(SourceFactoryTest, NativeKindAvailable) {
  EXPECT_TRUE(isSourceKindAvailable(nativeSourceKind()));
}

/** @test Default config is local Linux on /proc/stat. */
TEST(SourceFactoryTest, DefaultConfig) {
  const SourceConfig CFG{};
  EXPECT_EQ(CFG.kind, SourceKind::LOCAL_LINUX);
  EXPECT_EQ(CFG.statPath, "/proc/stat");
  EXPECT_EQ(CFG.cpuInfoPath, "/proc/cpuinfo");
  EXPECT_EQ(CFG.loadAvgPath, "/proc/loadavg");
  EXPECT_TRUE(CFG.ssh.host.empty());
}

/** @test Unavailable kinds build nothing. */
TEST(SourceFactoryTest, UnavailableKindIsNull) {
  for (const SourceKind KIND : {SourceKind::LOCAL_LINUX, SourceKind::REMOTE_LINUX,
                                SourceKind::WINDOWS, SourceKind::DARWIN}) {
    SourceConfig cfg{};
    cfg.kind = KIND;
    cfg.ssh.host = "db1";
    const std::unique_ptr<TicksSource> SRC = makeTicksSource(cfg);
    if (!isSourceKindAvailable(KIND)) {
      EXPECT_EQ(SRC.get(), nullptr) << toString(KIND);
    } else {
      ASSERT_NE(SRC.get(), nullptr) << toString(KIND);
      EXPECT_EQ(SRC->kind(), KIND);
    }
  }
}

/** @test Remote without a host builds nothing. */
TEST(SourceFactoryTest, RemoteNeedsHost) {
  SourceConfig cfg{};
  cfg.kind = SourceKind::REMOTE_LINUX;
  EXPECT_EQ(makeTicksSource(cfg).get(), nullptr);
}

#if defined(__linux__)

/** @test Local source honors the configured path. */
TEST(SourceFactoryTest, LocalUsesStatPath) {
  SourceConfig cfg{};
  cfg.statPath = "/tmp/tickrate-stat";
  const std::unique_ptr<TicksSource> SRC = makeTicksSource(cfg);
  ASSERT_NE(SRC.get(), nullptr);
  EXPECT_EQ(SRC->describe(), "local:/tmp/tickrate-stat");
}

/** @test Remote source carries the ssh target and path. */
TEST(SourceFactoryTest, RemoteDescribe) {
  SourceConfig cfg{};
  cfg.kind = SourceKind::REMOTE_LINUX;
  cfg.ssh.host = "db1";
  cfg.ssh.user = "ops";
  const std::unique_ptr<TicksSource> SRC = makeTicksSource(cfg);
  ASSERT_NE(SRC.get(), nullptr);
  EXPECT_EQ(SRC->describe(), "ssh:ops@db1:/proc/stat");
}

/** @test Local source reads info and load from the configured paths. */
TEST(SourceFactoryTest, LocalUsesInfoPaths) {
  SourceConfig cfg{};
  cfg.cpuInfoPath = "/nonexistent/tickrate/cpuinfo";
  cfg.loadAvgPath = "/nonexistent/tickrate/loadavg";
  const std::unique_ptr<TicksSource> SRC = makeTicksSource(cfg);
  ASSERT_NE(SRC.get(), nullptr);

  tickrate::cpu::CpuInfo info{};
  tickrate::cpu::LoadAverage la{};
  EXPECT_EQ(SRC->readInfo(info), AcquireStatus::SOURCE_UNAVAILABLE);
  EXPECT_EQ(SRC->sampleLoadAverage(la), AcquireStatus::SOURCE_UNAVAILABLE);
}

#endif // __linux__

/** @test Status and kind strings. */
TEST(SourceFactoryTest, ToStrings) {
  using tickrate::provider::AcquireStatus;
  EXPECT_STREQ(toString(AcquireStatus::OK), "OK");
  EXPECT_STREQ(toString(AcquireStatus::SOURCE_UNAVAILABLE), "SOURCE_UNAVAILABLE");
  EXPECT_STREQ(toString(AcquireStatus::MALFORMED), "MALFORMED");
  EXPECT_STREQ(toString(AcquireStatus::UNSUPPORTED), "UNSUPPORTED");
  EXPECT_STREQ(toString(AcquireStatus::COMMAND_FAILED), "COMMAND_FAILED");
  EXPECT_STREQ(toString(SourceKind::LOCAL_LINUX), "local-linux");
  EXPECT_STREQ(toString(SourceKind::REMOTE_LINUX), "remote-linux");
  EXPECT_STREQ(toString(SourceKind::WINDOWS), "windows");
  EXPECT_STREQ(toString(SourceKind::DARWIN), "darwin");
}
