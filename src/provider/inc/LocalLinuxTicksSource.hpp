#ifndef TICKRATE_PROVIDER_LOCAL_LINUX_TICKS_SOURCE_HPP
#define TICKRATE_PROVIDER_LOCAL_LINUX_TICKS_SOURCE_HPP
/**
 * @file LocalLinuxTicksSource.hpp
 * @brief CpuTicks from this machine's /proc/stat, plus /proc/cpuinfo and /proc/loadavg.
 * @note Linux-only at runtime; the paths are configurable so tests can point
 *       them at fixture files.
 */

#include "src/provider/inc/TicksSource.hpp"

#include <string>
#include <vector>

namespace tickrate {

namespace provider {

/// Default kernel CPU statistics file.
inline constexpr const char* PROC_STAT_PATH = "/proc/stat";

/// Processor description file ("model name", "cpu MHz", ...).
inline constexpr const char* PROC_CPUINFO_PATH = "/proc/cpuinfo";

/// Run-queue load averages.
inline constexpr const char* PROC_LOADAVG_PATH = "/proc/loadavg";

class LocalLinuxTicksSource final : public TicksSource {
public:
  explicit LocalLinuxTicksSource(std::string statPath = PROC_STAT_PATH,
                                 std::string cpuInfoPath = PROC_CPUINFO_PATH,
                                 std::string loadAvgPath = PROC_LOADAVG_PATH);

  [[nodiscard]] AcquireStatus sampleAggregate(cpu::CpuTicks& out) override;
  [[nodiscard]] AcquireStatus sampleCores(std::vector<CoreTicks>& out) override;

  /// "cpu MHz" of every processor entry; UNSUPPORTED where the kernel omits it.
  [[nodiscard]] AcquireStatus sampleFrequencies(std::vector<double>& out) override;
  [[nodiscard]] AcquireStatus readInfo(cpu::CpuInfo& out) override;
  [[nodiscard]] AcquireStatus sampleLoadAverage(cpu::LoadAverage& out) override;

  [[nodiscard]] SourceKind kind() const noexcept override { return SourceKind::LOCAL_LINUX; }
  [[nodiscard]] std::string describe() const override;

  [[nodiscard]] const std::string& statPath() const noexcept { return statPath_; }

private:
  /// Read the leading cpu lines of the stat file.
  [[nodiscard]] AcquireStatus readCpuLines(std::string& text) const;

  std::string statPath_;
  std::string cpuInfoPath_;
  std::string loadAvgPath_;
};

} // namespace provider

} // namespace tickrate

#endif // TICKRATE_PROVIDER_LOCAL_LINUX_TICKS_SOURCE_HPP
