#ifndef TICKRATE_PROVIDER_REMOTE_LINUX_TICKS_SOURCE_HPP
#define TICKRATE_PROVIDER_REMOTE_LINUX_TICKS_SOURCE_HPP
/**
 * @file RemoteLinuxTicksSource.hpp
 * @brief CpuTicks from /proc/stat on a remote Linux host, via a CommandRunner.
 *
 * Commands:
 *  - aggregate: head -n 1 <statPath>
 *  - cores:     grep '^cpu[0-9]' <statPath>
 *  - info, clock: cat <cpuInfoPath>
 *  - load:      cat <loadAvgPath>
 *
 * Each instance talks to exactly one host. Give every host its own source and
 * provider; a shared one would mix baselines across hosts.
 */

#include "src/provider/inc/CommandRunner.hpp"
#include "src/provider/inc/TicksSource.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tickrate {

namespace provider {

class RemoteLinuxTicksSource final : public TicksSource {
public:
  /**
   * @param runner Transport to the host (must be non-null).
   * @param statPath Remote stat file path.
   * @param cpuInfoPath Remote cpuinfo file path.
   * @param loadAvgPath Remote loadavg file path.
   */
  explicit RemoteLinuxTicksSource(std::unique_ptr<CommandRunner> runner,
                                  std::string statPath = "/proc/stat",
                                  std::string cpuInfoPath = "/proc/cpuinfo",
                                  std::string loadAvgPath = "/proc/loadavg");

  [[nodiscard]] AcquireStatus sampleAggregate(cpu::CpuTicks& out) override;
  [[nodiscard]] AcquireStatus sampleCores(std::vector<CoreTicks>& out) override;
  [[nodiscard]] AcquireStatus sampleFrequencies(std::vector<double>& out) override;
  [[nodiscard]] AcquireStatus readInfo(cpu::CpuInfo& out) override;
  [[nodiscard]] AcquireStatus sampleLoadAverage(cpu::LoadAverage& out) override;

  [[nodiscard]] SourceKind kind() const noexcept override { return SourceKind::REMOTE_LINUX; }
  [[nodiscard]] std::string describe() const override;

  /// Command used for sampleAggregate().
  [[nodiscard]] std::string aggregateCommand() const;

  /// Command used for sampleCores().
  [[nodiscard]] std::string coresCommand() const;

  /// Command used for readInfo() and sampleFrequencies().
  [[nodiscard]] std::string cpuInfoCommand() const;

  /// Command used for sampleLoadAverage().
  [[nodiscard]] std::string loadAvgCommand() const;

private:
  /// Run command and hand its output to extract on success.
  template <typename Out, typename Extract>
  AcquireStatus runAndExtract(const std::string& command, Out& out, Extract extract);

  std::unique_ptr<CommandRunner> runner_;
  std::string statPath_;
  std::string cpuInfoPath_;
  std::string loadAvgPath_;
};

} // namespace provider

} // namespace tickrate

#endif // TICKRATE_PROVIDER_REMOTE_LINUX_TICKS_SOURCE_HPP
