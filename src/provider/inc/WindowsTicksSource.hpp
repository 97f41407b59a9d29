#ifndef TICKRATE_PROVIDER_WINDOWS_TICKS_SOURCE_HPP
#define TICKRATE_PROVIDER_WINDOWS_TICKS_SOURCE_HPP
/**
 * @file WindowsTicksSource.hpp
 * @brief CpuTicks from the Windows kernel time counters.
 * @note WindowsTicksSource is compiled only when _WIN32 is defined; the
 *       counter mapping builds everywhere.
 *
 * Units are 100 ns intervals. Windows kernel time includes idle time, so
 * system = kernel - idle. Only user, system and idle are populated.
 *  - aggregate: GetSystemTimes
 *  - cores:     NtQuerySystemInformation(SystemProcessorPerformanceInformation)
 *  - clock:     "~MHz" under HKLM\HARDWARE\DESCRIPTION\System\CentralProcessor\<n>
 *  - info:      the same key for name and vendor, GetLogicalProcessorInformation
 *               for cores, threads and cache
 *  - load:      none; Windows has no run-queue average (UNSUPPORTED)
 */

#include "src/provider/inc/TicksSource.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tickrate {

namespace provider {

/**
 * @brief Map Windows (idle, kernel, user) times to CpuTicks.
 * @return false if idle exceeds kernel (inconsistent read).
 * @note Platform-neutral so it can be tested anywhere.
 */
[[nodiscard]] bool windowsTimesToTicks(std::uint64_t idle, std::uint64_t kernel,
                                       std::uint64_t user, cpu::CpuTicks& out) noexcept;

#if defined(_WIN32)

class WindowsTicksSource final : public TicksSource {
public:
  [[nodiscard]] AcquireStatus sampleAggregate(cpu::CpuTicks& out) override;
  [[nodiscard]] AcquireStatus sampleCores(std::vector<CoreTicks>& out) override;
  [[nodiscard]] AcquireStatus sampleFrequencies(std::vector<double>& out) override;
  [[nodiscard]] AcquireStatus readInfo(cpu::CpuInfo& out) override;

  [[nodiscard]] SourceKind kind() const noexcept override { return SourceKind::WINDOWS; }
  [[nodiscard]] std::string describe() const override { return "windows:kernel-times"; }
};

#endif // _WIN32

} // namespace provider

} // namespace tickrate

#endif // TICKRATE_PROVIDER_WINDOWS_TICKS_SOURCE_HPP
