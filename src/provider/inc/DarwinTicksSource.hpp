#ifndef TICKRATE_PROVIDER_DARWIN_TICKS_SOURCE_HPP
#define TICKRATE_PROVIDER_DARWIN_TICKS_SOURCE_HPP
/**
 * @file DarwinTicksSource.hpp
 * @brief CpuTicks from Mach host statistics.
 * @note DarwinTicksSource is compiled only when __APPLE__ is defined.
 *
 * Mach reports user, system, idle and nice ticks as 32-bit natural_t values.
 * They wrap after long uptimes; the rate engine treats a wrap like any other
 * counter regression and re-baselines.
 *  - aggregate: host_statistics(HOST_CPU_LOAD_INFO)
 *  - cores:     host_processor_info(PROCESSOR_CPU_LOAD_INFO)
 *  - clock:     sysctl hw.cpufrequency, else hw.cpufrequency_max (absent on
 *               Apple silicon: UNSUPPORTED)
 *  - info:      sysctl machdep.cpu.*, hw.physicalcpu, hw.logicalcpu, hw.l3/l2cachesize
 *  - load:      getloadavg()
 */

#include "src/provider/inc/TicksSource.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tickrate {

namespace provider {

/**
 * @brief Map Mach CPU_STATE_* tick counts to CpuTicks.
 * @note Platform-neutral so it can be tested anywhere.
 */
[[nodiscard]] cpu::CpuTicks machTicksToCpuTicks(std::uint64_t user, std::uint64_t system,
                                                std::uint64_t idle, std::uint64_t nice) noexcept;

/**
 * @brief One nominal clock in Hz replicated for each logical CPU, in MHz.
 * @note Darwin reports a single package frequency, not per-CPU values.
 */
[[nodiscard]] std::vector<double> hzToMhzPerCpu(std::uint64_t hz, std::size_t cpus);

#if defined(__APPLE__)

class DarwinTicksSource final : public TicksSource {
public:
  [[nodiscard]] AcquireStatus sampleAggregate(cpu::CpuTicks& out) override;
  [[nodiscard]] AcquireStatus sampleCores(std::vector<CoreTicks>& out) override;
  [[nodiscard]] AcquireStatus sampleFrequencies(std::vector<double>& out) override;
  [[nodiscard]] AcquireStatus readInfo(cpu::CpuInfo& out) override;
  [[nodiscard]] AcquireStatus sampleLoadAverage(cpu::LoadAverage& out) override;

  [[nodiscard]] SourceKind kind() const noexcept override { return SourceKind::DARWIN; }
  [[nodiscard]] std::string describe() const override { return "darwin:mach-host"; }
};

#endif // __APPLE__

} // namespace provider

} // namespace tickrate

#endif // TICKRATE_PROVIDER_DARWIN_TICKS_SOURCE_HPP
