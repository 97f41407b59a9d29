#ifndef TICKRATE_PROVIDER_TICKS_SOURCE_HPP
#define TICKRATE_PROVIDER_TICKS_SOURCE_HPP
/**
 * @file TicksSource.hpp
 * @brief Adapter contract: one raw CpuTicks reading per call from some OS.
 *
 * A TicksSource only acquires counters. It keeps no baselines and computes no
 * rates; CpuUsageProvider pairs it with a UsageRateCalculator.
 *
 * Failure contract:
 *  - Any problem (file missing, command failed, malformed text) is returned
 *    as a non-OK AcquireStatus. A zero tuple is never fabricated.
 *  - On failure the output argument is left unchanged.
 *
 * Counters are mandatory. Clock, identity and load average are optional
 * capabilities: the base class answers UNSUPPORTED and each variant overrides
 * what its platform offers.
 *
 * The set of variants is closed (see SourceKind); each lives in its own
 * translation unit and only the ones for the build platform are compiled.
 */

#include "src/cpu/inc/CpuInfo.hpp"
#include "src/cpu/inc/CpuTicks.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tickrate {

namespace provider {

/* ----------------------------- AcquireStatus ----------------------------- */

/**
 * @brief Outcome of a raw counter acquisition.
 */
enum class AcquireStatus : unsigned char {
  OK = 0,
  SOURCE_UNAVAILABLE, ///< File, API, or transport not reachable
  MALFORMED,          ///< Data obtained but not parseable as counters
  UNSUPPORTED,        ///< Capability not offered by this source/platform
  COMMAND_FAILED,     ///< Remote command ran but exited non-zero or timed out
};

/**
 * @brief Human-readable status string.
 * @note RT-safe: Returns static string pointer.
 */
[[nodiscard]] const char* toString(AcquireStatus status) noexcept;

/* ----------------------------- SourceKind ----------------------------- */

/**
 * @brief Closed set of adapter variants.
 */
enum class SourceKind : unsigned char {
  LOCAL_LINUX = 0, ///< /proc/stat on this machine
  REMOTE_LINUX,    ///< /proc/stat on an SSH-reachable host
  WINDOWS,         ///< GetSystemTimes / NtQuerySystemInformation
  DARWIN,          ///< Mach host statistics
};

/// @note RT-safe: Returns static string pointer.
[[nodiscard]] const char* toString(SourceKind kind) noexcept;

/* ----------------------------- Readings ----------------------------- */

/**
 * @brief Counters for one logical CPU.
 */
struct CoreTicks {
  std::size_t cpuId{0}; ///< OS CPU index
  cpu::CpuTicks ticks{};
};

/* ----------------------------- TicksSource ----------------------------- */

class TicksSource {
public:
  virtual ~TicksSource() = default;

  /**
   * @brief Read whole-machine counters.
   * @param out Populated on OK, untouched otherwise.
   */
  [[nodiscard]] virtual AcquireStatus sampleAggregate(cpu::CpuTicks& out) = 0;

  /**
   * @brief Read counters for every online CPU, sorted by cpuId.
   * @param out Replaced on OK, untouched otherwise.
   */
  [[nodiscard]] virtual AcquireStatus sampleCores(std::vector<CoreTicks>& out) = 0;

  /**
   * @brief Current clock of every logical CPU in MHz, in OS order.
   * @param out Replaced on OK, untouched otherwise.
   */
  [[nodiscard]] virtual AcquireStatus sampleFrequencies(std::vector<double>& out);

  /// Processor model and topology. @param out Populated on OK, untouched otherwise.
  [[nodiscard]] virtual AcquireStatus readInfo(cpu::CpuInfo& out);

  /// 1/5/15-minute load averages. @param out Populated on OK, untouched otherwise.
  [[nodiscard]] virtual AcquireStatus sampleLoadAverage(cpu::LoadAverage& out);

  /// Variant of this source.
  [[nodiscard]] virtual SourceKind kind() const noexcept = 0;

  /// Short description for diagnostics, e.g. "local:/proc/stat".
  [[nodiscard]] virtual std::string describe() const = 0;
};

} // namespace provider

} // namespace tickrate

#endif // TICKRATE_PROVIDER_TICKS_SOURCE_HPP
