#ifndef TICKRATE_CPU_INFO_HPP
#define TICKRATE_CPU_INFO_HPP
/**
 * @file CpuInfo.hpp
 * @brief Static CPU identity, current clock and load average.
 * @note Platform-neutral parsers for the Linux text formats (/proc/cpuinfo,
 *       /proc/loadavg); other platforms fill the structs directly.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tickrate {

namespace cpu {

/* ----------------------------- CpuInfo ----------------------------- */

/**
 * @brief Processor model and topology summary.
 */
struct CpuInfo {
  std::string model{};         ///< Marketing name, e.g. "Intel(R) Core(TM) i7-8700"
  std::string vendor{};        ///< Vendor id, e.g. "GenuineIntel"; empty if not reported
  std::size_t cores{0};        ///< Physical cores per package
  std::size_t threads{0};      ///< Logical CPUs per package
  std::uint64_t cacheBytes{0}; ///< Largest reported cache; 0 if unknown

  /// Human-readable one-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- LoadAverage ----------------------------- */

/**
 * @brief Run-queue load averages over 1, 5 and 15 minutes.
 */
struct LoadAverage {
  double load1{0.0};
  double load5{0.0};
  double load15{0.0};

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Parsers ----------------------------- */

/**
 * @brief Parse /proc/cpuinfo text.
 * @param text Whole file contents.
 * @param out Populated on success, untouched otherwise.
 * @return false if the text has no "processor" entry.
 *
 * The first "model name", "vendor_id" and "cache size" win. Cores and threads
 * come from the first "cpu cores" and "siblings"; where a kernel omits them
 * (most ARM builds) both fall back to the number of processor entries.
 */
[[nodiscard]] bool parseCpuInfoText(std::string_view text, CpuInfo& out);

/**
 * @brief Collect every "cpu MHz" value from /proc/cpuinfo text, in file order.
 * @param out Replaced on success, untouched otherwise.
 * @return false if no parseable "cpu MHz" line exists.
 */
[[nodiscard]] bool parseCpuFrequencies(std::string_view text, std::vector<double>& out);

/**
 * @brief Parse the first three fields of /proc/loadavg.
 * @param out Populated on success, untouched otherwise.
 * @return false if fewer than three non-negative numbers lead the text.
 */
[[nodiscard]] bool parseLoadAverage(std::string_view text, LoadAverage& out) noexcept;

} // namespace cpu

} // namespace tickrate

#endif // TICKRATE_CPU_INFO_HPP
