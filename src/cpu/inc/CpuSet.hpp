#ifndef TICKRATE_CPU_CPU_SET_HPP
#define TICKRATE_CPU_CPU_SET_HPP
/**
 * @file CpuSet.hpp
 * @brief Fixed-size CPU id set and kernel-style CPU list parsing ("0-3,6").
 * @note Used to filter which per-core results a caller reports.
 */

#include "src/cpu/inc/CpuTicks.hpp"

#include <bitset>
#include <cstddef>
#include <string>
#include <string_view>

namespace tickrate {

namespace cpu {

/* ----------------------------- CpuSet ----------------------------- */

/**
 * @brief CPU id set backed by a bitset (no heap allocation).
 */
struct CpuSet {
  std::bitset<MAX_CPUS> mask{};

  /// True if cpuId is in the set. Ids >= MAX_CPUS are never members.
  [[nodiscard]] bool test(std::size_t cpuId) const noexcept;

  /// Add cpuId. Ids >= MAX_CPUS are ignored.
  void set(std::size_t cpuId) noexcept;

  [[nodiscard]] std::size_t count() const noexcept { return mask.count(); }
  [[nodiscard]] bool empty() const noexcept { return mask.none(); }

  /// Compact list form, e.g. "0-3,6". Empty set is "".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Parser ----------------------------- */

/**
 * @brief Parse a CPU list such as "0-3,6,8-9".
 * @param list   Text in the format used by /sys/devices/system/cpu/online.
 * @param out    Receives the parsed set; untouched on failure.
 * @return false on an empty list, a non-number, a reversed range, or an id >= MAX_CPUS.
 */
[[nodiscard]] bool parseCpuList(std::string_view list, CpuSet& out) noexcept;

} // namespace cpu

} // namespace tickrate

#endif // TICKRATE_CPU_CPU_SET_HPP
