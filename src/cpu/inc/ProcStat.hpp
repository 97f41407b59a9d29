#ifndef TICKRATE_CPU_PROC_STAT_HPP
#define TICKRATE_CPU_PROC_STAT_HPP
/**
 * @file ProcStat.hpp
 * @brief Parser for the cpu lines of Linux /proc/stat.
 * @note Pure text parsing. Shared by the local file reader and the SSH reader,
 *       which both see the same kernel format.
 *
 * Line format:
 *   cpu  user nice system idle [iowait irq softirq steal guest guest_nice]
 *   cpuN user nice system idle [...]
 *
 * Kernels before 2.6 stop after idle; later ones append fields over time, so
 * trailing fields are optional. Fewer than four numeric fields is malformed.
 */

#include "src/cpu/inc/CpuTicks.hpp"

#include <string_view>

namespace tickrate {

namespace cpu {

/* ----------------------------- Constants ----------------------------- */

/// cpuId value reported for the aggregate "cpu" line.
inline constexpr int AGGREGATE_CPU_ID = -1;

/// Minimum numeric fields (user nice system idle) for a valid line.
inline constexpr std::size_t PROC_STAT_MIN_FIELDS = 4;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Outcome of parsing one /proc/stat line.
 */
enum class ProcStatLine : unsigned char {
  CPU = 0,   ///< Valid cpu/cpuN line; output populated
  OTHER,     ///< Not a cpu line (intr, ctxt, btime, ...)
  MALFORMED, ///< cpu prefix but unusable fields
};

/**
 * @brief Parse one line of /proc/stat.
 * @param line Line text (trailing newline allowed).
 * @param out Populated counters when the result is CPU.
 * @param cpuId AGGREGATE_CPU_ID for "cpu", N for "cpuN".
 * @return Classification of the line.
 * @note RT-safe: No allocation, bounded parsing.
 */
[[nodiscard]] ProcStatLine parseProcStatLine(std::string_view line, CpuTicks& out,
                                             int& cpuId) noexcept;

} // namespace cpu

} // namespace tickrate

#endif // TICKRATE_CPU_PROC_STAT_HPP
