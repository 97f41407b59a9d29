#ifndef TICKRATE_PROVIDER_PROC_STAT_TEXT_HPP
#define TICKRATE_PROVIDER_PROC_STAT_TEXT_HPP
/**
 * @file ProcStatText.hpp
 * @brief Extract CPU readings from Linux /proc text, wherever it came from.
 *
 * Both Linux sources end up with the same text: the local one from the file,
 * the remote one from command output. Extraction is all-or-nothing; a single
 * malformed cpu line fails the round so no partial baselines are written.
 */

#include "src/cpu/inc/CpuInfo.hpp"
#include "src/cpu/inc/CpuTicks.hpp"
#include "src/provider/inc/TicksSource.hpp"

#include <string_view>
#include <vector>

namespace tickrate {

namespace provider {

/**
 * @brief Find the aggregate "cpu" line.
 * @return OK, or MALFORMED if absent or unparseable.
 */
[[nodiscard]] AcquireStatus extractAggregate(std::string_view text, cpu::CpuTicks& out);

/**
 * @brief Collect every "cpuN" line, sorted by N.
 * @return OK, or MALFORMED if none are present or any is unparseable.
 */
[[nodiscard]] AcquireStatus extractCores(std::string_view text, std::vector<CoreTicks>& out);

/* ----------------------------- /proc/cpuinfo, /proc/loadavg ----------------------------- */

/**
 * @brief Model and topology from /proc/cpuinfo text.
 * @return OK, or MALFORMED if the text has no processor entry.
 */
[[nodiscard]] AcquireStatus extractInfo(std::string_view text, cpu::CpuInfo& out);

/**
 * @brief Per-CPU clock in MHz from /proc/cpuinfo text.
 * @return OK; UNSUPPORTED if valid cpuinfo carries no "cpu MHz" (most ARM
 *         kernels); MALFORMED if the text is not cpuinfo at all.
 */
[[nodiscard]] AcquireStatus extractFrequencies(std::string_view text, std::vector<double>& out);

/**
 * @brief Load averages from /proc/loadavg text.
 * @return OK, or MALFORMED.
 */
[[nodiscard]] AcquireStatus extractLoadAverage(std::string_view text, cpu::LoadAverage& out);

} // namespace provider

} // namespace tickrate

#endif // TICKRATE_PROVIDER_PROC_STAT_TEXT_HPP
