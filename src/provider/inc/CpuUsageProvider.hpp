#ifndef TICKRATE_PROVIDER_CPU_USAGE_PROVIDER_HPP
#define TICKRATE_PROVIDER_CPU_USAGE_PROVIDER_HPP
/**
 * @file CpuUsageProvider.hpp
 * @brief CPU usage for one machine: a TicksSource plus its own rate baselines.
 * @note Thread-safe: Calls may overlap; the calculator serializes per key.
 *
 * Usage pattern:
 *   auto provider = makeCpuUsageProvider(config);
 *   double pct = 0.0;
 *   provider->totalUsage(pct);   // first call: 0 (warm-up)
 *   // ... caller waits ...
 *   provider->totalUsage(pct);   // usage over the interval
 *
 * A failed acquisition returns its AcquireStatus and leaves every baseline
 * as it was; the next successful call measures from the last good reading.
 * Per-core readings must be sorted by cpuId, unique and below cpu::MAX_CPUS;
 * anything else is MALFORMED whatever the source claimed.
 */

#include "src/cpu/inc/UsageRate.hpp"
#include "src/provider/inc/SourceFactory.hpp"
#include "src/provider/inc/TicksSource.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace tickrate {

namespace provider {

/* ----------------------------- Constants ----------------------------- */

/// Key for aggregate per-state tracking, separate from cpu::AGGREGATE_KEY.
inline constexpr const char* BREAKDOWN_KEY = "aggregate-breakdown";

/* ----------------------------- CoreUsage ----------------------------- */

/**
 * @brief Usage for one CPU.
 */
struct CoreUsage {
  std::size_t cpuId{0};
  cpu::UsageSample sample{};
};

/* ----------------------------- UsageReport ----------------------------- */

/**
 * @brief One consistent round: aggregate, per-state shares and per-core usage.
 */
struct UsageReport {
  cpu::UsageSample total{};
  cpu::CpuUsageBreakdown breakdown{};
  std::vector<CoreUsage> cores{};
};

/* ----------------------------- CpuUsageProvider ----------------------------- */

class CpuUsageProvider {
public:
  /// @param source Counter source (must be non-null); owned.
  explicit CpuUsageProvider(std::unique_ptr<TicksSource> source);

  CpuUsageProvider(const CpuUsageProvider&) = delete;
  CpuUsageProvider& operator=(const CpuUsageProvider&) = delete;

  /**
   * @brief Whole-machine usage since the previous successful call.
   * @param out Percent in [0, 100]; written only on OK.
   */
  [[nodiscard]] AcquireStatus totalUsage(double& out);

  /// As totalUsage(), with derivation status.
  [[nodiscard]] AcquireStatus totalUsageDetailed(cpu::UsageSample& out);

  /**
   * @brief Per-core usage indexed by cpuId.
   * @param out Sized to highest reported cpuId + 1; offline gaps read 0.
   */
  [[nodiscard]] AcquireStatus usage(std::vector<double>& out);

  /// Per-core usage with ids and derivation status, sorted by cpuId.
  [[nodiscard]] AcquireStatus usageDetailed(std::vector<CoreUsage>& out);

  /// Aggregate per-state shares since the previous breakdown call.
  [[nodiscard]] AcquireStatus usageBreakdown(cpu::CpuUsageBreakdown& out);

  /**
   * @brief Aggregate, breakdown and per-core usage from one round of reads.
   * @param out Populated on OK, untouched otherwise.
   * @note Both reads must succeed before any baseline moves, so the aggregate
   *       and per-core streams never drift a round apart.
   */
  [[nodiscard]] AcquireStatus report(UsageReport& out);

  /* ----------------------------- Pass-through ----------------------------- */

  /// Current per-CPU clock in MHz. No baseline involved.
  [[nodiscard]] AcquireStatus frequencies(std::vector<double>& out) {
    return source_->sampleFrequencies(out);
  }

  /// Processor model and topology.
  [[nodiscard]] AcquireStatus info(cpu::CpuInfo& out) { return source_->readInfo(out); }

  /// 1/5/15-minute load averages.
  [[nodiscard]] AcquireStatus loadAverage(cpu::LoadAverage& out) {
    return source_->sampleLoadAverage(out);
  }

  [[nodiscard]] const TicksSource& source() const noexcept { return *source_; }
  [[nodiscard]] const cpu::UsageRateCalculator& calculator() const noexcept { return calc_; }

private:
  /// Read per-core counters and reject unsorted, duplicate or out-of-range ids.
  [[nodiscard]] AcquireStatus acquireCores(std::vector<CoreTicks>& out);

  /// Feed validated readings to the calculator.
  [[nodiscard]] std::vector<CoreUsage> sampleCoreUsage(const std::vector<CoreTicks>& readings);

  std::unique_ptr<TicksSource> source_;
  cpu::UsageRateCalculator calc_;
};

/**
 * @brief Build a provider for config.
 * @return nullptr where makeTicksSource() would.
 */
[[nodiscard]] std::unique_ptr<CpuUsageProvider> makeCpuUsageProvider(const SourceConfig& config);

} // namespace provider

} // namespace tickrate

#endif // TICKRATE_PROVIDER_CPU_USAGE_PROVIDER_HPP
