#ifndef TICKRATE_CPU_USAGE_RATE_HPP
#define TICKRATE_CPU_USAGE_RATE_HPP
/**
 * @file UsageRate.hpp
 * @brief Counter-to-rate conversion: CPU usage percent from successive tick tuples.
 * @note Thread-safe: UsageRateCalculator may be shared by concurrent callers.
 *       The free functions are pure.
 *
 * Design: Stateful wrapper over a pure delta.
 *  - computeUsagePercent() turns (prior, current) into a percent (pure)
 *  - UsageRateCalculator keeps the prior per key in its SnapshotStore
 *  - Callers decide when to sample; nothing here performs I/O or blocks
 *    beyond the store's mutex
 *
 * Policy for each sample(key, ticks):
 *  - No baseline yet          -> 0, WARM_UP
 *  - total or idle went down  -> 0, COUNTER_REGRESSION (host reboot, counter reset)
 *  - total unchanged          -> 0, NO_ELAPSED
 *  - otherwise                -> (1 - dIdle / dTotal) * 100, clamped to [0, 100]
 * In every case ticks becomes the new baseline for key.
 */

#include "src/cpu/inc/CpuTicks.hpp"
#include "src/cpu/inc/SnapshotStore.hpp"

#include <string>
#include <string_view>

namespace tickrate {

namespace cpu {

/* ----------------------------- Constants ----------------------------- */

inline constexpr double USAGE_MIN_PERCENT = 0.0;
inline constexpr double USAGE_MAX_PERCENT = 100.0;

/* ----------------------------- RateStatus ----------------------------- */

/**
 * @brief How a usage value was derived. Only OK carries a measured rate.
 */
enum class RateStatus : unsigned char {
  OK = 0,             ///< Rate computed from a valid interval
  WARM_UP,            ///< First sample for the key; baseline established
  NO_ELAPSED,         ///< Counters unchanged since the baseline
  COUNTER_REGRESSION, ///< Counters went backward; re-baselined
};

/**
 * @brief Human-readable status string.
 * @note RT-safe: Returns static string pointer.
 */
[[nodiscard]] const char* toString(RateStatus status) noexcept;

/* ----------------------------- Results ----------------------------- */

/**
 * @brief Usage percent plus how it was obtained.
 */
struct UsageSample {
  double percent{0.0};                  ///< 0-100; 0 whenever status != OK
  RateStatus status{RateStatus::WARM_UP}; ///< Derivation outcome

  /// True if percent reflects a measured interval.
  [[nodiscard]] bool valid() const noexcept { return status == RateStatus::OK; }

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Per-state share of an interval (0-100 scale).
 */
struct CpuUsageBreakdown {
  double user{0.0};    ///< User mode percentage
  double nice{0.0};    ///< Nice user mode percentage
  double system{0.0};  ///< Kernel mode percentage
  double idle{0.0};    ///< Idle percentage
  double iowait{0.0};  ///< I/O wait percentage
  double irq{0.0};     ///< Hardware IRQ percentage
  double softirq{0.0}; ///< Software IRQ percentage
  double steal{0.0};   ///< Hypervisor steal percentage

  /// Combined busy share (excludes idle and iowait), clamped to 100.
  [[nodiscard]] double active() const noexcept;

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Pure API ----------------------------- */

/**
 * @brief Usage percent between two tick tuples.
 * @param prior Baseline reading.
 * @param current Later reading.
 * @param status Optional out: derivation outcome (never WARM_UP).
 * @return Percent in [0, 100]; 0 on regression or zero elapsed.
 * @note RT-safe: Pure computation, no allocation.
 */
[[nodiscard]] double computeUsagePercent(const CpuTicks& prior, const CpuTicks& current,
                                         RateStatus* status = nullptr) noexcept;

/**
 * @brief Per-state breakdown between two tick tuples.
 * @return All zeros on regression or zero elapsed.
 * @note RT-safe: Pure computation, no allocation.
 */
[[nodiscard]] CpuUsageBreakdown computeBreakdown(const CpuTicks& prior,
                                                 const CpuTicks& current) noexcept;

/* ----------------------------- UsageRateCalculator ----------------------------- */

/**
 * @brief Keyed usage-rate tracker owning its baselines.
 *
 * Keys are independent streams (AGGREGATE_KEY, coreKey(n), ...). A key seen
 * for the first time, e.g. a core that came online between samples, starts
 * in warm-up without affecting any other key.
 */
class UsageRateCalculator {
public:
  UsageRateCalculator() = default;
  UsageRateCalculator(const UsageRateCalculator&) = delete;
  UsageRateCalculator& operator=(const UsageRateCalculator&) = delete;

  /**
   * @brief Record ticks for key and return usage since the previous sample.
   * @return Percent in [0, 100]; 0 for warm-up, regression, or zero elapsed.
   */
  [[nodiscard]] double sample(std::string_view key, const CpuTicks& ticks);

  /// As sample(), also reporting how the value was derived.
  [[nodiscard]] UsageSample sampleDetailed(std::string_view key, const CpuTicks& ticks);

  /**
   * @brief Record ticks for key and return the per-state breakdown.
   * @return All zeros unless a valid interval exists.
   *
   * Use a key distinct from the one passed to sample() for the same source,
   * otherwise each call shortens the other's interval.
   */
  [[nodiscard]] CpuUsageBreakdown sampleBreakdown(std::string_view key, const CpuTicks& ticks);

  /// Forget the baseline for key; its next sample is a warm-up.
  void reset(std::string_view key) { store_.erase(key); }

  /// Forget all baselines.
  void resetAll() { store_.clear(); }

  /// Baselines backing this calculator.
  [[nodiscard]] const SnapshotStore& store() const noexcept { return store_; }

private:
  SnapshotStore store_;
};

} // namespace cpu

} // namespace tickrate

#endif // TICKRATE_CPU_USAGE_RATE_HPP
