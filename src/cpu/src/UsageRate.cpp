/**
 * @file UsageRate.cpp
 * @brief Usage percent from tick deltas, with warm-up and regression handling.
 */

#include "src/cpu/inc/UsageRate.hpp"

#include <algorithm> // std::clamp
#include <optional>

#include <fmt/core.h>

namespace tickrate {

namespace cpu {

namespace {

/// True if either counter the percent depends on moved backward.
inline bool isRegression(const CpuTicks& prior, const CpuTicks& current) noexcept {
  return current.total() < prior.total() || current.idleTotal() < prior.idleTotal();
}

inline double clampPercent(double pct) noexcept {
  return std::clamp(pct, USAGE_MIN_PERCENT, USAGE_MAX_PERCENT);
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(RateStatus status) noexcept {
  switch (status) {
  case RateStatus::OK:
    return "OK";
  case RateStatus::WARM_UP:
    return "WARM_UP";
  case RateStatus::NO_ELAPSED:
    return "NO_ELAPSED";
  case RateStatus::COUNTER_REGRESSION:
    return "COUNTER_REGRESSION";
  }
  return "UNKNOWN";
}

std::string UsageSample::toString() const {
  return fmt::format("{:.1f}% ({})", percent, cpu::toString(status));
}

/* ----------------------------- CpuUsageBreakdown ----------------------------- */

double CpuUsageBreakdown::active() const noexcept {
  return clampPercent(user + nice + system + irq + softirq + steal);
}

std::string CpuUsageBreakdown::toString() const {
  return fmt::format("{:.1f}% active (user={:.1f}% nice={:.1f}% sys={:.1f}% idle={:.1f}% "
                     "iowait={:.1f}% irq={:.1f}% softirq={:.1f}% steal={:.1f}%)",
                     active(), user, nice, system, idle, iowait, irq, softirq, steal);
}

/* ----------------------------- Pure API ----------------------------- */

double computeUsagePercent(const CpuTicks& prior, const CpuTicks& current,
                           RateStatus* status) noexcept {
  auto finish = [status](RateStatus s, double pct) noexcept {
    if (status != nullptr) {
      *status = s;
    }
    return pct;
  };

  if (isRegression(prior, current)) {
    return finish(RateStatus::COUNTER_REGRESSION, 0.0);
  }

  const std::uint64_t TOTAL_DELTA = current.total() - prior.total();
  if (TOTAL_DELTA == 0) {
    return finish(RateStatus::NO_ELAPSED, 0.0);
  }

  const std::uint64_t IDLE_DELTA = current.idleTotal() - prior.idleTotal();

  // IDLE_DELTA > TOTAL_DELTA happens when a busy state is revised downward
  // between reads; the clamp pins that to 0
  const double IDLE_SHARE = static_cast<double>(IDLE_DELTA) / static_cast<double>(TOTAL_DELTA);
  return finish(RateStatus::OK, clampPercent((1.0 - IDLE_SHARE) * 100.0));
}

CpuUsageBreakdown computeBreakdown(const CpuTicks& prior, const CpuTicks& current) noexcept {
  CpuUsageBreakdown pct{};

  if (isRegression(prior, current) || current.total() == prior.total()) {
    return pct;
  }

  const double TOTAL_DELTA = static_cast<double>(current.total() - prior.total());

  auto share = [TOTAL_DELTA](std::uint64_t before, std::uint64_t after) noexcept {
    return (after >= before)
               ? clampPercent(static_cast<double>(after - before) * 100.0 / TOTAL_DELTA)
               : 0.0;
  };

  pct.user = share(prior.user, current.user);
  pct.nice = share(prior.nice, current.nice);
  pct.system = share(prior.system, current.system);
  pct.idle = share(prior.idle, current.idle);
  pct.iowait = share(prior.iowait, current.iowait);
  pct.irq = share(prior.irq, current.irq);
  pct.softirq = share(prior.softirq, current.softirq);
  pct.steal = share(prior.steal, current.steal);

  return pct;
}

/* ----------------------------- UsageRateCalculator ----------------------------- */

double UsageRateCalculator::sample(std::string_view key, const CpuTicks& ticks) {
  return sampleDetailed(key, ticks).percent;
}

UsageSample UsageRateCalculator::sampleDetailed(std::string_view key, const CpuTicks& ticks) {
  UsageSample out{};

  const std::optional<CpuTicks> PRIOR = store_.exchange(key, ticks);
  if (!PRIOR) {
    out.status = RateStatus::WARM_UP;
    return out;
  }

  out.percent = computeUsagePercent(*PRIOR, ticks, &out.status);
  return out;
}

CpuUsageBreakdown UsageRateCalculator::sampleBreakdown(std::string_view key,
                                                       const CpuTicks& ticks) {
  const std::optional<CpuTicks> PRIOR = store_.exchange(key, ticks);
  if (!PRIOR) {
    return CpuUsageBreakdown{};
  }
  return computeBreakdown(*PRIOR, ticks);
}

} // namespace cpu

} // namespace tickrate
