/**
 * @file CpuUsageProvider.cpp
 * @brief Acquire-then-sample glue between a TicksSource and the rate engine.
 */

#include "src/provider/inc/CpuUsageProvider.hpp"

#include <utility> // std::move

namespace tickrate {

namespace provider {

CpuUsageProvider::CpuUsageProvider(std::unique_ptr<TicksSource> source)
    : source_(std::move(source)) {}

AcquireStatus CpuUsageProvider::totalUsage(double& out) {
  cpu::UsageSample sample{};
  const AcquireStatus STATUS = totalUsageDetailed(sample);
  if (STATUS == AcquireStatus::OK) {
    out = sample.percent;
  }
  return STATUS;
}

AcquireStatus CpuUsageProvider::totalUsageDetailed(cpu::UsageSample& out) {
  cpu::CpuTicks ticks{};
  const AcquireStatus STATUS = source_->sampleAggregate(ticks);
  if (STATUS != AcquireStatus::OK) {
    return STATUS;
  }
  out = calc_.sampleDetailed(cpu::AGGREGATE_KEY, ticks);
  return AcquireStatus::OK;
}

AcquireStatus CpuUsageProvider::usage(std::vector<double>& out) {
  std::vector<CoreUsage> cores;
  const AcquireStatus STATUS = usageDetailed(cores);
  if (STATUS != AcquireStatus::OK) {
    return STATUS;
  }

  // cores is sorted, unique, non-empty and below MAX_CPUS on OK
  out.assign(cores.back().cpuId + 1, 0.0);
  for (const CoreUsage& core : cores) {
    out[core.cpuId] = core.sample.percent;
  }
  return AcquireStatus::OK;
}

AcquireStatus CpuUsageProvider::acquireCores(std::vector<CoreTicks>& out) {
  std::vector<CoreTicks> readings;
  const AcquireStatus STATUS = source_->sampleCores(readings);
  if (STATUS != AcquireStatus::OK) {
    return STATUS;
  }
  if (readings.empty() || readings.back().cpuId >= cpu::MAX_CPUS) {
    return AcquireStatus::MALFORMED;
  }
  for (std::size_t i = 1; i < readings.size(); ++i) {
    if (readings[i].cpuId <= readings[i - 1].cpuId) {
      return AcquireStatus::MALFORMED;
    }
  }
  out = std::move(readings);
  return AcquireStatus::OK;
}

std::vector<CoreUsage> CpuUsageProvider::sampleCoreUsage(const std::vector<CoreTicks>& readings) {
  std::vector<CoreUsage> result;
  result.reserve(readings.size());
  for (const CoreTicks& reading : readings) {
    result.push_back(
        CoreUsage{reading.cpuId, calc_.sampleDetailed(cpu::coreKey(reading.cpuId), reading.ticks)});
  }
  return result;
}

AcquireStatus CpuUsageProvider::usageDetailed(std::vector<CoreUsage>& out) {
  std::vector<CoreTicks> readings;
  const AcquireStatus STATUS = acquireCores(readings);
  if (STATUS != AcquireStatus::OK) {
    return STATUS;
  }
  out = sampleCoreUsage(readings);
  return AcquireStatus::OK;
}

AcquireStatus CpuUsageProvider::usageBreakdown(cpu::CpuUsageBreakdown& out) {
  cpu::CpuTicks ticks{};
  const AcquireStatus STATUS = source_->sampleAggregate(ticks);
  if (STATUS != AcquireStatus::OK) {
    return STATUS;
  }
  out = calc_.sampleBreakdown(BREAKDOWN_KEY, ticks);
  return AcquireStatus::OK;
}

AcquireStatus CpuUsageProvider::report(UsageReport& out) {
  cpu::CpuTicks aggregate{};
  const AcquireStatus AGG = source_->sampleAggregate(aggregate);
  if (AGG != AcquireStatus::OK) {
    return AGG;
  }
  std::vector<CoreTicks> readings;
  const AcquireStatus CORES = acquireCores(readings);
  if (CORES != AcquireStatus::OK) {
    return CORES;
  }

  UsageReport result{};
  result.total = calc_.sampleDetailed(cpu::AGGREGATE_KEY, aggregate);
  result.breakdown = calc_.sampleBreakdown(BREAKDOWN_KEY, aggregate);
  result.cores = sampleCoreUsage(readings);
  out = std::move(result);
  return AcquireStatus::OK;
}

std::unique_ptr<CpuUsageProvider> makeCpuUsageProvider(const SourceConfig& config) {
  std::unique_ptr<TicksSource> source = makeTicksSource(config);
  if (!source) {
    return nullptr;
  }
  return std::make_unique<CpuUsageProvider>(std::move(source));
}

} // namespace provider

} // namespace tickrate
