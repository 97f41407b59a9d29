/**
 * @file ProcStatText.cpp
 * @brief Line-level walk over /proc/stat text.
 */

#include "src/provider/inc/ProcStatText.hpp"

#include "src/cpu/inc/ProcStat.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm> // std::sort, std::adjacent_find
#include <utility>   // std::move

namespace tickrate {

namespace provider {

using cpu::AGGREGATE_CPU_ID;
using cpu::CpuTicks;
using cpu::parseProcStatLine;
using cpu::ProcStatLine;
using helpers::strings::forEachLine;

AcquireStatus extractAggregate(std::string_view text, CpuTicks& out) {
  bool found = false;
  bool malformed = false;
  CpuTicks ticks{};

  forEachLine(text, [&](std::string_view line) {
    if (found || malformed) {
      return;
    }
    CpuTicks parsed{};
    int cpuId = 0;
    const ProcStatLine KIND = parseProcStatLine(line, parsed, cpuId);
    if (KIND == ProcStatLine::MALFORMED) {
      malformed = true;
    } else if (KIND == ProcStatLine::CPU && cpuId == AGGREGATE_CPU_ID) {
      ticks = parsed;
      found = true;
    }
  });

  if (malformed || !found) {
    return AcquireStatus::MALFORMED;
  }
  out = ticks;
  return AcquireStatus::OK;
}

AcquireStatus extractCores(std::string_view text, std::vector<CoreTicks>& out) {
  std::vector<CoreTicks> cores;
  bool malformed = false;

  forEachLine(text, [&](std::string_view line) {
    if (malformed) {
      return;
    }
    CpuTicks parsed{};
    int cpuId = 0;
    const ProcStatLine KIND = parseProcStatLine(line, parsed, cpuId);
    if (KIND == ProcStatLine::MALFORMED) {
      malformed = true;
    } else if (KIND == ProcStatLine::CPU && cpuId != AGGREGATE_CPU_ID) {
      cores.push_back(CoreTicks{static_cast<std::size_t>(cpuId), parsed});
    }
  });

  if (malformed || cores.empty()) {
    return AcquireStatus::MALFORMED;
  }

  std::sort(cores.begin(), cores.end(),
            [](const CoreTicks& a, const CoreTicks& b) { return a.cpuId < b.cpuId; });

  // A repeated cpuN would make two readings compete for one baseline
  const auto DUP = std::adjacent_find(cores.begin(), cores.end(),
                                      [](const CoreTicks& a, const CoreTicks& b) {
                                        return a.cpuId == b.cpuId;
                                      });
  if (DUP != cores.end()) {
    return AcquireStatus::MALFORMED;
  }

  out = std::move(cores);
  return AcquireStatus::OK;
}

/* ----------------------------- /proc/cpuinfo, /proc/loadavg ----------------------------- */

AcquireStatus extractInfo(std::string_view text, cpu::CpuInfo& out) {
  return cpu::parseCpuInfoText(text, out) ? AcquireStatus::OK : AcquireStatus::MALFORMED;
}

AcquireStatus extractFrequencies(std::string_view text, std::vector<double>& out) {
  if (cpu::parseCpuFrequencies(text, out)) {
    return AcquireStatus::OK;
  }
  cpu::CpuInfo info{};
  return cpu::parseCpuInfoText(text, info) ? AcquireStatus::UNSUPPORTED : AcquireStatus::MALFORMED;
}

AcquireStatus extractLoadAverage(std::string_view text, cpu::LoadAverage& out) {
  return cpu::parseLoadAverage(text, out) ? AcquireStatus::OK : AcquireStatus::MALFORMED;
}

} // namespace provider

} // namespace tickrate
