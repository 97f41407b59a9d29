/**
 * @file CpuTicks.cpp
 * @brief CpuTicks arithmetic and tracking keys.
 */

#include "src/cpu/inc/CpuTicks.hpp"

#include <fmt/core.h>

namespace tickrate {

namespace cpu {

/* ----------------------------- CpuTicks ----------------------------- */

std::uint64_t CpuTicks::total() const noexcept {
  return user + nice + system + idle + iowait + irq + softirq + steal;
}

std::uint64_t CpuTicks::idleTotal() const noexcept { return idle + iowait; }

std::uint64_t CpuTicks::busy() const noexcept {
  const std::uint64_t TOTAL = total();
  const std::uint64_t IDLE = idleTotal();
  return (TOTAL >= IDLE) ? (TOTAL - IDLE) : 0;
}

std::string CpuTicks::toString() const {
  return fmt::format("user={} nice={} sys={} idle={} iowait={} irq={} softirq={} steal={} "
                     "total={}",
                     user, nice, system, idle, iowait, irq, softirq, steal, total());
}

/* ----------------------------- Keys ----------------------------- */

std::string coreKey(std::size_t cpuId) { return fmt::format("{}{}", CORE_KEY_PREFIX, cpuId); }

bool parseCoreKey(std::string_view key, std::size_t& cpuId) noexcept {
  if (key.size() <= CORE_KEY_PREFIX.size() || key.substr(0, CORE_KEY_PREFIX.size()) != CORE_KEY_PREFIX) {
    return false;
  }

  std::size_t value = 0;
  for (const char C : key.substr(CORE_KEY_PREFIX.size())) {
    if (C < '0' || C > '9') {
      return false;
    }
    value = value * 10 + static_cast<std::size_t>(C - '0');
    if (value >= MAX_CPUS) {
      return false;
    }
  }

  cpuId = value;
  return true;
}

} // namespace cpu

} // namespace tickrate
