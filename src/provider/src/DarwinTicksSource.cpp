/**
 * @file DarwinTicksSource.cpp
 * @brief Mach host_statistics / host_processor_info reader, sysctl identity.
 */

#include "src/provider/inc/DarwinTicksSource.hpp"

#include <utility> // std::move

#if defined(__APPLE__)
#include <mach/mach.h>
#include <mach/processor_info.h>
#include <stdlib.h>     // getloadavg
#include <sys/sysctl.h> // sysctlbyname

#include <array>   // std::array
#include <cstring> // memcpy, strnlen
#endif

namespace tickrate {

namespace provider {

cpu::CpuTicks machTicksToCpuTicks(std::uint64_t user, std::uint64_t system, std::uint64_t idle,
                                  std::uint64_t nice) noexcept {
  cpu::CpuTicks t{};
  t.user = user;
  t.system = system;
  t.idle = idle;
  t.nice = nice;
  return t;
}

std::vector<double> hzToMhzPerCpu(std::uint64_t hz, std::size_t cpus) {
  return std::vector<double>(cpus, static_cast<double>(hz) / 1'000'000.0);
}

#if defined(__APPLE__)

namespace {

/// Integer sysctl of either width.
bool sysctlUint(const char* name, std::uint64_t& out) noexcept {
  std::uint64_t val64 = 0;
  std::size_t len = sizeof(val64);
  if (::sysctlbyname(name, &val64, &len, nullptr, 0) != 0) {
    return false;
  }
  if (len == sizeof(std::uint32_t)) {
    std::uint32_t val32 = 0;
    std::memcpy(&val32, &val64, sizeof(val32));
    out = val32;
    return true;
  }
  if (len != sizeof(val64)) {
    return false;
  }
  out = val64;
  return true;
}

bool sysctlString(const char* name, std::string& out) {
  std::array<char, 256> buf{};
  std::size_t len = buf.size();
  if (::sysctlbyname(name, buf.data(), &len, nullptr, 0) != 0 || len == 0) {
    return false;
  }
  out.assign(buf.data(), ::strnlen(buf.data(), len));
  return true;
}

} // namespace

AcquireStatus DarwinTicksSource::sampleAggregate(cpu::CpuTicks& out) {
  host_cpu_load_info_data_t info{};
  mach_msg_type_number_t count = HOST_CPU_LOAD_INFO_COUNT;

  const kern_return_t KR = ::host_statistics(::mach_host_self(), HOST_CPU_LOAD_INFO,
                                             reinterpret_cast<host_info_t>(&info), &count);
  if (KR != KERN_SUCCESS) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }

  out = machTicksToCpuTicks(info.cpu_ticks[CPU_STATE_USER], info.cpu_ticks[CPU_STATE_SYSTEM],
                            info.cpu_ticks[CPU_STATE_IDLE], info.cpu_ticks[CPU_STATE_NICE]);
  return AcquireStatus::OK;
}

AcquireStatus DarwinTicksSource::sampleCores(std::vector<CoreTicks>& out) {
  natural_t cpuCount = 0;
  processor_info_array_t infoArray = nullptr;
  mach_msg_type_number_t infoCount = 0;

  const kern_return_t KR = ::host_processor_info(::mach_host_self(), PROCESSOR_CPU_LOAD_INFO,
                                                 &cpuCount, &infoArray, &infoCount);
  if (KR != KERN_SUCCESS) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }

  std::vector<CoreTicks> cores;
  cores.reserve(cpuCount);
  const auto* load = reinterpret_cast<processor_cpu_load_info_t>(infoArray);
  for (natural_t i = 0; i < cpuCount; ++i) {
    CoreTicks core{};
    core.cpuId = i;
    core.ticks = machTicksToCpuTicks(
        load[i].cpu_ticks[CPU_STATE_USER], load[i].cpu_ticks[CPU_STATE_SYSTEM],
        load[i].cpu_ticks[CPU_STATE_IDLE], load[i].cpu_ticks[CPU_STATE_NICE]);
    cores.push_back(core);
  }

  ::vm_deallocate(::mach_task_self(), reinterpret_cast<vm_address_t>(infoArray),
                  static_cast<vm_size_t>(infoCount) * sizeof(integer_t));

  if (cores.empty()) {
    return AcquireStatus::MALFORMED;
  }
  out = std::move(cores);
  return AcquireStatus::OK;
}

AcquireStatus DarwinTicksSource::sampleFrequencies(std::vector<double>& out) {
  std::uint64_t hz = 0;
  if (!sysctlUint("hw.cpufrequency", hz) && !sysctlUint("hw.cpufrequency_max", hz)) {
    return AcquireStatus::UNSUPPORTED;
  }
  std::uint64_t cpus = 0;
  if (!sysctlUint("hw.logicalcpu", cpus) || cpus == 0) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  out = hzToMhzPerCpu(hz, static_cast<std::size_t>(cpus));
  return AcquireStatus::OK;
}

AcquireStatus DarwinTicksSource::readInfo(cpu::CpuInfo& out) {
  cpu::CpuInfo info{};
  if (!sysctlString("machdep.cpu.brand_string", info.model)) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  // Apple silicon has no vendor string
  if (!sysctlString("machdep.cpu.vendor", info.vendor)) {
    info.vendor.clear();
  }

  std::uint64_t cores = 0;
  std::uint64_t threads = 0;
  if (!sysctlUint("hw.physicalcpu", cores) || !sysctlUint("hw.logicalcpu", threads)) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  info.cores = static_cast<std::size_t>(cores);
  info.threads = static_cast<std::size_t>(threads);

  std::uint64_t cache = 0;
  if (sysctlUint("hw.l3cachesize", cache) || sysctlUint("hw.l2cachesize", cache)) {
    info.cacheBytes = cache;
  }

  out = std::move(info);
  return AcquireStatus::OK;
}

AcquireStatus DarwinTicksSource::sampleLoadAverage(cpu::LoadAverage& out) {
  std::array<double, 3> loads{};
  if (::getloadavg(loads.data(), 3) != 3) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  out.load1 = loads[0];
  out.load5 = loads[1];
  out.load15 = loads[2];
  return AcquireStatus::OK;
}

#endif // __APPLE__

} // namespace provider

} // namespace tickrate
