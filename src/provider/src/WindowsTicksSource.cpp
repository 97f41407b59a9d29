/**
 * @file WindowsTicksSource.cpp
 * @brief GetSystemTimes / NtQuerySystemInformation reader, registry identity.
 * @note Links ntdll (NtQuerySystemInformation) and advapi32 (RegGetValueA).
 */

#include "src/provider/inc/WindowsTicksSource.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <utility> // std::move

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include <winternl.h> // NtQuerySystemInformation, SYSTEM_PROCESSOR_PERFORMANCE_INFORMATION

#include <array> // std::array

#include <fmt/core.h>
#endif

namespace tickrate {

namespace provider {

bool windowsTimesToTicks(std::uint64_t idle, std::uint64_t kernel, std::uint64_t user,
                         cpu::CpuTicks& out) noexcept {
  if (idle > kernel) {
    return false;
  }
  out = cpu::CpuTicks{};
  out.user = user;
  out.system = kernel - idle;
  out.idle = idle;
  return true;
}

#if defined(_WIN32)

namespace {

inline std::uint64_t toU64(const FILETIME& ft) noexcept {
  ULARGE_INTEGER u;
  u.LowPart = ft.dwLowDateTime;
  u.HighPart = ft.dwHighDateTime;
  return static_cast<std::uint64_t>(u.QuadPart);
}

inline std::uint64_t toU64(const LARGE_INTEGER& li) noexcept {
  return static_cast<std::uint64_t>(li.QuadPart);
}

/// Registry key describing logical processor n.
std::string processorKey(DWORD n) {
  return fmt::format("HARDWARE\\DESCRIPTION\\System\\CentralProcessor\\{}", n);
}

bool regString(const std::string& subkey, const char* value, std::string& out) {
  std::array<char, 256> buf{};
  DWORD size = static_cast<DWORD>(buf.size());
  if (::RegGetValueA(HKEY_LOCAL_MACHINE, subkey.c_str(), value, RRF_RT_REG_SZ, nullptr, buf.data(),
                     &size) != ERROR_SUCCESS) {
    return false;
  }
  // ProcessorNameString is padded with spaces on some parts
  out = std::string(helpers::strings::trim(buf.data()));
  return true;
}

bool regDword(const std::string& subkey, const char* value, DWORD& out) noexcept {
  DWORD size = sizeof(out);
  return ::RegGetValueA(HKEY_LOCAL_MACHINE, subkey.c_str(), value, RRF_RT_REG_DWORD, nullptr, &out,
                        &size) == ERROR_SUCCESS;
}

std::size_t countBits(ULONG_PTR mask) noexcept {
  std::size_t n = 0;
  for (; mask != 0; mask &= mask - 1) {
    ++n;
  }
  return n;
}

} // namespace

AcquireStatus WindowsTicksSource::sampleAggregate(cpu::CpuTicks& out) {
  FILETIME idle{};
  FILETIME kernel{};
  FILETIME user{};
  if (!::GetSystemTimes(&idle, &kernel, &user)) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }

  cpu::CpuTicks ticks{};
  if (!windowsTimesToTicks(toU64(idle), toU64(kernel), toU64(user), ticks)) {
    return AcquireStatus::MALFORMED;
  }
  out = ticks;
  return AcquireStatus::OK;
}

AcquireStatus WindowsTicksSource::sampleCores(std::vector<CoreTicks>& out) {
  SYSTEM_INFO sysInfo{};
  ::GetSystemInfo(&sysInfo);
  const DWORD COUNT = sysInfo.dwNumberOfProcessors;
  if (COUNT == 0) {
    return AcquireStatus::MALFORMED;
  }

  std::vector<SYSTEM_PROCESSOR_PERFORMANCE_INFORMATION> info(COUNT);
  ULONG returned = 0;
  const NTSTATUS RC = ::NtQuerySystemInformation(
      SystemProcessorPerformanceInformation, info.data(),
      static_cast<ULONG>(info.size() * sizeof(info[0])), &returned);
  if (RC < 0) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }

  const std::size_t REPORTED = returned / sizeof(info[0]);
  if (REPORTED == 0) {
    return AcquireStatus::MALFORMED;
  }

  std::vector<CoreTicks> cores;
  cores.reserve(REPORTED);
  for (std::size_t i = 0; i < REPORTED; ++i) {
    CoreTicks core{};
    core.cpuId = i;
    if (!windowsTimesToTicks(toU64(info[i].IdleTime), toU64(info[i].KernelTime),
                             toU64(info[i].UserTime), core.ticks)) {
      return AcquireStatus::MALFORMED;
    }
    cores.push_back(core);
  }

  out = std::move(cores);
  return AcquireStatus::OK;
}

AcquireStatus WindowsTicksSource::sampleFrequencies(std::vector<double>& out) {
  SYSTEM_INFO sysInfo{};
  ::GetSystemInfo(&sysInfo);
  const DWORD COUNT = sysInfo.dwNumberOfProcessors;

  std::vector<double> mhz;
  mhz.reserve(COUNT);
  for (DWORD i = 0; i < COUNT; ++i) {
    DWORD value = 0;
    if (!regDword(processorKey(i), "~MHz", value)) {
      return i == 0 ? AcquireStatus::UNSUPPORTED : AcquireStatus::SOURCE_UNAVAILABLE;
    }
    mhz.push_back(static_cast<double>(value));
  }
  if (mhz.empty()) {
    return AcquireStatus::MALFORMED;
  }

  out = std::move(mhz);
  return AcquireStatus::OK;
}

AcquireStatus WindowsTicksSource::readInfo(cpu::CpuInfo& out) {
  cpu::CpuInfo info{};
  const std::string KEY0 = processorKey(0);
  if (!regString(KEY0, "ProcessorNameString", info.model)) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  if (!regString(KEY0, "VendorIdentifier", info.vendor)) {
    info.vendor.clear();
  }

  DWORD bytes = 0;
  ::GetLogicalProcessorInformation(nullptr, &bytes);
  if (::GetLastError() != ERROR_INSUFFICIENT_BUFFER || bytes == 0) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  std::vector<SYSTEM_LOGICAL_PROCESSOR_INFORMATION> slpi(
      bytes / sizeof(SYSTEM_LOGICAL_PROCESSOR_INFORMATION));
  if (!::GetLogicalProcessorInformation(slpi.data(), &bytes)) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  slpi.resize(bytes / sizeof(SYSTEM_LOGICAL_PROCESSOR_INFORMATION));

  for (const SYSTEM_LOGICAL_PROCESSOR_INFORMATION& entry : slpi) {
    if (entry.Relationship == RelationProcessorCore) {
      ++info.cores;
      info.threads += countBits(entry.ProcessorMask);
    } else if (entry.Relationship == RelationCache && entry.Cache.Size > info.cacheBytes) {
      info.cacheBytes = entry.Cache.Size;
    }
  }
  if (info.cores == 0) {
    return AcquireStatus::MALFORMED;
  }

  out = std::move(info);
  return AcquireStatus::OK;
}

#endif // _WIN32

} // namespace provider

} // namespace tickrate
