/**
 * @file ProcStat.cpp
 * @brief /proc/stat cpu line parsing.
 */

#include "src/cpu/inc/ProcStat.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <array>   // std::array
#include <cstdint> // std::uint64_t
#include <cstring> // memcpy

namespace tickrate {

namespace cpu {

namespace {

using tickrate::helpers::strings::nextUint64;
using tickrate::helpers::strings::skipWhitespace;

/// Longest cpu line we accept: 10 x 20-digit fields plus label and separators.
constexpr std::size_t MAX_LINE = 320;

} // namespace

/* ----------------------------- API ----------------------------- */

ProcStatLine parseProcStatLine(std::string_view line, CpuTicks& out, int& cpuId) noexcept {
  if (line.substr(0, 3) != "cpu") {
    return ProcStatLine::OTHER;
  }
  if (line.size() >= MAX_LINE) {
    return ProcStatLine::MALFORMED;
  }

  // strtoull needs a terminator; views into larger buffers have none
  std::array<char, MAX_LINE> buf{};
  std::memcpy(buf.data(), line.data(), line.size());
  buf[line.size()] = '\0';

  const char* ptr = buf.data() + 3;
  int id = AGGREGATE_CPU_ID;

  if (*ptr >= '0' && *ptr <= '9') {
    std::uint64_t parsed = 0;
    if (!nextUint64(ptr, parsed) || parsed >= MAX_CPUS) {
      return ProcStatLine::MALFORMED;
    }
    id = static_cast<int>(parsed);
  } else if (*ptr == '\0' || *ptr == '\n' || *ptr == '\r') {
    return ProcStatLine::MALFORMED;
  } else if (*ptr != ' ' && *ptr != '\t') {
    // "cpufreq" and similar are not counter lines
    return ProcStatLine::OTHER;
  }

  std::array<std::uint64_t, 10> vals{};
  std::size_t fields = 0;
  while (fields < vals.size() && nextUint64(ptr, vals[fields])) {
    ++fields;
  }

  if (fields < PROC_STAT_MIN_FIELDS) {
    return ProcStatLine::MALFORMED;
  }

  // Newer kernels may append columns beyond guest_nice
  std::uint64_t extra = 0;
  while (nextUint64(ptr, extra)) {
  }

  ptr = skipWhitespace(ptr);
  if (*ptr != '\0' && *ptr != '\n' && *ptr != '\r') {
    return ProcStatLine::MALFORMED;
  }

  out = CpuTicks{};
  out.user = vals[0];
  out.nice = vals[1];
  out.system = vals[2];
  out.idle = vals[3];
  out.iowait = vals[4];
  out.irq = vals[5];
  out.softirq = vals[6];
  out.steal = vals[7];
  out.guest = vals[8];
  out.guestNice = vals[9];
  cpuId = id;

  return ProcStatLine::CPU;
}

} // namespace cpu

} // namespace tickrate
