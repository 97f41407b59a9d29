/**
 * @file CpuSet.cpp
 * @brief CpuSet members and CPU list parser.
 */

#include "src/cpu/inc/CpuSet.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <cstdint>

#include <fmt/core.h>

namespace tickrate {

namespace cpu {

using helpers::strings::trim;

/* ----------------------------- CpuSet ----------------------------- */

bool CpuSet::test(std::size_t cpuId) const noexcept { return cpuId < MAX_CPUS && mask.test(cpuId); }

void CpuSet::set(std::size_t cpuId) noexcept {
  if (cpuId < MAX_CPUS) {
    mask.set(cpuId);
  }
}

std::string CpuSet::toString() const {
  std::string out;
  std::size_t i = 0;
  while (i < MAX_CPUS) {
    if (!mask.test(i)) {
      ++i;
      continue;
    }
    std::size_t last = i;
    while (last + 1 < MAX_CPUS && mask.test(last + 1)) {
      ++last;
    }
    if (!out.empty()) {
      out += ',';
    }
    out += (last == i) ? fmt::format("{}", i) : fmt::format("{}-{}", i, last);
    i = last + 1;
  }
  return out;
}

/* ----------------------------- Parser ----------------------------- */

namespace {

/// Parse a decimal id < MAX_CPUS occupying all of s.
bool parseId(std::string_view s, std::size_t& id) noexcept {
  if (s.empty()) {
    return false;
  }
  std::uint64_t val = 0;
  for (const char C : s) {
    if (C < '0' || C > '9') {
      return false;
    }
    val = val * 10 + static_cast<std::uint64_t>(C - '0');
    if (val >= MAX_CPUS) {
      return false;
    }
  }
  id = static_cast<std::size_t>(val);
  return true;
}

} // namespace

bool parseCpuList(std::string_view list, CpuSet& out) noexcept {
  list = trim(list);
  if (list.empty()) {
    return false;
  }

  CpuSet result{};
  while (!list.empty()) {
    const std::size_t COMMA = list.find(',');
    const std::string_view ITEM =
        trim(COMMA == std::string_view::npos ? list : list.substr(0, COMMA));
    list = (COMMA == std::string_view::npos) ? std::string_view{} : list.substr(COMMA + 1);

    std::size_t first = 0;
    std::size_t last = 0;
    const std::size_t DASH = ITEM.find('-');
    if (DASH == std::string_view::npos) {
      if (!parseId(ITEM, first)) {
        return false;
      }
      last = first;
    } else if (!parseId(trim(ITEM.substr(0, DASH)), first) ||
               !parseId(trim(ITEM.substr(DASH + 1)), last) || last < first) {
      return false;
    }

    for (std::size_t id = first; id <= last; ++id) {
      result.set(id);
    }
  }

  out = result;
  return true;
}

} // namespace cpu

} // namespace tickrate
