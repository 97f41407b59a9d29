/**
 * @file CpuInfo.cpp
 * @brief /proc/cpuinfo and /proc/loadavg text parsing.
 */

#include "src/cpu/inc/CpuInfo.hpp"

#include "src/helpers/inc/Strings.hpp"
#include "src/numeric/inc/ScaledDivide.hpp"

#include <array>   // std::array
#include <cerrno>  // errno, ERANGE
#include <cmath>   // std::isfinite
#include <cstdlib> // strtod
#include <cstring> // memcpy
#include <utility> // std::move

#include <fmt/core.h>

namespace tickrate {

namespace cpu {

namespace {

using helpers::strings::forEachLine;
using helpers::strings::nextUint64;
using helpers::strings::trim;

/// Longest numeric token accepted.
constexpr std::size_t MAX_TOKEN = 64;

/// Parse a whole token as a finite double.
bool parseDouble(std::string_view token, double& out) noexcept {
  if (token.empty() || token.size() >= MAX_TOKEN) {
    return false;
  }
  std::array<char, MAX_TOKEN> buf{};
  std::memcpy(buf.data(), token.data(), token.size());

  char* end = nullptr;
  errno = 0;
  const double VAL = std::strtod(buf.data(), &end);
  if (end != buf.data() + token.size() || errno == ERANGE || !std::isfinite(VAL)) {
    return false;
  }
  out = VAL;
  return true;
}

/// Parse a whole token as an unsigned decimal.
bool parseUint(std::string_view token, std::uint64_t& out) noexcept {
  if (token.empty() || token.size() >= MAX_TOKEN) {
    return false;
  }
  std::array<char, MAX_TOKEN> buf{};
  std::memcpy(buf.data(), token.data(), token.size());

  const char* ptr = buf.data();
  std::uint64_t val = 0;
  if (!nextUint64(ptr, val) || *ptr != '\0') {
    return false;
  }
  out = val;
  return true;
}

/// Split "key<ws>: value" into trimmed halves.
bool splitKeyValue(std::string_view line, std::string_view& key, std::string_view& value) noexcept {
  const std::size_t COLON = line.find(':');
  if (COLON == std::string_view::npos) {
    return false;
  }
  key = trim(line.substr(0, COLON));
  value = trim(line.substr(COLON + 1));
  return true;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    const char CA = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] - 'A' + 'a') : a[i];
    const char CB = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] - 'A' + 'a') : b[i];
    if (CA != CB) {
      return false;
    }
  }
  return true;
}

/// "8192 KB" or "16 MB" to bytes; 0 if the unit is unknown or the value overflows.
std::uint64_t parseCacheSize(std::string_view value) noexcept {
  const std::size_t SPACE = value.find_first_of(" \t");
  if (SPACE == std::string_view::npos) {
    return 0;
  }
  std::uint64_t size = 0;
  if (!parseUint(value.substr(0, SPACE), size)) {
    return 0;
  }

  const std::string_view UNIT = trim(value.substr(SPACE));
  if (equalsIgnoreCase(UNIT, "KB")) {
    return numeric::kibToBytes(size);
  }
  if (equalsIgnoreCase(UNIT, "MB")) {
    return numeric::kibToBytes(numeric::kibToBytes(size));
  }
  return 0;
}

} // namespace

/* ----------------------------- toString ----------------------------- */

std::string CpuInfo::toString() const {
  return fmt::format("{} ({}) cores={} threads={} cache={}B", model.empty() ? "unknown" : model,
                     vendor.empty() ? "unknown" : vendor, cores, threads, cacheBytes);
}

std::string LoadAverage::toString() const {
  return fmt::format("{:.2f} {:.2f} {:.2f}", load1, load5, load15);
}

/* ----------------------------- Parsers ----------------------------- */

bool parseCpuInfoText(std::string_view text, CpuInfo& out) {
  CpuInfo info{};
  std::size_t processors = 0;
  bool haveCache = false;

  forEachLine(text, [&](std::string_view line) {
    std::string_view key;
    std::string_view value;
    if (!splitKeyValue(line, key, value)) {
      return;
    }

    std::uint64_t n = 0;
    if (key == "processor") {
      ++processors;
    } else if (key == "model name") {
      if (info.model.empty()) {
        info.model = std::string(value);
      }
    } else if (key == "vendor_id") {
      if (info.vendor.empty()) {
        info.vendor = std::string(value);
      }
    } else if (key == "cpu cores") {
      if (info.cores == 0 && parseUint(value, n)) {
        info.cores = static_cast<std::size_t>(n);
      }
    } else if (key == "siblings") {
      if (info.threads == 0 && parseUint(value, n)) {
        info.threads = static_cast<std::size_t>(n);
      }
    } else if (key == "cache size") {
      if (!haveCache) {
        info.cacheBytes = parseCacheSize(value);
        haveCache = true;
      }
    }
  });

  if (processors == 0) {
    return false;
  }
  if (info.cores == 0) {
    info.cores = processors;
  }
  if (info.threads == 0) {
    info.threads = processors;
  }

  out = std::move(info);
  return true;
}

bool parseCpuFrequencies(std::string_view text, std::vector<double>& out) {
  std::vector<double> freqs;

  forEachLine(text, [&](std::string_view line) {
    std::string_view key;
    std::string_view value;
    if (!splitKeyValue(line, key, value) || key != "cpu MHz") {
      return;
    }
    double mhz = 0.0;
    if (parseDouble(value, mhz) && mhz >= 0.0) {
      freqs.push_back(mhz);
    }
  });

  if (freqs.empty()) {
    return false;
  }
  out = std::move(freqs);
  return true;
}

bool parseLoadAverage(std::string_view text, LoadAverage& out) noexcept {
  std::array<double, 3> vals{};
  std::size_t pos = 0;

  for (double& val : vals) {
    const std::size_t START = text.find_first_not_of(" \t", pos);
    if (START == std::string_view::npos) {
      return false;
    }
    std::size_t end = text.find_first_of(" \t\r\n", START);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    if (!parseDouble(text.substr(START, end - START), val) || val < 0.0) {
      return false;
    }
    pos = end;
  }

  out.load1 = vals[0];
  out.load5 = vals[1];
  out.load15 = vals[2];
  return true;
}

} // namespace cpu

} // namespace tickrate
