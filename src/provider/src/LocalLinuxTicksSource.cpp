/**
 * @file LocalLinuxTicksSource.cpp
 * @brief /proc/stat, /proc/cpuinfo and /proc/loadavg readers.
 * @note Reads only the cpu block at the head of the file; the intr line that
 *       follows can be many kilobytes and is never needed.
 */

#include "src/provider/inc/LocalLinuxTicksSource.hpp"

#include "src/helpers/inc/Strings.hpp"
#include "src/provider/inc/ProcStatText.hpp"

#include <array>   // std::array
#include <cstdio>  // fopen, fgets, fread, fclose
#include <string_view>
#include <utility> // std::move

#include <fmt/core.h>

namespace tickrate {

namespace provider {

using helpers::strings::startsWith;

namespace {

/// Read a small pseudo-file in full.
AcquireStatus readWholeFile(const std::string& path, std::string& text) {
  std::FILE* file = std::fopen(path.c_str(), "r");
  if (file == nullptr) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }

  // procfs reports size 0, so read until EOF rather than stat'ing
  text.clear();
  std::array<char, 4096> buf{};
  std::size_t n = 0;
  while ((n = std::fread(buf.data(), 1, buf.size(), file)) > 0) {
    text.append(buf.data(), n);
  }

  const bool READ_ERROR = std::ferror(file) != 0;
  std::fclose(file);
  return READ_ERROR ? AcquireStatus::SOURCE_UNAVAILABLE : AcquireStatus::OK;
}

} // namespace

LocalLinuxTicksSource::LocalLinuxTicksSource(std::string statPath, std::string cpuInfoPath,
                                             std::string loadAvgPath)
    : statPath_(std::move(statPath)), cpuInfoPath_(std::move(cpuInfoPath)),
      loadAvgPath_(std::move(loadAvgPath)) {}

std::string LocalLinuxTicksSource::describe() const { return fmt::format("local:{}", statPath_); }

AcquireStatus LocalLinuxTicksSource::readCpuLines(std::string& text) const {
  std::FILE* file = std::fopen(statPath_.c_str(), "r");
  if (file == nullptr) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }

  text.clear();
  std::array<char, 512> lineBuf{};
  bool inCpuBlock = true;
  bool midLine = false;

  while (std::fgets(lineBuf.data(), static_cast<int>(lineBuf.size()), file) != nullptr) {
    // A fragment of an over-long line belongs to whatever line it started
    if (!midLine) {
      inCpuBlock = startsWith(lineBuf.data(), "cpu");
      if (!inCpuBlock && !text.empty()) {
        break;
      }
    }
    if (inCpuBlock) {
      text += lineBuf.data();
    }

    const std::string_view CHUNK(lineBuf.data());
    midLine = CHUNK.empty() || CHUNK.back() != '\n';
  }

  const bool READ_ERROR = std::ferror(file) != 0;
  std::fclose(file);

  if (READ_ERROR) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  return AcquireStatus::OK;
}

AcquireStatus LocalLinuxTicksSource::sampleAggregate(cpu::CpuTicks& out) {
  std::string text;
  const AcquireStatus READ = readCpuLines(text);
  if (READ != AcquireStatus::OK) {
    return READ;
  }
  return extractAggregate(text, out);
}

AcquireStatus LocalLinuxTicksSource::sampleCores(std::vector<CoreTicks>& out) {
  std::string text;
  const AcquireStatus READ = readCpuLines(text);
  if (READ != AcquireStatus::OK) {
    return READ;
  }
  return extractCores(text, out);
}

AcquireStatus LocalLinuxTicksSource::sampleFrequencies(std::vector<double>& out) {
  std::string text;
  const AcquireStatus READ = readWholeFile(cpuInfoPath_, text);
  if (READ != AcquireStatus::OK) {
    return READ;
  }
  return extractFrequencies(text, out);
}

AcquireStatus LocalLinuxTicksSource::readInfo(cpu::CpuInfo& out) {
  std::string text;
  const AcquireStatus READ = readWholeFile(cpuInfoPath_, text);
  if (READ != AcquireStatus::OK) {
    return READ;
  }
  return extractInfo(text, out);
}

AcquireStatus LocalLinuxTicksSource::sampleLoadAverage(cpu::LoadAverage& out) {
  std::string text;
  const AcquireStatus READ = readWholeFile(loadAvgPath_, text);
  if (READ != AcquireStatus::OK) {
    return READ;
  }
  return extractLoadAverage(text, out);
}

} // namespace provider

} // namespace tickrate
