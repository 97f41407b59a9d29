/**
 * @file RemoteLinuxTicksSource.cpp
 * @brief Remote /proc/stat reads over a CommandRunner.
 */

#include "src/provider/inc/RemoteLinuxTicksSource.hpp"

#include "src/provider/inc/ProcStatText.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace tickrate {

namespace provider {

namespace {

/// Single-quote a path for a POSIX shell.
std::string shellQuote(const std::string& s) {
  std::string out = "'";
  for (const char C : s) {
    if (C == '\'') {
      out += "'\\''";
    } else {
      out.push_back(C);
    }
  }
  out.push_back('\'');
  return out;
}

} // namespace

RemoteLinuxTicksSource::RemoteLinuxTicksSource(std::unique_ptr<CommandRunner> runner,
                                               std::string statPath, std::string cpuInfoPath,
                                               std::string loadAvgPath)
    : runner_(std::move(runner)), statPath_(std::move(statPath)),
      cpuInfoPath_(std::move(cpuInfoPath)), loadAvgPath_(std::move(loadAvgPath)) {}

std::string RemoteLinuxTicksSource::describe() const {
  return fmt::format("ssh:{}:{}", runner_ ? runner_->target() : std::string("<none>"), statPath_);
}

std::string RemoteLinuxTicksSource::aggregateCommand() const {
  return fmt::format("head -n 1 {}", shellQuote(statPath_));
}

std::string RemoteLinuxTicksSource::coresCommand() const {
  return fmt::format("grep '^cpu[0-9]' {}", shellQuote(statPath_));
}

std::string RemoteLinuxTicksSource::cpuInfoCommand() const {
  return fmt::format("cat {}", shellQuote(cpuInfoPath_));
}

std::string RemoteLinuxTicksSource::loadAvgCommand() const {
  return fmt::format("cat {}", shellQuote(loadAvgPath_));
}

template <typename Out, typename Extract>
AcquireStatus RemoteLinuxTicksSource::runAndExtract(const std::string& command, Out& out,
                                                    Extract extract) {
  if (!runner_) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  std::string text;
  const AcquireStatus RAN = runner_->run(command, text);
  if (RAN != AcquireStatus::OK) {
    return RAN;
  }
  return extract(text, out);
}

AcquireStatus RemoteLinuxTicksSource::sampleAggregate(cpu::CpuTicks& out) {
  return runAndExtract(aggregateCommand(), out, extractAggregate);
}

AcquireStatus RemoteLinuxTicksSource::sampleCores(std::vector<CoreTicks>& out) {
  return runAndExtract(coresCommand(), out, extractCores);
}

AcquireStatus RemoteLinuxTicksSource::sampleFrequencies(std::vector<double>& out) {
  return runAndExtract(cpuInfoCommand(), out, extractFrequencies);
}

AcquireStatus RemoteLinuxTicksSource::readInfo(cpu::CpuInfo& out) {
  return runAndExtract(cpuInfoCommand(), out, extractInfo);
}

AcquireStatus RemoteLinuxTicksSource::sampleLoadAverage(cpu::LoadAverage& out) {
  return runAndExtract(loadAvgCommand(), out, extractLoadAverage);
}

} // namespace provider

} // namespace tickrate
