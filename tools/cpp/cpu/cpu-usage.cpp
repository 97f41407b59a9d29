/**
 * @file cpu-usage.cpp
 * @brief Aggregate and per-core CPU usage monitor for local or remote hosts.
 *
 * Samples a CpuUsageProvider at a fixed interval. The first round only
 * establishes baselines; every later round prints usage since the previous one.
 * Rounds whose acquisition fails are reported on stderr, skipped, and still
 * count toward --count.
 */

#include "src/cpu/inc/CpuSet.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/numeric/inc/ScaledDivide.hpp"
#include "src/provider/inc/CpuUsageProvider.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <chrono>
#include <thread>

#include <fmt/core.h>

namespace args = tickrate::helpers::args;
namespace clk = tickrate::helpers::clock;
namespace cpu = tickrate::cpu;
namespace numeric = tickrate::numeric;
namespace provider = tickrate::provider;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_INTERVAL = 2,
  ARG_COUNT = 3,
  ARG_CPUS = 4,
  ARG_HOST = 5,
  ARG_USER = 6,
  ARG_PORT = 7,
  ARG_IDENTITY = 8,
  ARG_STAT_PATH = 9,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "CPU usage monitor.\n"
    "Reports aggregate and per-core usage for this machine, or for a remote\n"
    "Linux host over ssh when --host is given.";

constexpr std::uint64_t DEFAULT_INTERVAL_MS = 1000;
constexpr std::uint64_t MIN_INTERVAL_MS = 10;
constexpr std::uint64_t MAX_INTERVAL_MS = 60000;

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output one JSON object per sample"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Sampling interval in ms (default: 1000)"};
  map[ARG_COUNT] = {"--count", 1, false, "Number of samples (default: infinite)"};
  map[ARG_CPUS] = {"--cpus", 1, false, "CPU list to display (e.g., 0-3,6)"};
  map[ARG_HOST] = {"--host", 1, false, "Remote Linux host to sample over ssh"};
  map[ARG_USER] = {"--user", 1, false, "Remote login user"};
  map[ARG_PORT] = {"--port", 1, false, "Remote ssh port"};
  map[ARG_IDENTITY] = {"--identity", 1, false, "ssh identity file"};
  map[ARG_STAT_PATH] = {"--stat-path", 1, false, "Linux stat file (default: /proc/stat)"};
  return map;
}

/// Fill a SourceConfig from parsed flags.
provider::SourceConfig buildSourceConfig(const args::ParsedArgs& pargs) {
  provider::SourceConfig config{};
  config.kind = provider::nativeSourceKind();
  config.statPath = args::getString(pargs, ARG_STAT_PATH, config.statPath);

  if (args::has(pargs, ARG_HOST)) {
    config.kind = provider::SourceKind::REMOTE_LINUX;
    config.ssh.host = args::getString(pargs, ARG_HOST);
    config.ssh.user = args::getString(pargs, ARG_USER);
    config.ssh.port = static_cast<std::uint16_t>(args::getUint(pargs, ARG_PORT, 0, 0, 65535));
    config.ssh.identityFile = args::getString(pargs, ARG_IDENTITY);
  }
  return config;
}

/* ----------------------------- Sampling ----------------------------- */

/// One round of results.
struct Round {
  provider::UsageReport report{};
  std::uint64_t intervalMs{0};
};

/// Sample everything; on failure report on stderr and return false.
bool sampleRound(provider::CpuUsageProvider& prov, Round& round) {
  const provider::AcquireStatus STATUS = prov.report(round.report);
  if (STATUS != provider::AcquireStatus::OK) {
    fmt::print(stderr, "Warning: {} read failed: {}\n", prov.source().describe(),
               provider::toString(STATUS));
    return false;
  }
  return true;
}

/* ----------------------------- Output Functions ----------------------------- */

void printHumanHeader(provider::CpuUsageProvider& prov, const cpu::CpuSet& cpuFilter) {
  fmt::print("CPU Usage Monitor\n");
  fmt::print("=================\n");
  fmt::print("Source: {} ({})\n", prov.source().describe(), provider::toString(prov.source().kind()));
  if (prov.source().kind() == provider::SourceKind::LOCAL_LINUX) {
    fmt::print("Tick rate: {} Hz\n", clk::getTicksPerSecond());
  }

  // Optional capabilities; absent ones are simply not shown
  cpu::CpuInfo info{};
  if (prov.info(info) == provider::AcquireStatus::OK) {
    fmt::print("CPU: {}\n", info.model.empty() ? "unknown" : info.model);
    fmt::print("Cores: {} physical, {} logical\n", info.cores, info.threads);
  }
  std::vector<double> mhz;
  if (prov.frequencies(mhz) == provider::AcquireStatus::OK && !mhz.empty()) {
    double sum = 0.0;
    for (const double F : mhz) {
      sum += F;
    }
    fmt::print("Clock: {:.0f} MHz avg over {} CPUs\n", sum / static_cast<double>(mhz.size()),
               mhz.size());
  }
  cpu::LoadAverage load{};
  if (prov.loadAverage(load) == provider::AcquireStatus::OK) {
    fmt::print("Load: {}\n", load.toString());
  }
  if (!cpuFilter.empty()) {
    fmt::print("Monitoring CPUs: {}\n", cpuFilter.toString());
  }
  fmt::print("\n{:>4}  {:>6}  {:>6}  {:>6}  {:>6}  {:>6}  {}\n", "CPU", "usage%", "user%", "sys%",
             "idle%", "iowt%", "status");
  fmt::print("{}\n", std::string(56, '-'));
}

void printHumanSample(const Round& round, const cpu::CpuSet& cpuFilter) {
  const provider::UsageReport& R = round.report;
  for (const provider::CoreUsage& CORE : R.cores) {
    if (!cpuFilter.empty() && !cpuFilter.test(CORE.cpuId)) {
      continue;
    }
    fmt::print("{:>4}  {:>6.1f}  {:>6}  {:>6}  {:>6}  {:>6}  {}\n", CORE.cpuId, CORE.sample.percent,
               "", "", "", "", cpu::toString(CORE.sample.status));
  }

  const cpu::CpuUsageBreakdown& B = R.breakdown;
  fmt::print("{:>4}  {:>6.1f}  {:>6.1f}  {:>6.1f}  {:>6.1f}  {:>6.1f}  {}\n", "ALL",
             R.total.percent, B.user, B.system, B.idle, B.iowait, cpu::toString(R.total.status));
  fmt::print("\n");
}

void printJsonSample(const Round& round, const cpu::CpuSet& cpuFilter, std::uint64_t sampleNum) {
  fmt::print("{{");
  fmt::print("\"sample\": {}, ", sampleNum);
  fmt::print("\"intervalMs\": {}, ", round.intervalMs);

  const provider::UsageReport& R = round.report;
  const cpu::CpuUsageBreakdown& B = R.breakdown;
  fmt::print("\"aggregate\": {{");
  fmt::print("\"usage\": {:.2f}, ", R.total.percent);
  fmt::print("\"status\": \"{}\", ", cpu::toString(R.total.status));
  fmt::print("\"user\": {:.2f}, ", B.user);
  fmt::print("\"system\": {:.2f}, ", B.system);
  fmt::print("\"idle\": {:.2f}, ", B.idle);
  fmt::print("\"iowait\": {:.2f}, ", B.iowait);
  fmt::print("\"steal\": {:.2f}", B.steal);
  fmt::print("}}, ");

  fmt::print("\"cores\": [");
  bool first = true;
  for (const provider::CoreUsage& CORE : R.cores) {
    if (!cpuFilter.empty() && !cpuFilter.test(CORE.cpuId)) {
      continue;
    }
    if (!first) {
      fmt::print(", ");
    }
    first = false;
    fmt::print("{{\"cpu\": {}, \"usage\": {:.2f}, \"status\": \"{}\"}}", CORE.cpuId,
               CORE.sample.percent, cpu::toString(CORE.sample.status));
  }
  fmt::print("]");

  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  if (args::has(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  const bool JSON_OUTPUT = args::has(pargs, ARG_JSON);
  const std::uint64_t INTERVAL_MS =
      args::getUint(pargs, ARG_INTERVAL, DEFAULT_INTERVAL_MS, MIN_INTERVAL_MS, MAX_INTERVAL_MS);
  const std::uint64_t COUNT = args::getUint(pargs, ARG_COUNT, 0, 0, UINT64_MAX); // 0 = infinite

  cpu::CpuSet cpuFilter;
  if (args::has(pargs, ARG_CPUS) && !cpu::parseCpuList(args::getString(pargs, ARG_CPUS), cpuFilter)) {
    fmt::print(stderr, "Error: invalid CPU list '{}'\n", args::getString(pargs, ARG_CPUS));
    return 1;
  }

  const provider::SourceConfig CONFIG = buildSourceConfig(pargs);
  const std::unique_ptr<provider::CpuUsageProvider> PROV = provider::makeCpuUsageProvider(CONFIG);
  if (!PROV) {
    fmt::print(stderr, "Error: {} source is not available{}\n", provider::toString(CONFIG.kind),
               CONFIG.kind == provider::SourceKind::REMOTE_LINUX ? " (check --host)" : "");
    return 1;
  }

  // Baseline round
  Round round;
  if (!sampleRound(*PROV, round)) {
    return 1;
  }
  std::uint64_t prevNs = clk::getMonotonicNs();

  if (!JSON_OUTPUT) {
    printHumanHeader(*PROV, cpuFilter);
  }

  // Failed rounds count too, so an unreachable host cannot stall --count
  for (std::uint64_t sampleNum = 0; COUNT == 0 || sampleNum < COUNT; ++sampleNum) {
    std::this_thread::sleep_for(std::chrono::milliseconds(INTERVAL_MS));

    if (!sampleRound(*PROV, round)) {
      continue;
    }
    const std::uint64_t NOW_NS = clk::getMonotonicNs();
    round.intervalMs = numeric::nanosToMillis(NOW_NS - prevNs);
    prevNs = NOW_NS;

    if (JSON_OUTPUT) {
      printJsonSample(round, cpuFilter, sampleNum);
    } else {
      printHumanSample(round, cpuFilter);
    }
  }

  return 0;
}
