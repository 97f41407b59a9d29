/**
 * @file TicksSource.cpp
 * @brief Status and kind strings, and the optional-capability defaults.
 */

#include "src/provider/inc/TicksSource.hpp"

namespace tickrate {

namespace provider {

const char* toString(AcquireStatus status) noexcept {
  switch (status) {
  case AcquireStatus::OK:
    return "OK";
  case AcquireStatus::SOURCE_UNAVAILABLE:
    return "SOURCE_UNAVAILABLE";
  case AcquireStatus::MALFORMED:
    return "MALFORMED";
  case AcquireStatus::UNSUPPORTED:
    return "UNSUPPORTED";
  case AcquireStatus::COMMAND_FAILED:
    return "COMMAND_FAILED";
  }
  return "UNKNOWN";
}

const char* toString(SourceKind kind) noexcept {
  switch (kind) {
  case SourceKind::LOCAL_LINUX:
    return "local-linux";
  case SourceKind::REMOTE_LINUX:
    return "remote-linux";
  case SourceKind::WINDOWS:
    return "windows";
  case SourceKind::DARWIN:
    return "darwin";
  }
  return "unknown";
}

/* ----------------------------- TicksSource ----------------------------- */

AcquireStatus TicksSource::sampleFrequencies(std::vector<double>& /*out*/) {
  return AcquireStatus::UNSUPPORTED;
}

AcquireStatus TicksSource::readInfo(cpu::CpuInfo& /*out*/) { return AcquireStatus::UNSUPPORTED; }

AcquireStatus TicksSource::sampleLoadAverage(cpu::LoadAverage& /*out*/) {
  return AcquireStatus::UNSUPPORTED;
}

} // namespace provider

} // namespace tickrate
