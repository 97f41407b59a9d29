/**
 * @file SourceFactory.cpp
 * @brief Compile-time availability and construction of TicksSource variants.
 */

#include "src/provider/inc/SourceFactory.hpp"

#include "src/provider/inc/DarwinTicksSource.hpp"
#include "src/provider/inc/LocalLinuxTicksSource.hpp"
#include "src/provider/inc/RemoteLinuxTicksSource.hpp"
#include "src/provider/inc/WindowsTicksSource.hpp"

namespace tickrate {

namespace provider {

SourceKind nativeSourceKind() noexcept {
#if defined(_WIN32)
  return SourceKind::WINDOWS;
#elif defined(__APPLE__)
  return SourceKind::DARWIN;
#else
  return SourceKind::LOCAL_LINUX;
#endif
}

bool isSourceKindAvailable(SourceKind kind) noexcept {
  switch (kind) {
  case SourceKind::LOCAL_LINUX:
#if defined(__linux__)
    return true;
#else
    return false;
#endif
  case SourceKind::REMOTE_LINUX:
#if defined(_WIN32)
    return false;
#else
    return true;
#endif
  case SourceKind::WINDOWS:
#if defined(_WIN32)
    return true;
#else
    return false;
#endif
  case SourceKind::DARWIN:
#if defined(__APPLE__)
    return true;
#else
    return false;
#endif
  }
  return false;
}

std::unique_ptr<TicksSource> makeTicksSource(const SourceConfig& config) {
  if (!isSourceKindAvailable(config.kind)) {
    return nullptr;
  }

  switch (config.kind) {
  case SourceKind::LOCAL_LINUX:
    return std::make_unique<LocalLinuxTicksSource>(config.statPath, config.cpuInfoPath,
                                                   config.loadAvgPath);
  case SourceKind::REMOTE_LINUX:
#if !defined(_WIN32)
    if (config.ssh.host.empty()) {
      return nullptr;
    }
    return std::make_unique<RemoteLinuxTicksSource>(
        std::make_unique<SshCommandRunner>(config.ssh), config.statPath, config.cpuInfoPath,
        config.loadAvgPath);
#else
    return nullptr;
#endif
  case SourceKind::WINDOWS:
#if defined(_WIN32)
    return std::make_unique<WindowsTicksSource>();
#else
    return nullptr;
#endif
  case SourceKind::DARWIN:
#if defined(__APPLE__)
    return std::make_unique<DarwinTicksSource>();
#else
    return nullptr;
#endif
  }
  return nullptr;
}

} // namespace provider

} // namespace tickrate
