#ifndef TICKRATE_PROVIDER_SOURCE_FACTORY_HPP
#define TICKRATE_PROVIDER_SOURCE_FACTORY_HPP
/**
 * @file SourceFactory.hpp
 * @brief Build the TicksSource variant named by a SourceConfig.
 */

#include "src/provider/inc/CommandRunner.hpp"
#include "src/provider/inc/TicksSource.hpp"

#include <memory>
#include <string>

namespace tickrate {

namespace provider {

/**
 * @brief Selection and settings for one counter source.
 */
struct SourceConfig {
  SourceKind kind{SourceKind::LOCAL_LINUX}; ///< Variant to build
  std::string statPath{"/proc/stat"};       ///< Linux variants: stat file path
  std::string cpuInfoPath{"/proc/cpuinfo"}; ///< Linux variants: cpuinfo file path
  std::string loadAvgPath{"/proc/loadavg"}; ///< Linux variants: loadavg file path
  SshConfig ssh{};                          ///< REMOTE_LINUX: connection settings
};

/// Variant that reads this machine on the build platform.
[[nodiscard]] SourceKind nativeSourceKind() noexcept;

/// True if kind is compiled into this build.
[[nodiscard]] bool isSourceKindAvailable(SourceKind kind) noexcept;

/**
 * @brief Construct a source.
 * @return nullptr if the kind is not available in this build, or if
 *         REMOTE_LINUX is requested without a host.
 */
[[nodiscard]] std::unique_ptr<TicksSource> makeTicksSource(const SourceConfig& config);

} // namespace provider

} // namespace tickrate

#endif // TICKRATE_PROVIDER_SOURCE_FACTORY_HPP
