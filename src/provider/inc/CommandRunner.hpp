#ifndef TICKRATE_PROVIDER_COMMAND_RUNNER_HPP
#define TICKRATE_PROVIDER_COMMAND_RUNNER_HPP
/**
 * @file CommandRunner.hpp
 * @brief Shell command transport for remote sources.
 *
 * CommandRunner is the seam between a remote source's parsing and the wire.
 * SshCommandRunner is the production implementation; tests substitute a
 * scripted runner.
 *
 * @note SshCommandRunner is POSIX-only (fork/exec of the ssh client).
 */

#include "src/provider/inc/TicksSource.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tickrate {

namespace provider {

/* ----------------------------- CommandRunner ----------------------------- */

class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * @brief Run a shell command on the target and capture its stdout.
   * @param command Shell command line, interpreted by the remote shell.
   * @param output Captured stdout on OK.
   * @return OK, SOURCE_UNAVAILABLE (transport not started), or
   *         COMMAND_FAILED (non-zero exit, signal, or timeout).
   */
  [[nodiscard]] virtual AcquireStatus run(const std::string& command, std::string& output) = 0;

  /// Target description for diagnostics, e.g. "ops@db1:2222".
  [[nodiscard]] virtual std::string target() const = 0;
};

/* ----------------------------- SshConfig ----------------------------- */

/**
 * @brief Connection settings for SshCommandRunner.
 *
 * Authentication is left to the ssh client (agent, ~/.ssh/config, or
 * identityFile); BatchMode keeps it from ever prompting.
 */
struct SshConfig {
  std::string host{};                      ///< Hostname or address (required; no leading -)
  std::string user{};                      ///< Login user; empty uses ssh default
  std::uint16_t port{0};                   ///< 0 uses ssh default
  std::string identityFile{};              ///< Private key path; empty uses ssh default
  std::uint32_t connectTimeoutSec{5};      ///< ssh ConnectTimeout
  std::uint32_t commandTimeoutMs{10'000};  ///< Wall-clock limit per command, up to exit
  std::string sshBinary{"ssh"};            ///< Client executable, looked up in PATH
};

/* ----------------------------- SshCommandRunner ----------------------------- */

class SshCommandRunner final : public CommandRunner {
public:
  explicit SshCommandRunner(SshConfig config);

  [[nodiscard]] AcquireStatus run(const std::string& command, std::string& output) override;
  [[nodiscard]] std::string target() const override;

  /// Full argv used to run command (exposed for tests and diagnostics).
  [[nodiscard]] std::vector<std::string> buildArgv(const std::string& command) const;

  [[nodiscard]] const SshConfig& config() const noexcept { return config_; }

private:
  SshConfig config_;
};

} // namespace provider

} // namespace tickrate

#endif // TICKRATE_PROVIDER_COMMAND_RUNNER_HPP
