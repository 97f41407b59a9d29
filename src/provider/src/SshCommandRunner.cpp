/**
 * @file SshCommandRunner.cpp
 * @brief ssh client subprocess with captured stdout and a hard timeout.
 * @note POSIX-only: fork/execvp/poll/waitpid.
 *
 * Exit status mapping:
 *  - 0                 -> OK
 *  - 127 (exec failed) -> SOURCE_UNAVAILABLE
 *  - 255 (ssh error)   -> SOURCE_UNAVAILABLE
 *  - other / signal    -> COMMAND_FAILED
 *  - timeout           -> COMMAND_FAILED (child killed; covers exit, not just output)
 *  - host/user starting with '-' -> SOURCE_UNAVAILABLE (never started)
 */

#include "src/provider/inc/CommandRunner.hpp"

#include <fcntl.h>    // fcntl, open, FD_CLOEXEC
#include <poll.h>     // poll
#include <signal.h>   // kill, SIGKILL
#include <sys/wait.h> // waitpid
#include <unistd.h>   // fork, pipe, dup2, execvp, read, close

#include <array>   // std::array
#include <cerrno>  // errno, EINTR
#include <chrono>  // std::chrono::steady_clock
#include <thread>  // std::this_thread::sleep_for
#include <utility> // std::move

#include <fmt/core.h>

namespace tickrate {

namespace provider {

namespace {

/// Exit code the child uses when execvp fails.
constexpr int EXEC_FAILED_EXIT = 127;

/// Close both ends of a pipe, ignoring already-closed (-1) ends.
inline void closePipe(std::array<int, 2>& fds) noexcept {
  for (int& fd : fds) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
}

/// Reap the child, retrying on EINTR. Returns the raw wait status or -1.
inline int reap(pid_t pid) noexcept {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return status;
}

/// Kill and reap the child.
inline void killAndReap(pid_t pid) noexcept {
  ::kill(pid, SIGKILL);
  static_cast<void>(reap(pid));
}

/**
 * @brief Wait for the child to exit until deadline.
 * @param status Raw wait status on success.
 * @return false if the deadline passed (child still running) or waitpid failed.
 */
template <typename TimePoint>
bool reapBefore(pid_t pid, TimePoint deadline, int& status) noexcept {
  constexpr auto POLL_STEP = std::chrono::milliseconds(5);
  for (;;) {
    const pid_t DONE = ::waitpid(pid, &status, WNOHANG);
    if (DONE == pid) {
      return true;
    }
    if (DONE < 0 && errno != EINTR) {
      return false;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(POLL_STEP);
  }
}

/// True if s would be read by ssh as an option.
inline bool looksLikeOption(const std::string& s) noexcept { return !s.empty() && s.front() == '-'; }

} // namespace

SshCommandRunner::SshCommandRunner(SshConfig config) : config_(std::move(config)) {}

std::string SshCommandRunner::target() const {
  std::string out = config_.user.empty() ? config_.host : fmt::format("{}@{}", config_.user, config_.host);
  if (config_.port != 0) {
    out += fmt::format(":{}", config_.port);
  }
  return out;
}

std::vector<std::string> SshCommandRunner::buildArgv(const std::string& command) const {
  std::vector<std::string> argv;
  argv.reserve(16);
  argv.push_back(config_.sshBinary);
  argv.push_back("-o");
  argv.push_back("BatchMode=yes");
  argv.push_back("-o");
  argv.push_back(fmt::format("ConnectTimeout={}", config_.connectTimeoutSec));
  if (config_.port != 0) {
    argv.push_back("-p");
    argv.push_back(fmt::format("{}", config_.port));
  }
  if (!config_.identityFile.empty()) {
    argv.push_back("-i");
    argv.push_back(config_.identityFile);
  }
  argv.push_back(config_.user.empty() ? config_.host
                                      : fmt::format("{}@{}", config_.user, config_.host));
  // "--" keeps a command starting with '-' from being read as an ssh option
  argv.push_back("--");
  argv.push_back(command);
  return argv;
}

AcquireStatus SshCommandRunner::run(const std::string& command, std::string& output) {
  // A destination starting with '-' would be parsed as an ssh option
  if (config_.host.empty() || looksLikeOption(config_.host) || looksLikeOption(config_.user)) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }

  const std::vector<std::string> ARGV = buildArgv(command);
  std::vector<char*> cArgs;
  cArgs.reserve(ARGV.size() + 1);
  for (const std::string& arg : ARGV) {
    cArgs.push_back(const_cast<char*>(arg.c_str()));
  }
  cArgs.push_back(nullptr);

  std::array<int, 2> outPipe{-1, -1};
  if (::pipe(outPipe.data()) != 0) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  // The read end must not leak into the child; dup2 clears the flag on fd 1
  ::fcntl(outPipe[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(outPipe[1], F_SETFD, FD_CLOEXEC);

  const pid_t PID = ::fork();
  if (PID < 0) {
    closePipe(outPipe);
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }

  if (PID == 0) {
    // Child: stdout to the pipe, stdin and stderr to /dev/null
    ::dup2(outPipe[1], STDOUT_FILENO);
    const int DEV_NULL = ::open("/dev/null", O_RDWR);
    if (DEV_NULL >= 0) {
      ::dup2(DEV_NULL, STDIN_FILENO);
      ::dup2(DEV_NULL, STDERR_FILENO);
    }
    ::execvp(cArgs[0], cArgs.data());
    ::_exit(EXEC_FAILED_EXIT);
  }

  ::close(outPipe[1]);
  outPipe[1] = -1;

  std::string captured;
  std::array<char, 4096> buf{};
  bool failed = false;

  const auto DEADLINE =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.commandTimeoutMs);

  for (;;) {
    const auto REMAINING = std::chrono::duration_cast<std::chrono::milliseconds>(
        DEADLINE - std::chrono::steady_clock::now());
    if (REMAINING.count() <= 0) {
      failed = true;
      break;
    }

    struct pollfd pfd{};
    pfd.fd = outPipe[0];
    pfd.events = POLLIN;
    const int READY = ::poll(&pfd, 1, static_cast<int>(REMAINING.count()));
    if (READY < 0) {
      if (errno == EINTR) {
        continue;
      }
      failed = true;
      break;
    }
    if (READY == 0) {
      failed = true;
      break;
    }

    const ssize_t N = ::read(outPipe[0], buf.data(), buf.size());
    if (N > 0) {
      captured.append(buf.data(), static_cast<std::size_t>(N));
    } else if (N == 0) {
      break;
    } else if (errno != EINTR) {
      failed = true;
      break;
    }
  }

  closePipe(outPipe);

  // The deadline covers the whole command: a child that closed stdout but is
  // still running is killed like one that never wrote.
  int status = 0;
  if (failed || !reapBefore(PID, DEADLINE, status)) {
    killAndReap(PID);
    return AcquireStatus::COMMAND_FAILED;
  }
  const int STATUS = status;

  if (WIFEXITED(STATUS) && WEXITSTATUS(STATUS) == EXEC_FAILED_EXIT) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  // ssh reports its own connection failures as 255
  if (WIFEXITED(STATUS) && WEXITSTATUS(STATUS) == 255) {
    return AcquireStatus::SOURCE_UNAVAILABLE;
  }
  if (!WIFEXITED(STATUS) || WEXITSTATUS(STATUS) != 0) {
    return AcquireStatus::COMMAND_FAILED;
  }

  output = std::move(captured);
  return AcquireStatus::OK;
}

} // namespace provider

} // namespace tickrate
