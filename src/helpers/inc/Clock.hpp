#ifndef TICKRATE_HELPERS_CLOCK_HPP
#define TICKRATE_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Monotonic timestamps and kernel tick rate.
 *
 * @note RT-CAUTION: Syscall (clock_gettime), but typically vDSO-accelerated.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC

#include <unistd.h> // sysconf, _SC_CLK_TCK

namespace tickrate {
namespace helpers {
namespace clock {

/* ----------------------------- Constants ----------------------------- */

/// USER_HZ on every mainstream Linux configuration; used when sysconf fails.
inline constexpr std::uint64_t DEFAULT_TICKS_PER_SECOND = 100;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * Uses CLOCK_MONOTONIC for consistent, non-decreasing time measurements
 * unaffected by system clock adjustments.
 *
 * @return Current monotonic time in nanoseconds.
 * @note RT-CAUTION: Syscall (clock_gettime), but typically vDSO-accelerated.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/**
 * @brief Tick rate of /proc/stat counters (USER_HZ).
 * @return sysconf(_SC_CLK_TCK), or DEFAULT_TICKS_PER_SECOND on failure.
 */
[[nodiscard]] inline std::uint64_t getTicksPerSecond() noexcept {
  const long HZ = ::sysconf(_SC_CLK_TCK);
  return (HZ > 0) ? static_cast<std::uint64_t>(HZ) : DEFAULT_TICKS_PER_SECOND;
}

} // namespace clock
} // namespace helpers
} // namespace tickrate

#endif // TICKRATE_HELPERS_CLOCK_HPP
