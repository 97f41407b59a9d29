#ifndef TICKRATE_CPU_TICKS_HPP
#define TICKRATE_CPU_TICKS_HPP
/**
 * @file CpuTicks.hpp
 * @brief Raw CPU tick tuples and the keys that identify rate-tracking streams.
 * @note Platform-neutral. Adapters fill CpuTicks; the rate engine consumes it.
 *
 * A CpuTicks value is one reading of monotonically increasing counters taken
 * at a single instant. Platforms that expose fewer states (Darwin: user, nice,
 * system, idle; Windows: user, system, idle) leave the rest at zero.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tickrate {

namespace cpu {

/* ----------------------------- Constants ----------------------------- */

/// Maximum supported CPU id + 1 (matches common CPU_SETSIZE).
inline constexpr std::size_t MAX_CPUS = 1024;

/// Key for whole-machine usage.
inline constexpr std::string_view AGGREGATE_KEY = "aggregate";

/// Prefix for per-core keys ("core-0", "core-1", ...).
inline constexpr std::string_view CORE_KEY_PREFIX = "core-";

/* ----------------------------- CpuTicks ----------------------------- */

/**
 * @brief CPU time counters in platform ticks, cumulative since boot.
 *
 * Field order follows /proc/stat:
 *   user nice system idle iowait irq softirq steal guest guest_nice
 */
struct CpuTicks {
  std::uint64_t user{0};      ///< Time in user mode
  std::uint64_t nice{0};      ///< Time in user mode with low priority
  std::uint64_t system{0};    ///< Time in kernel mode
  std::uint64_t idle{0};      ///< Time in idle task
  std::uint64_t iowait{0};    ///< Time waiting for I/O
  std::uint64_t irq{0};       ///< Time servicing hardware interrupts
  std::uint64_t softirq{0};   ///< Time servicing software interrupts
  std::uint64_t steal{0};     ///< Time stolen by hypervisor
  std::uint64_t guest{0};     ///< Time running guest OS (already counted in user)
  std::uint64_t guestNice{0}; ///< Time running niced guest OS (already counted in nice)

  /// Sum of all states. Guest time is excluded; the kernel folds it into user/nice.
  [[nodiscard]] std::uint64_t total() const noexcept;

  /// Idle time for usage purposes (idle + iowait).
  [[nodiscard]] std::uint64_t idleTotal() const noexcept;

  /// Busy time (total minus idleTotal, floored at zero).
  [[nodiscard]] std::uint64_t busy() const noexcept;

  bool operator==(const CpuTicks&) const = default;

  /// @brief Human-readable one-line summary.
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Keys ----------------------------- */

/**
 * @brief Build the tracking key for a core.
 * @param cpuId Core index.
 * @return "core-<cpuId>".
 * @note NOT RT-safe: Allocates std::string.
 */
[[nodiscard]] std::string coreKey(std::size_t cpuId);

/**
 * @brief Parse a key produced by coreKey().
 * @param key Key to inspect.
 * @param cpuId Parsed core index on success.
 * @return true if key is a well-formed per-core key.
 */
[[nodiscard]] bool parseCoreKey(std::string_view key, std::size_t& cpuId) noexcept;

} // namespace cpu

} // namespace tickrate

#endif // TICKRATE_CPU_TICKS_HPP
