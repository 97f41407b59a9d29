#ifndef TICKRATE_CPU_SNAPSHOT_STORE_HPP
#define TICKRATE_CPU_SNAPSHOT_STORE_HPP
/**
 * @file SnapshotStore.hpp
 * @brief Last-seen CpuTicks per tracking key.
 * @note Thread-safe: All members lock an internal mutex.
 *
 * One store belongs to exactly one provider (one local machine or one remote
 * host). It is deliberately not a singleton and not copyable: two hosts that
 * shared a store would compute rates against each other's baselines.
 *
 * Only the most recent tuple per key is kept; there is no history.
 */

#include "src/cpu/inc/CpuTicks.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tickrate {

namespace cpu {

/* ----------------------------- SnapshotStore ----------------------------- */

class SnapshotStore {
public:
  SnapshotStore() = default;
  SnapshotStore(const SnapshotStore&) = delete;
  SnapshotStore& operator=(const SnapshotStore&) = delete;

  /// Stored baseline for key, if any.
  [[nodiscard]] std::optional<CpuTicks> get(std::string_view key) const;

  /// Replace the baseline for key.
  void put(std::string_view key, const CpuTicks& ticks);

  /**
   * @brief Store ticks as the new baseline and return the one it replaced.
   * @param key Tracking key.
   * @param ticks New baseline.
   * @return Previous baseline, or std::nullopt on first use of key.
   *
   * Read and write happen under one lock, so two concurrent callers on the
   * same key never both observe the same prior tuple: the second sees what
   * the first stored.
   */
  [[nodiscard]] std::optional<CpuTicks> exchange(std::string_view key, const CpuTicks& ticks);

  /// True if key has a baseline.
  [[nodiscard]] bool contains(std::string_view key) const;

  /// Drop the baseline for key. Returns true if one existed.
  bool erase(std::string_view key);

  /// Drop all baselines.
  void clear();

  /// Number of tracked keys.
  [[nodiscard]] std::size_t size() const;

  /// Tracked keys, sorted.
  [[nodiscard]] std::vector<std::string> keys() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, CpuTicks> baselines_;
};

} // namespace cpu

} // namespace tickrate

#endif // TICKRATE_CPU_SNAPSHOT_STORE_HPP
