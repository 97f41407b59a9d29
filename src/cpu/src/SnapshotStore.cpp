/**
 * @file SnapshotStore.cpp
 * @brief Mutex-guarded baseline map.
 */

#include "src/cpu/inc/SnapshotStore.hpp"

#include <algorithm> // std::sort
#include <utility>   // std::exchange

namespace tickrate {

namespace cpu {

std::optional<CpuTicks> SnapshotStore::get(std::string_view key) const {
  const std::lock_guard<std::mutex> LOCK(mutex_);
  const auto IT = baselines_.find(std::string(key));
  if (IT == baselines_.end()) {
    return std::nullopt;
  }
  return IT->second;
}

void SnapshotStore::put(std::string_view key, const CpuTicks& ticks) {
  const std::lock_guard<std::mutex> LOCK(mutex_);
  baselines_.insert_or_assign(std::string(key), ticks);
}

std::optional<CpuTicks> SnapshotStore::exchange(std::string_view key, const CpuTicks& ticks) {
  const std::lock_guard<std::mutex> LOCK(mutex_);
  const auto [IT, INSERTED] = baselines_.try_emplace(std::string(key), ticks);
  if (INSERTED) {
    return std::nullopt;
  }
  return std::exchange(IT->second, ticks);
}

bool SnapshotStore::contains(std::string_view key) const {
  const std::lock_guard<std::mutex> LOCK(mutex_);
  return baselines_.count(std::string(key)) != 0;
}

bool SnapshotStore::erase(std::string_view key) {
  const std::lock_guard<std::mutex> LOCK(mutex_);
  return baselines_.erase(std::string(key)) != 0;
}

void SnapshotStore::clear() {
  const std::lock_guard<std::mutex> LOCK(mutex_);
  baselines_.clear();
}

std::size_t SnapshotStore::size() const {
  const std::lock_guard<std::mutex> LOCK(mutex_);
  return baselines_.size();
}

std::vector<std::string> SnapshotStore::keys() const {
  std::vector<std::string> out;
  {
    const std::lock_guard<std::mutex> LOCK(mutex_);
    out.reserve(baselines_.size());
    for (const auto& ENTRY : baselines_) {
      out.push_back(ENTRY.first);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace cpu

} // namespace tickrate
