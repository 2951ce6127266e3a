#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include "model/CollectionResult.hpp"

namespace hostscope::app {

// Holds the last-known-good Snapshot plus the most recent failure.
// Readers get an immutable snapshot without locking; a failed cycle never
// replaces the good one.
class SnapshotStore {
public:
  SnapshotStore() = default;
  // Non-copyable
  SnapshotStore(const SnapshotStore&) = delete;
  SnapshotStore& operator=(const SnapshotStore&) = delete;

  void publish(const hostscope::model::CollectionResult& result);

  // nullptr until the first successful cycle
  hostscope::model::SnapshotPtr latest() const { return latest_.load(std::memory_order_acquire); }

  // Failure of the most recent cycle; cleared by the next success
  std::optional<hostscope::model::CollectionError> last_error() const;

  uint64_t seq() const { return seq_.load(std::memory_order_acquire); }
  uint64_t failures() const { return failures_.load(std::memory_order_relaxed); }

private:
  std::atomic<hostscope::model::SnapshotPtr> latest_{};
  mutable std::mutex err_mu_;
  std::optional<hostscope::model::CollectionError> last_error_;
  std::atomic<uint64_t> seq_{0};
  std::atomic<uint64_t> failures_{0};
};

} // namespace hostscope::app
