#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include "collectors/ICollector.hpp"
#include "model/CollectionResult.hpp"

namespace hostscope::app {

struct CollectorSet {
  std::unique_ptr<hostscope::collectors::IPlatformCollector> platform;
  std::unique_ptr<hostscope::collectors::INetworkCollector>  network;
  std::unique_ptr<hostscope::collectors::IHardwareCollector> hardware;
  std::unique_ptr<hostscope::collectors::IProcessCollector>  process;
};

// The host-backed collectors
CollectorSet make_host_collectors(std::chrono::milliseconds cpu_sample_interval);

// Combine one cycle's category records into the immutable Snapshot
hostscope::model::SnapshotPtr assemble(uint64_t seq,
                                       std::chrono::system_clock::time_point timestamp,
                                       hostscope::model::Platform platform,
                                       hostscope::model::Network network,
                                       hostscope::model::Hardware hardware,
                                       hostscope::model::Process process);

// Runs one collection cycle per collect() call. Collectors run in a fixed
// order: platform, network, hardware, process. The first collector that
// fails ends the cycle with a failure naming it; nothing is cached and
// nothing is retried.
class SnapshotManager {
public:
  explicit SnapshotManager(CollectorSet collectors);
  SnapshotManager(const SnapshotManager&) = delete;
  SnapshotManager& operator=(const SnapshotManager&) = delete;

  // Blocking; the hardware collector's CPU sample dominates the duration.
  // Not reentrant: callers serialize cycles (see RefreshScheduler).
  [[nodiscard]] hostscope::model::CollectionResult collect();

private:
  CollectorSet collectors_;
  uint64_t seq_{0};
  std::chrono::system_clock::time_point last_ts_{};
};

} // namespace hostscope::app
