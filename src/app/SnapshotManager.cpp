#include "app/SnapshotManager.hpp"
#include "collectors/HardwareCollector.hpp"
#include "collectors/NetworkCollector.hpp"
#include "collectors/PlatformCollector.hpp"
#include "collectors/ProcessCollector.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

namespace hostscope::app {

CollectorSet make_host_collectors(std::chrono::milliseconds cpu_sample_interval) {
  CollectorSet set;
  set.platform = std::make_unique<hostscope::collectors::PlatformCollector>();
  set.network  = std::make_unique<hostscope::collectors::NetworkCollector>();
  set.hardware = std::make_unique<hostscope::collectors::HardwareCollector>(cpu_sample_interval);
  set.process  = std::make_unique<hostscope::collectors::ProcessCollector>();
  return set;
}

hostscope::model::SnapshotPtr assemble(uint64_t seq,
                                       std::chrono::system_clock::time_point timestamp,
                                       hostscope::model::Platform platform,
                                       hostscope::model::Network network,
                                       hostscope::model::Hardware hardware,
                                       hostscope::model::Process process) {
  auto s = std::make_shared<hostscope::model::Snapshot>();
  s->seq = seq;
  s->timestamp = timestamp;
  s->platform = std::move(platform);
  s->network = std::move(network);
  s->hardware = std::move(hardware);
  s->process = std::move(process);
  return s;
}

SnapshotManager::SnapshotManager(CollectorSet collectors) : collectors_(std::move(collectors)) {
  if (!collectors_.platform || !collectors_.network || !collectors_.hardware || !collectors_.process)
    throw std::invalid_argument("SnapshotManager: every category needs a collector");
}

// Run one collector; a standard exception counts as that collector failing
template <typename T>
static bool run_one(hostscope::collectors::ICollector<T>& c, T& out, std::string& cause) {
  try {
    if (c.sample(out)) return true;
    cause = c.last_error().empty() ? std::string("collector reported failure") : c.last_error();
  } catch (const std::exception& e) {
    cause = e.what();
  }
  return false;
}

hostscope::model::CollectionResult SnapshotManager::collect() {
  // As-of time of the whole cycle, taken before any collector runs
  auto ts = std::chrono::system_clock::now();
  if (ts <= last_ts_) ts = last_ts_ + std::chrono::system_clock::duration(1);

  hostscope::model::Platform platform;
  hostscope::model::Network network;
  hostscope::model::Hardware hardware;
  hostscope::model::Process process;
  std::string cause;
  if (!run_one(*collectors_.platform, platform, cause))
    return hostscope::model::CollectionResult::failure(collectors_.platform->name(), cause);
  if (!run_one(*collectors_.network, network, cause))
    return hostscope::model::CollectionResult::failure(collectors_.network->name(), cause);
  if (!run_one(*collectors_.hardware, hardware, cause))
    return hostscope::model::CollectionResult::failure(collectors_.hardware->name(), cause);
  if (!run_one(*collectors_.process, process, cause))
    return hostscope::model::CollectionResult::failure(collectors_.process->name(), cause);

  last_ts_ = ts;
  return hostscope::model::CollectionResult::success(
      assemble(++seq_, ts, std::move(platform), std::move(network), std::move(hardware), std::move(process)));
}

} // namespace hostscope::app
