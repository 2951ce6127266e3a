#include "app/SnapshotStore.hpp"

namespace hostscope::app {

void SnapshotStore::publish(const hostscope::model::CollectionResult& result) {
  if (result.ok()) {
    latest_.store(result.snapshot(), std::memory_order_release);
    std::lock_guard<std::mutex> lk(err_mu_);
    last_error_.reset();
  } else {
    {
      std::lock_guard<std::mutex> lk(err_mu_);
      last_error_ = result.error();
    }
    failures_.fetch_add(1, std::memory_order_relaxed);
  }
  // bump after the payload so a reader seeing the new seq sees the new data
  seq_.fetch_add(1, std::memory_order_acq_rel);
}

std::optional<hostscope::model::CollectionError> SnapshotStore::last_error() const {
  std::lock_guard<std::mutex> lk(err_mu_);
  return last_error_;
}

} // namespace hostscope::app
