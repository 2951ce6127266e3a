#include "app/RefreshScheduler.hpp"
#include <cstdio>
#include <exception>
#include <utility>

using namespace std::chrono;

namespace hostscope::app {

RefreshScheduler::RefreshScheduler(SnapshotManager& manager, SnapshotStore& store,
                                   milliseconds interval, bool auto_refresh)
    : manager_(manager), store_(store), interval_(interval), auto_(auto_refresh) {}

RefreshScheduler::~RefreshScheduler() { stop(); }

void RefreshScheduler::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void RefreshScheduler::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
  // A manual cycle claimed but never served gives its claim back
  std::lock_guard<std::mutex> lk(mu_);
  if (manual_pending_) {
    manual_pending_ = false;
    in_flight_.store(false, std::memory_order_release);
  }
}

bool RefreshScheduler::fire_timer() {
  if (!auto_refresh_enabled()) return false;
  return run_cycle(Trigger::Timer);
}

bool RefreshScheduler::refresh_now() { return run_cycle(Trigger::Manual); }

bool RefreshScheduler::trigger_manual_refresh() {
  // The claim is taken here, so a timer fire between now and the thread
  // picking the request up sees Collecting and is dropped.
  if (!try_claim()) return false;
  if (!thread_.joinable()) {
    run_claimed(Trigger::Manual);
    return true;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    manual_pending_ = true;
  }
  cv_.notify_all();
  return true;
}

bool RefreshScheduler::toggle_auto_refresh() {
  bool cur = auto_.load(std::memory_order_acquire);
  while (!auto_.compare_exchange_weak(cur, !cur, std::memory_order_acq_rel)) {}
  return !cur;
}

void RefreshScheduler::set_listener(Listener listener) {
  std::lock_guard<std::mutex> lk(listener_mu_);
  listener_ = std::move(listener);
}

bool RefreshScheduler::try_claim() {
  bool expected = false;
  if (!in_flight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  return true;
}

bool RefreshScheduler::run_cycle(Trigger trigger) {
  if (!try_claim()) return false;
  run_claimed(trigger);
  return true;
}

void RefreshScheduler::run_claimed(Trigger trigger) {
  // Released only after publish, so cycles reach the store in claim order
  struct Release {
    std::atomic<bool>& flag;
    ~Release() { flag.store(false, std::memory_order_release); }
  } release{in_flight_};

  auto result = [&]{
    try {
      return manager_.collect();
    } catch (const std::exception& e) {
      return hostscope::model::CollectionResult::failure(
          trigger == Trigger::Timer ? "timer" : "manual", e.what());
    }
  }();
  cycles_.fetch_add(1, std::memory_order_relaxed);
  publish(result);
}

void RefreshScheduler::publish(const hostscope::model::CollectionResult& result) {
  store_.publish(result);
  if (!result) {
    std::fprintf(stderr, "hostscope: RefreshScheduler: refresh failed: %s\n",
                 result.error().describe().c_str());
  }
  Listener cb;
  {
    std::lock_guard<std::mutex> lk(listener_mu_);
    cb = listener_;
  }
  if (!cb) return;
  try {
    cb(result);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "hostscope: RefreshScheduler: listener threw: %s\n", e.what());
  }
}

void RefreshScheduler::run(std::stop_token st) {
  auto next_tick = steady_clock::now() + interval_;
  while (!st.stop_requested()) {
    bool manual = false;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait_until(lk, st, next_tick, [this]{ return manual_pending_; });
      if (st.stop_requested()) break;
      manual = manual_pending_;
      manual_pending_ = false;
    }
    if (manual) run_claimed(Trigger::Manual);
    auto now = steady_clock::now();
    if (now < next_tick) continue;
    // A tick that came due during a manual cycle is dropped like any other
    // fire that lands while Collecting.
    if (manual) dropped_.fetch_add(1, std::memory_order_relaxed);
    else (void)fire_timer();
    next_tick = steady_clock::now() + interval_;
  }
}

const char* to_string(RefreshScheduler::State s) {
  switch (s) {
    case RefreshScheduler::State::Idle: return "Idle";
    case RefreshScheduler::State::Collecting: return "Collecting";
  }
  return "?";
}

} // namespace hostscope::app
