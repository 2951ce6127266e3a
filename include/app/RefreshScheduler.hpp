#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include "app/SnapshotManager.hpp"
#include "app/SnapshotStore.hpp"

namespace hostscope::app {

// Decides when a collection cycle runs. Timer and manual triggers share one
// in-flight guard so at most one cycle runs at a time; a trigger that lands
// while a cycle is running is dropped, not queued. The auto-refresh flag
// only gates timer fires.
class RefreshScheduler {
public:
  enum class State { Idle, Collecting };
  enum class Trigger { Timer, Manual };
  using Listener = std::function<void(const hostscope::model::CollectionResult&)>;

  RefreshScheduler(SnapshotManager& manager, SnapshotStore& store,
                   std::chrono::milliseconds interval, bool auto_refresh = true);
  RefreshScheduler(const RefreshScheduler&) = delete;
  RefreshScheduler& operator=(const RefreshScheduler&) = delete;
  ~RefreshScheduler();

  // Background thread: fires the timer every interval and serves
  // trigger_manual_refresh(). stop() waits for an in-flight cycle.
  void start();
  void stop();
  bool running() const { return thread_.joinable(); }

  // Synchronous triggers; false when the cycle did not run
  bool fire_timer();
  bool refresh_now();

  // Claims the in-flight guard and hands the cycle to the scheduler thread.
  // False if a cycle is already in flight. Without a running thread the
  // cycle runs inline.
  bool trigger_manual_refresh();

  // Flips the flag and returns the new value; never starts a cycle
  bool toggle_auto_refresh();
  bool auto_refresh_enabled() const { return auto_.load(std::memory_order_acquire); }

  State state() const { return in_flight_.load(std::memory_order_acquire) ? State::Collecting : State::Idle; }

  // Called on the thread that ran the cycle, after the store is updated
  void set_listener(Listener listener);

  uint64_t cycles() const { return cycles_.load(std::memory_order_relaxed); }
  uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
  std::chrono::milliseconds interval() const { return interval_; }

private:
  bool try_claim();
  bool run_cycle(Trigger trigger);
  void run_claimed(Trigger trigger);
  void publish(const hostscope::model::CollectionResult& result);
  void run(std::stop_token st);

  SnapshotManager& manager_;
  SnapshotStore& store_;
  const std::chrono::milliseconds interval_;
  std::atomic<bool> auto_;
  std::atomic<bool> in_flight_{false};
  std::atomic<uint64_t> cycles_{0};
  std::atomic<uint64_t> dropped_{0};

  std::mutex mu_;
  std::condition_variable_any cv_;
  bool manual_pending_{false};

  std::mutex listener_mu_;
  Listener listener_;

  std::jthread thread_{};
};

const char* to_string(RefreshScheduler::State s);

} // namespace hostscope::app
