#include "minitest.hpp"
#include "mock_collectors.hpp"

using hostscope::app::SnapshotManager;

TEST(manager_end_to_end_with_mocks) {
  mocks::MockSet m{};
  SnapshotManager mgr(mocks::make_mock_set(m));
  auto r = mgr.collect();
  ASSERT_TRUE(r.ok());
  const auto& s = *r.snapshot();
  ASSERT_NEAR(s.hardware.memory.percent, 50.0, 1e-9);
  ASSERT_NEAR(s.hardware.cpu.current_usage, 42.0, 1e-9);
  ASSERT_NEAR(s.hardware.disks.at("/dev/sda1").percent, 55.0, 1e-9);
  ASSERT_EQ(s.process.running_processes.size(), 1u);
  ASSERT_EQ(s.process.running_processes[0].pid, 1);
  ASSERT_EQ(s.platform.system, std::string("Linux"));
  ASSERT_EQ(s.network.hostname, std::string("box"));
  ASSERT_EQ(s.seq, 1u);
}

TEST(manager_failure_names_category) {
  mocks::MockSet m{};
  SnapshotManager mgr(mocks::make_mock_set(m));
  m.network->fail_with("cannot resolve 'box': Name or service not known");
  auto r = mgr.collect();
  ASSERT_FALSE(r.ok());
  ASSERT_EQ(r.error().category, std::string("network"));
  ASSERT_TRUE(r.error().cause.find("cannot resolve") != std::string::npos);
  // later collectors never ran
  ASSERT_EQ(m.hardware->calls.load(), 0);
  ASSERT_EQ(m.process->calls.load(), 0);
}

TEST(manager_fixed_collector_order) {
  mocks::MockSet m{};
  SnapshotManager mgr(mocks::make_mock_set(m));
  m.hardware->fail_with("/proc/stat unreadable");
  m.process->fail_with("cannot list /proc");
  auto r = mgr.collect();
  ASSERT_FALSE(r.ok());
  ASSERT_EQ(r.error().category, std::string("hardware"));
  ASSERT_EQ(m.platform->calls.load(), 1);
  ASSERT_EQ(m.network->calls.load(), 1);
}

TEST(manager_converts_exceptions_to_failures) {
  mocks::MockSet m{};
  SnapshotManager mgr(mocks::make_mock_set(m));
  m.process->throw_with("bad_alloc-ish");
  auto r = mgr.collect();
  ASSERT_FALSE(r.ok());
  ASSERT_EQ(r.error().category, std::string("process"));
  ASSERT_EQ(r.error().cause, std::string("bad_alloc-ish"));
}

TEST(manager_timestamps_strictly_increase) {
  mocks::MockSet m{};
  SnapshotManager mgr(mocks::make_mock_set(m));
  auto a = mgr.collect();
  auto b = mgr.collect();
  auto c = mgr.collect();
  ASSERT_TRUE(a.ok() && b.ok() && c.ok());
  ASSERT_TRUE(a.snapshot()->timestamp < b.snapshot()->timestamp);
  ASSERT_TRUE(b.snapshot()->timestamp < c.snapshot()->timestamp);
  ASSERT_TRUE(a.snapshot()->seq < b.snapshot()->seq);
}

TEST(manager_snapshots_are_independent) {
  mocks::MockSet m{};
  SnapshotManager mgr(mocks::make_mock_set(m));
  auto first = mgr.collect();
  auto hw = mocks::sample_hardware();
  hw.cpu.current_usage = 99.0;
  m.hardware->set(hw);
  auto second = mgr.collect();
  ASSERT_NEAR(first.snapshot()->hardware.cpu.current_usage, 42.0, 1e-9);
  ASSERT_NEAR(second.snapshot()->hardware.cpu.current_usage, 99.0, 1e-9);
}

TEST(manager_requires_every_collector) {
  hostscope::app::CollectorSet empty;
  bool threw = false;
  try { SnapshotManager mgr(std::move(empty)); } catch (const std::invalid_argument&) { threw = true; }
  ASSERT_TRUE(threw);
}

TEST(iso8601_has_microseconds) {
  using namespace std::chrono;
  auto tp = system_clock::time_point(seconds(1700000000)) + microseconds(123456);
  auto s = hostscope::model::iso8601(tp);
  ASSERT_EQ(s.size(), 26u);
  ASSERT_EQ(s[10], 'T');
  ASSERT_EQ(s.substr(19), std::string(".123456"));
}
