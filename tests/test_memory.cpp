#include "minitest.hpp"
#include "fixtures.hpp"
#include "collectors/MemoryCollector.hpp"

using fixtures::EnvGuard;

TEST(memory_collector_parses_meminfo) {
  auto root = fixtures::make_root("mem");
  fixtures::write_file(root / "proc/meminfo",
    "MemTotal:       2097152 kB\n"
    "MemFree:         524288 kB\n"
    "MemAvailable:   1048576 kB\n"
    "Buffers:         131072 kB\n"
    "Cached:          262144 kB\n");
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  hostscope::collectors::MemoryCollector c; hostscope::model::Memory m{};
  ASSERT_TRUE(c.sample(m));
  ASSERT_EQ(m.total, 2097152ull * 1024);
  ASSERT_EQ(m.available, 1048576ull * 1024);
  // used excludes buffers and page cache
  ASSERT_EQ(m.used, (2097152ull - 524288 - 131072 - 262144) * 1024);
  ASSERT_NEAR(m.percent, 50.0, 1e-9);
}

TEST(memory_collector_counts_reclaimable_slab_as_cache) {
  auto root = fixtures::make_root("mem_slab");
  fixtures::write_file(root / "proc/meminfo",
    "MemTotal:       2097152 kB\n"
    "MemFree:         524288 kB\n"
    "MemAvailable:   1048576 kB\n"
    "Buffers:         131072 kB\n"
    "Cached:          262144 kB\n"
    "SwapCached:        4096 kB\n"
    "Slab:            300000 kB\n"
    "SReclaimable:    200000 kB\n"
    "SUnreclaim:      100000 kB\n");
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  hostscope::collectors::MemoryCollector c; hostscope::model::Memory m{};
  ASSERT_TRUE(c.sample(m));
  ASSERT_EQ(m.used, (2097152ull - 524288 - 131072 - 262144 - 200000) * 1024);
  ASSERT_NEAR(m.percent, 50.0, 1e-9);
}

TEST(memory_collector_without_memavailable) {
  auto root = fixtures::make_root("mem_old");
  fixtures::write_file(root / "proc/meminfo",
    "MemTotal:       1000 kB\n"
    "MemFree:         200 kB\n"
    "Buffers:         100 kB\n"
    "Cached:          100 kB\n");
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  hostscope::collectors::MemoryCollector c; hostscope::model::Memory m{};
  ASSERT_TRUE(c.sample(m));
  ASSERT_EQ(m.available, 400ull * 1024);
  ASSERT_NEAR(m.percent, 60.0, 1e-9);
}

TEST(memory_collector_fails_on_missing_file) {
  auto root = fixtures::make_root("mem_missing");
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  hostscope::collectors::MemoryCollector c; hostscope::model::Memory m{};
  ASSERT_FALSE(c.sample(m));
  ASSERT_FALSE(c.last_error().empty());
  ASSERT_EQ(hostscope::collectors::MemoryCollector::read_total_bytes(), 0u);
}

TEST(percent_of_rounds_and_guards_zero) {
  ASSERT_NEAR(hostscope::model::percent_of(1, 3), 33.3, 1e-9);
  ASSERT_NEAR(hostscope::model::percent_of(2, 3), 66.7, 1e-9);
  ASSERT_NEAR(hostscope::model::percent_of(5, 0), 0.0, 1e-9);
}
