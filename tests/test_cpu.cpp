#include "minitest.hpp"
#include "fixtures.hpp"
#include "collectors/CpuCollector.hpp"

using fixtures::EnvGuard;
using fixtures::write_file;

static const char* kCpuinfo4 =
  "processor\t: 0\nphysical id\t: 0\ncore id\t\t: 0\ncpu MHz\t\t: 2000.000\n\n"
  "processor\t: 1\nphysical id\t: 0\ncore id\t\t: 1\ncpu MHz\t\t: 3000.000\n\n"
  "processor\t: 2\nphysical id\t: 0\ncore id\t\t: 0\ncpu MHz\t\t: 2000.000\n\n"
  "processor\t: 3\nphysical id\t: 0\ncore id\t\t: 1\ncpu MHz\t\t: 3000.000\n\n";

TEST(cpu_usage_between_half_busy) {
  hostscope::model::CpuTimes a{}, b{};
  a.user = 100; a.system = 100; a.idle = 1000;
  b.user = 150; b.system = 150; b.idle = 1100;
  ASSERT_NEAR(hostscope::collectors::CpuCollector::usage_between(a, b), 50.0, 1e-9);
  // No time elapsed: 0, never a division by zero
  ASSERT_NEAR(hostscope::collectors::CpuCollector::usage_between(a, a), 0.0, 1e-9);
}

TEST(cpu_collector_delta_usage) {
  auto root = fixtures::make_root("cpu_delta");
  write_file(root / "proc/stat", "cpu  100 0 100 1000 0 0 0 0\n"
                                 "cpu0 100 0 100 1000 0 0 0 0\n");
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  EnvGuard sys("HOSTSCOPE_SYS_ROOT", root.string());
  hostscope::collectors::CpuCollector c{std::chrono::milliseconds(0)};
  hostscope::model::Cpu s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_NEAR(s.current_usage, 0.0, 1e-9);
  write_file(root / "proc/stat", "cpu  150 0 150 1100 0 0 0 0\n"
                                 "cpu0 150 0 150 1100 0 0 0 0\n");
  ASSERT_TRUE(c.sample(s));
  ASSERT_TRUE(s.current_usage > 40.0 && s.current_usage < 60.0);
}

TEST(cpu_collector_counts_cores) {
  auto root = fixtures::make_root("cpu_cores");
  write_file(root / "proc/stat", "cpu  1 0 1 10 0 0 0 0\ncpu0 1 0 1 10 0 0 0 0\ncpu1 0 0 0 0 0 0 0 0\n"
                                 "cpu2 0 0 0 0 0 0 0 0\ncpu3 0 0 0 0 0 0 0 0\nintr 0\n");
  write_file(root / "proc/cpuinfo", kCpuinfo4);
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  EnvGuard sys("HOSTSCOPE_SYS_ROOT", root.string());
  hostscope::collectors::CpuCollector c{std::chrono::milliseconds(0)};
  hostscope::model::Cpu s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.total_cores, 4);
  ASSERT_EQ(s.physical_cores, 2);
}

TEST(cpu_frequency_from_cpufreq) {
  auto root = fixtures::make_root("cpu_freq");
  write_file(root / "proc/stat", "cpu  1 0 1 10 0 0 0 0\ncpu0 1 0 1 10 0 0 0 0\n");
  auto base = root / "sys/devices/system/cpu/cpu0/cpufreq";
  write_file(base / "scaling_cur_freq", "2400000\n");
  write_file(base / "cpuinfo_min_freq", "800000\n");
  write_file(base / "cpuinfo_max_freq", "3600000\n");
  // not a cpu directory
  write_file(root / "sys/devices/system/cpu/cpufreq/boost", "1\n");
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  EnvGuard sys("HOSTSCOPE_SYS_ROOT", root.string());
  auto f = hostscope::collectors::CpuCollector::read_frequency();
  ASSERT_TRUE(f.has_value());
  ASSERT_NEAR(f->current, 2400.0, 1e-6);
  ASSERT_NEAR(f->min, 800.0, 1e-6);
  ASSERT_NEAR(f->max, 3600.0, 1e-6);
}

TEST(cpu_frequency_cpuinfo_fallback) {
  auto root = fixtures::make_root("cpu_freq_fallback");
  write_file(root / "proc/cpuinfo", kCpuinfo4);
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  EnvGuard sys("HOSTSCOPE_SYS_ROOT", root.string());
  auto f = hostscope::collectors::CpuCollector::read_frequency();
  ASSERT_TRUE(f.has_value());
  ASSERT_NEAR(f->current, 2500.0, 1e-6);
  ASSERT_NEAR(f->max, 0.0, 1e-9);
}

TEST(cpu_frequency_absent) {
  auto root = fixtures::make_root("cpu_freq_absent");
  write_file(root / "proc/stat", "cpu  1 0 1 10 0 0 0 0\ncpu0 1 0 1 10 0 0 0 0\n");
  write_file(root / "proc/cpuinfo", "processor\t: 0\n\n");
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  EnvGuard sys("HOSTSCOPE_SYS_ROOT", root.string());
  ASSERT_FALSE(hostscope::collectors::CpuCollector::read_frequency().has_value());
  // Missing frequency is not a failure of the category
  hostscope::collectors::CpuCollector c{std::chrono::milliseconds(0)};
  hostscope::model::Cpu s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_FALSE(s.frequency.has_value());
}

TEST(cpu_collector_fails_without_proc_stat) {
  auto root = fixtures::make_root("cpu_missing");
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  hostscope::collectors::CpuCollector c{std::chrono::milliseconds(0)};
  hostscope::model::Cpu s{};
  ASSERT_FALSE(c.sample(s));
  ASSERT_TRUE(c.last_error().find("/proc/stat") != std::string::npos);
}
