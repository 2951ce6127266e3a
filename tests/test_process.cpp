#include "minitest.hpp"
#include "fixtures.hpp"
#include "collectors/ProcessCollector.hpp"
#include <unistd.h>

using fixtures::EnvGuard;
using fixtures::write_file;

static void add_pid(const std::filesystem::path& root, int pid, const std::string& stat,
                    const std::string& uid_line, const std::string& statm) {
  auto dir = root / "proc" / std::to_string(pid);
  std::filesystem::create_directories(dir);
  if (!stat.empty()) write_file(dir / "stat", stat);
  write_file(dir / "status", "Name:\tx\n" + uid_line);
  if (!statm.empty()) write_file(dir / "statm", statm);
}

TEST(process_collector_two_pass_scan) {
  auto root = fixtures::make_root("proc");
  write_file(root / "proc/meminfo", fixtures::kMeminfo16G);
  add_pid(root, 1, "1 (init) S 0 1 1 0 -1 4194560\n", "Uid:\t0\t0\t0\t0\n", "4000 100 50 1 0 200 0\n");
  add_pid(root, 42, "42 (my (odd) proc) R 1 42 42 0 -1 0\n", "Uid:\t0\t0\t0\t0\n", "10 5 1 1 0 2 0\n");
  add_pid(root, 7, "7 (defunct) Z 1 7 7 0 -1 0\n", "Uid:\t0\t0\t0\t0\n", "0 0 0 0 0 0 0\n");
  // exited between the passes: directory listed, stat gone
  add_pid(root, 99, "", "Uid:\t0\t0\t0\t0\n", "");
  write_file(root / "proc/uptime", "1.0 1.0\n");

  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  hostscope::collectors::ProcessCollector c; hostscope::model::Process p{};
  ASSERT_TRUE(c.sample(p));
  ASSERT_EQ(p.total_processes, 4u);
  ASSERT_EQ(p.running_processes.size(), 2u);
  ASSERT_TRUE(p.total_processes != p.running_processes.size());

  const auto& init = p.running_processes[0];
  ASSERT_EQ(init.pid, 1);
  ASSERT_EQ(init.name, std::string("init"));
  ASSERT_FALSE(init.username.empty());
  double expect = 100.0 * 100.0 * static_cast<double>(::sysconf(_SC_PAGESIZE)) / (16000000.0 * 1024.0);
  ASSERT_NEAR(init.memory_percent, expect, 1e-9);

  ASSERT_EQ(p.running_processes[1].pid, 42);
  ASSERT_EQ(p.running_processes[1].name, std::string("my (odd) proc"));
}

TEST(process_collector_missing_uid_line_is_empty_user) {
  auto root = fixtures::make_root("proc_nouid");
  write_file(root / "proc/meminfo", fixtures::kMeminfo16G);
  add_pid(root, 5, "5 (kworker) I 2 0 0 0 -1 0\n", "", "0 0 0 0 0 0 0\n");
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  hostscope::collectors::ProcessCollector c; hostscope::model::Process p{};
  ASSERT_TRUE(c.sample(p));
  ASSERT_EQ(p.running_processes.size(), 1u);
  ASSERT_TRUE(p.running_processes[0].username.empty());
  ASSERT_NEAR(p.running_processes[0].memory_percent, 0.0, 1e-12);
}

TEST(process_collector_fails_without_meminfo) {
  auto root = fixtures::make_root("proc_nomem");
  add_pid(root, 1, "1 (init) S 0\n", "Uid:\t0\n", "1 1\n");
  EnvGuard proc("HOSTSCOPE_PROC_ROOT", root.string());
  hostscope::collectors::ProcessCollector c; hostscope::model::Process p{};
  ASSERT_FALSE(c.sample(p));
  ASSERT_FALSE(c.last_error().empty());
}

TEST(process_parse_stat_line) {
  std::string comm; char state = 0;
  ASSERT_TRUE(hostscope::collectors::ProcessCollector::parse_stat_line("12 (a) b) S 1 2", comm, state));
  ASSERT_EQ(comm, std::string("a) b"));
  ASSERT_EQ(state, 'S');
  ASSERT_FALSE(hostscope::collectors::ProcessCollector::parse_stat_line("12 (trunc", comm, state));
  ASSERT_FALSE(hostscope::collectors::ProcessCollector::parse_stat_line("12 (x)", comm, state));
}
