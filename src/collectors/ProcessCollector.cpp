#include "collectors/ProcessCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace hostscope::collectors {

bool ProcessCollector::parse_stat_line(const std::string& content, std::string& comm, char& state) {
  // comm may itself contain spaces and parentheses; it ends at the last ')'
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 >= content.size()) return false;
  comm = content.substr(lp + 1, rp - lp - 1);
  state = content[rp + 2];
  return true;
}

const std::string& ProcessCollector::user_name_cached(uint32_t uid) {
  auto it = users_.find(uid);
  if (it != users_.end()) return it->second;
  std::string name;
  std::ifstream pw("/etc/passwd"); std::string pl;
  while (std::getline(pw, pl)) {
    auto c1 = pl.find(':'); if (c1 == std::string::npos) continue;
    auto c2 = pl.find(':', c1 + 1); if (c2 == std::string::npos) continue;
    auto c3 = pl.find(':', c2 + 1); if (c3 == std::string::npos) continue;
    uint32_t fuid = std::strtoul(pl.c_str() + c2 + 1, nullptr, 10);
    if (fuid == uid) { name = pl.substr(0, c1); break; }
  }
  // Unmapped uid (container, deleted account): show the number
  if (name.empty()) name = std::to_string(uid);
  return users_.emplace(uid, std::move(name)).first->second;
}

// nullopt: status unreadable. Empty string: no Uid line.
std::optional<std::string> ProcessCollector::user_from_status(int32_t pid) {
  auto txt = hostscope::util::read_file_string("/proc/" + std::to_string(pid) + "/status");
  if (!txt) return std::nullopt;
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("Uid:", 0) == 0) {
      std::istringstream ls(line.substr(4));
      uint32_t uid = 0;
      if (!(ls >> uid)) return std::string();
      return user_name_cached(uid);
    }
  }
  return std::string();
}

std::optional<hostscope::model::ProcessInfo> ProcessCollector::read_process(int32_t pid, uint64_t mem_total_bytes) {
  const std::string base = "/proc/" + std::to_string(pid);
  auto stat = hostscope::util::read_file_string(base + "/stat");
  if (!stat) return std::nullopt; // exited
  hostscope::model::ProcessInfo p;
  p.pid = pid;
  char state = '?';
  if (!parse_stat_line(*stat, p.name, state)) return std::nullopt;
  if (state == 'Z') return std::nullopt;

  auto user = user_from_status(pid);
  if (!user) return std::nullopt;
  p.username = std::move(*user);

  auto statm = hostscope::util::read_file_string(base + "/statm");
  if (!statm) return std::nullopt;
  std::istringstream ms(*statm);
  uint64_t size_pages = 0, rss_pages = 0;
  if (!(ms >> size_pages >> rss_pages)) return std::nullopt;
  uint64_t rss_bytes = rss_pages * static_cast<uint64_t>(::sysconf(_SC_PAGESIZE));
  p.memory_percent = mem_total_bytes ? 100.0 * static_cast<double>(rss_bytes) / static_cast<double>(mem_total_bytes) : 0.0;
  return p;
}

static std::vector<int32_t> numeric_pids(const std::vector<std::string>& names) {
  std::vector<int32_t> pids;
  pids.reserve(names.size());
  for (const auto& n : names) {
    if (hostscope::util::is_numeric(n)) pids.push_back(static_cast<int32_t>(std::strtol(n.c_str(), nullptr, 10)));
  }
  return pids;
}

bool ProcessCollector::sample(hostscope::model::Process& out) {
  clear_error();
  out.running_processes.clear();
  out.total_processes = 0;

  uint64_t mem_total = MemoryCollector::read_total_bytes();
  if (mem_total == 0) return fail("/proc/meminfo unreadable or missing MemTotal");

  auto first = hostscope::util::try_list_dir("/proc");
  if (!first) return fail("cannot list /proc");
  out.total_processes = numeric_pids(*first).size();

  auto second = hostscope::util::try_list_dir("/proc");
  if (!second) return fail("cannot list /proc");
  auto pids = numeric_pids(*second);
  std::sort(pids.begin(), pids.end());
  out.running_processes.reserve(pids.size());
  for (int32_t pid : pids) {
    if (auto p = read_process(pid, mem_total)) out.running_processes.push_back(std::move(*p));
  }
  return true;
}

} // namespace hostscope::collectors
