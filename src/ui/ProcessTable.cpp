#include "ui/ProcessTable.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>

namespace hostscope::ui {

std::vector<hostscope::model::ProcessInfo> top_by_memory(const hostscope::model::Process& p, size_t n) {
  std::vector<hostscope::model::ProcessInfo> out(p.running_processes);
  auto by_mem = [](const auto& a, const auto& b){
    if (a.memory_percent != b.memory_percent) return a.memory_percent > b.memory_percent;
    return a.pid < b.pid;
  };
  if (out.size() > n) {
    std::partial_sort(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(n), out.end(), by_mem);
    out.resize(n);
  } else {
    std::sort(out.begin(), out.end(), by_mem);
  }
  return out;
}

// Memory column: yellow from 5%, red from 10% of RAM
static std::string fmt_mem_field(double pct, int w) {
  std::string padded = rpad_trunc(format_percent(pct), w);
  if (pct < 5.0) return padded;
  return sgr(pct >= 10.0 ? "31" : "33") + padded + sgr_reset();
}

std::vector<std::string> render_process_table(
    const hostscope::model::Snapshot& s,
    int width,
    int target_rows,
    size_t max_processes
) {
  int iw = std::max(3, width - 2);
  const int pid_w = 7, user_w = 10, mem_w = 7;
  int name_w = std::max(4, iw - (pid_w + 1) - (user_w + 1) - mem_w - 1);

  auto row = [&](const std::string& pid, const std::string& name,
                 const std::string& user, const std::string& mem){
    return rpad_trunc(pid, pid_w) + " " + trunc_pad(name, name_w) + " " +
           trunc_pad(user, user_w) + " " + mem;
  };

  std::vector<std::string> lines;
  lines.push_back(sgr_bold() + row("PID", "NAME", "USER", rpad_trunc("MEM%", mem_w)) + sgr_reset());
  auto top = top_by_memory(s.process, max_processes);
  if (top.empty()) {
    lines.push_back("No processes available");
  }
  int room = std::max(1, target_rows - 3);
  for (const auto& p : top) {
    if (static_cast<int>(lines.size()) >= room) break;
    lines.push_back(row(std::to_string(p.pid), p.name,
                        p.username.empty() ? std::string("?") : p.username,
                        fmt_mem_field(p.memory_percent, mem_w)));
  }
  std::string title = "PROCESSES " + std::to_string(top.size()) + "/" +
                      std::to_string(s.process.total_processes);
  return make_box(title, lines, width, std::max(0, target_rows - 2));
}

} // namespace hostscope::ui
