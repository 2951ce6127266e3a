#include "ui/Panels.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>

namespace hostscope::ui {

// First word of the runtime banner: "hostscope 1.0.0 (GCC ...)" -> "hostscope 1.0.0"
static std::string runtime_short(const std::string& v) {
  auto paren = v.find(" (");
  return paren == std::string::npos ? v : v.substr(0, paren);
}

std::vector<std::string> render_system_panel(const hostscope::model::Snapshot& s, int iw) {
  const auto& p = s.platform;
  std::vector<std::string> lines;
  lines.push_back(lr_align(iw, "OS", p.system + " " + p.release));
  lines.push_back("Version: " + p.version);
  lines.push_back(lr_align(iw, "Machine", p.machine));
  lines.push_back("Processor: " + p.processor);
  lines.push_back(lr_align(iw, "Architecture", p.architecture.bits + " " + p.architecture.linkage));
  lines.push_back(lr_align(iw, "Runtime", runtime_short(p.runtime_version)));
  return lines;
}

std::vector<std::string> render_hardware_panel(const hostscope::model::Snapshot& s, int iw) {
  const auto& cpu = s.hardware.cpu;
  const auto& mem = s.hardware.memory;
  std::vector<std::string> lines;
  lines.push_back(lr_align(iw, "CPU Cores",
      std::to_string(cpu.physical_cores) + " Physical / " + std::to_string(cpu.total_cores) + " Logical"));
  if (cpu.frequency) {
    std::string f = format_mhz(cpu.frequency->current);
    if (cpu.frequency->max > 0.0) f += " (max " + format_mhz(cpu.frequency->max) + ")";
    lines.push_back(lr_align(iw, "Frequency", f));
  }
  // label(8) + space + bar + space + pct(6)
  int barw = std::max(5, iw - 8 - 1 - 2 - 1 - 6);
  auto bar_line = [&](const char* label, double pct){
    return trunc_pad(label, 8) + " " + usage_color(pct) + usage_bar(pct, barw) + sgr_reset() +
           " " + rpad_trunc(format_percent(pct), 6);
  };
  lines.push_back(bar_line("CPU", cpu.current_usage));
  lines.push_back(bar_line("Memory", mem.percent));
  lines.push_back(lr_align(iw, "Memory Total", human_bytes(mem.total)));
  lines.push_back(lr_align(iw, "Memory Used", human_bytes(mem.used) + " (" + format_percent(mem.percent) + ")"));
  lines.push_back(lr_align(iw, "Memory Available", human_bytes(mem.available)));
  return lines;
}

std::vector<std::string> render_network_panel(const hostscope::model::Snapshot& s, int iw) {
  const auto& n = s.network;
  std::vector<std::string> lines;
  lines.push_back(lr_align(iw, "Hostname", n.hostname));
  lines.push_back(lr_align(iw, "IP Address", n.ip_address));
  lines.push_back(lr_align(iw, "MAC Address", n.mac_address));
  for (const auto& [name, addrs] : n.interfaces) {
    lines.push_back(sgr_fg_cyan() + name + ":" + sgr_reset());
    for (const auto& a : addrs)
      lines.push_back("  - " + a.address + " (" + a.family + ")");
  }
  return lines;
}

std::vector<std::string> render_disk_panel(const hostscope::model::Snapshot& s, int iw) {
  std::vector<std::string> lines;
  if (s.hardware.disks.empty()) {
    lines.push_back("No disks");
    return lines;
  }
  for (const auto& [dev, d] : s.hardware.disks) {
    lines.push_back(lr_align(iw, sgr_bold() + dev + sgr_reset(), "(" + d.filesystem + ")"));
    lines.push_back(lr_align(iw, "  Mount", d.mountpoint));
    lines.push_back(lr_align(iw, "  Used",
        human_bytes(d.used) + " / " + human_bytes(d.total) + " " +
        usage_color(d.percent) + format_percent(d.percent) + sgr_reset()));
    lines.push_back(lr_align(iw, "  Free", human_bytes(d.free)));
  }
  return lines;
}

std::vector<std::string> render_right_column(const hostscope::model::Snapshot& s, int width, int target_rows) {
  std::vector<std::string> out;
  int iw = std::max(3, width - 2);
  auto box_add = [&](const std::string& title, const std::vector<std::string>& lines){
    auto b = make_box(title, lines, width);
    out.insert(out.end(), b.begin(), b.end());
  };
  box_add("SYSTEM", render_system_panel(s, iw));
  box_add("HARDWARE", render_hardware_panel(s, iw));
  // Disks get whatever the network box leaves over
  auto net = render_network_panel(s, iw);
  auto disks = render_disk_panel(s, iw);
  int left_over = target_rows - static_cast<int>(out.size()) - 4;
  int net_rows = std::min<int>(static_cast<int>(net.size()), std::max(3, left_over / 2));
  if (static_cast<int>(net.size()) > net_rows) net.resize(static_cast<size_t>(net_rows));
  box_add("NETWORK", net);
  int disk_rows = std::max(1, target_rows - static_cast<int>(out.size()) - 2);
  if (static_cast<int>(disks.size()) > disk_rows) disks.resize(static_cast<size_t>(disk_rows));
  box_add("DISKS", disks);
  return out;
}

} // namespace hostscope::ui
