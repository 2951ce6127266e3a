#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Panels.hpp"
#include "ui/ProcessTable.hpp"
#include "ui/Terminal.hpp"
#include <unistd.h>
#include <algorithm>

namespace hostscope::ui {

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(static_cast<size_t>(std::max(0, n)) * ch.size());
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width, int min_height) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "╭" : "+";
  const std::string TR = uni? "╮" : "+";
  const std::string BL = uni? "╰" : "+";
  const std::string BR = uni? "╯" : "+";
  const std::string H  = uni? "─" : "-";
  const std::string V  = uni? "│" : "|";
  auto top = [&]{
    std::string t = "[ " + title + " ]";
    int fill = std::max(0, iw - display_cols(t));
    int left = fill / 2; int right = fill - left;
    return TL + repeat_str(H, left) + t + repeat_str(H, right) + TR;
  }();
  out.push_back(top);
  int content_lines = std::max(static_cast<int>(lines.size()), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < static_cast<int>(lines.size())) ? lines[static_cast<size_t>(i)] : std::string();
    std::string body = trunc_pad(ln, iw);
    // a truncated line can lose its closing reset
    if (body.find('\x1B') != std::string::npos) body += sgr_reset();
    out.push_back(V + body + V);
  }
  out.push_back(BL + repeat_str(H, iw) + BR);
  return out;
}

std::string colorize_line(const std::string& s) {
  if (!tty_stdout() || s.empty()) return s;
  const bool uni = use_unicode();
  const std::string V = uni ? "│" : "|";
  auto starts = [&](const char* p){ return s.rfind(p, 0) == 0; };
  bool border = uni ? (starts("╭") || starts("╰")) : (starts("+"));
  if (border) {
    size_t lb = s.find('[');
    size_t rb = (lb != std::string::npos) ? s.find(']', lb + 1) : std::string::npos;
    if (lb != std::string::npos && rb != std::string::npos) {
      return sgr_fg_grey() + s.substr(0, lb) + sgr_fg_cyan() + s.substr(lb, rb - lb + 1) +
             sgr_fg_grey() + s.substr(rb + 1) + sgr_reset();
    }
    return sgr_fg_grey() + s + sgr_reset();
  }
  if (starts(V.c_str())) {
    size_t last = s.rfind(V);
    if (last != std::string::npos && last > 0) {
      return sgr_fg_grey() + V + sgr_reset() + s.substr(V.size(), last - V.size()) +
             sgr_fg_grey() + V + sgr_reset() + s.substr(last + V.size());
    }
  }
  return s;
}

std::string last_update_text(const hostscope::model::Snapshot* s) {
  if (!s) return "Last Update: Never";
  return "Last Update: " + format_datetime(s->timestamp);
}

static std::string status_text(const View& v) {
  if (!v.notification.empty()) return v.notification;
  if (v.error) return "refresh failed: " + v.error->describe();
  return "q quit  r refresh  t toggle auto-refresh  e export";
}

std::vector<std::string> compose_frame(const View& v, int cols, int rows) {
  cols = std::max(40, cols);
  rows = std::max(8, rows);
  std::vector<std::string> frame;
  frame.reserve(static_cast<size_t>(rows));

  // Header
  std::string host = v.snapshot ? v.snapshot->network.hostname : std::string();
  std::string left = sgr_bold() + "HOSTSCOPE" + sgr_reset() + (host.empty() ? "" : "  " + host);
  std::string right = last_update_text(v.snapshot.get()) +
                      (v.collecting ? "  [collecting]" : "") +
                      "  Auto: " + (v.auto_refresh ? "ON" : "OFF");
  frame.push_back(lr_align(cols, left, right));

  int body_rows = rows - 2;
  std::vector<std::string> body;
  if (!v.snapshot) {
    std::string msg = v.error ? "No data: " + v.error->describe() : std::string("Collecting...");
    body = make_box("HOSTSCOPE", {msg}, cols, body_rows - 2);
  } else {
    const auto& s = *v.snapshot;
    int gutter = 1;
    int left_w = (cols * 55) / 100;
    if (cols - left_w - gutter < 30) left_w = std::max(30, cols - gutter - 30);
    int right_w = cols - left_w - gutter;
    auto l = render_process_table(s, left_w, body_rows, v.max_processes);
    auto r = render_right_column(s, right_w, body_rows);
    for (int row = 0; row < body_rows; ++row) {
      std::string lc = row < static_cast<int>(l.size()) ? colorize_line(l[static_cast<size_t>(row)]) : std::string();
      std::string rc = row < static_cast<int>(r.size()) ? colorize_line(r[static_cast<size_t>(row)]) : std::string();
      body.push_back(trunc_pad(lc, left_w) + std::string(static_cast<size_t>(gutter), ' ') + trunc_pad(rc, right_w));
    }
  }
  body.resize(static_cast<size_t>(body_rows));
  for (auto& line : body) frame.push_back(trunc_pad(line, cols));

  std::string status = status_text(v);
  bool alert = v.notification.empty() && v.error;
  frame.push_back(alert ? sgr("31") + trunc_pad(status, cols) + sgr_reset() : trunc_pad(status, cols));
  return frame;
}

void render_screen(const View& v) {
  int cols = term_cols();
  int rows = term_rows();
  auto lines = compose_frame(v, cols, rows);
  std::string out;
  out.reserve(static_cast<size_t>(rows) * static_cast<size_t>(cols) + 64);
  out += "\x1B[H";
  for (size_t i = 0; i < lines.size(); ++i) {
    out += lines[i];
    if (i + 1 < lines.size()) out += "\n";
  }
  best_effort_write(STDOUT_FILENO, out.data(), out.size());
}

std::string render_text_report(const hostscope::model::Snapshot& s, std::size_t max_processes, int width) {
  int iw = std::max(38, width - 2);
  std::vector<std::string> all;
  auto add = [&](const std::string& title, const std::vector<std::string>& lines){
    auto b = make_box(title, lines, iw + 2);
    all.insert(all.end(), b.begin(), b.end());
  };
  all.push_back(last_update_text(&s));
  add("SYSTEM", render_system_panel(s, iw));
  add("HARDWARE", render_hardware_panel(s, iw));
  add("NETWORK", render_network_panel(s, iw));
  add("DISKS", render_disk_panel(s, iw));
  auto procs = render_process_table(s, iw + 2, static_cast<int>(max_processes) + 4, max_processes);
  all.insert(all.end(), procs.begin(), procs.end());
  std::string out;
  for (const auto& l : all) { out += colorize_line(l); out += '\n'; }
  return out;
}

} // namespace hostscope::ui
