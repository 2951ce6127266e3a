#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace hostscope::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // final byte
      continue;
    }
    i += u8_len(static_cast<unsigned char>(s[i]));
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++;
      out.append(s, start, i - start);
      continue;
    }
    size_t len = static_cast<size_t>(u8_len(static_cast<unsigned char>(s[i])));
    if (i + len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(static_cast<size_t>(w - cols), ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (use_unicode()? "…" : ".");
}

std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return std::string(static_cast<size_t>(w - cols), ' ') + s;
  return take_cols(s, w);
}

std::string lr_align(int iw, const std::string& left, const std::string& right){
  if (iw <= 0) return std::string();
  int rvis = display_cols(right);
  int tlw = std::max(0, iw - rvis - 1);
  std::string l = trunc_pad(left, tlw);
  int space = std::max(0, iw - display_cols(l) - rvis);
  return l + std::string(static_cast<size_t>(space), ' ') + right;
}

std::string human_bytes(uint64_t bytes) {
  if (bytes == 1) return "1 Byte";
  if (bytes < 1000) return std::to_string(bytes) + " Bytes";
  static constexpr const char* units[] = {"kB", "MB", "GB", "TB", "PB", "EB"};
  double v = static_cast<double>(bytes);
  int u = -1;
  while (v >= 1000.0 && u < 5) { v /= 1000.0; ++u; }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[u]);
  return buf;
}

std::string format_percent(double pct) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", pct);
  return buf;
}

std::string format_mhz(double mhz) {
  char buf[32];
  if (mhz >= 1000.0) std::snprintf(buf, sizeof(buf), "%.2f GHz", mhz / 1000.0);
  else std::snprintf(buf, sizeof(buf), "%.0f MHz", mhz);
  return buf;
}

std::string format_datetime(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm lt{};
  localtime_r(&t, &lt);
  char buf[64];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &lt) == 0) return std::string();
  return std::string(buf);
}

std::string usage_bar(double pct, int width) {
  if (width < 1) width = 1;
  pct = std::clamp(pct, 0.0, 100.0);
  int filled = static_cast<int>(std::round((pct / 100.0) * width));
  filled = std::min(filled, width);
  const bool uni = use_unicode();
  std::string s = "[";
  for (int i = 0; i < width; ++i) {
    if (i < filled) s += uni ? "█" : "#";
    else s += uni ? "░" : ".";
  }
  s += "]";
  return s;
}

} // namespace hostscope::ui
