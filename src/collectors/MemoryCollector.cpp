#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>

namespace hostscope::collectors {

static inline uint64_t parse_u64(const std::string_view& sv) {
  uint64_t v = 0;
  auto s = sv;
  // strip non-digits on right (e.g., kB)
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  // strip spaces on left
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

struct MemInfo {
  uint64_t total{}, free{}, available{}, buffers{}, cached{};
  bool has_available{false};
};

static bool read_meminfo(MemInfo& mi) {
  auto txt_opt = hostscope::util::read_file_string("/proc/meminfo");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) mi.total = parse_u64(line.substr(9)) * 1024;
    else if (line.starts_with("MemFree:")) mi.free = parse_u64(line.substr(8)) * 1024;
    else if (line.starts_with("MemAvailable:")) { mi.available = parse_u64(line.substr(13)) * 1024; mi.has_available = true; }
    else if (line.starts_with("Buffers:")) mi.buffers = parse_u64(line.substr(8)) * 1024;
    else if (line.starts_with("Cached:")) mi.cached += parse_u64(line.substr(7)) * 1024;
    else if (line.starts_with("SReclaimable:")) mi.cached += parse_u64(line.substr(13)) * 1024; // slab counted as cache
    start = end + 1;
  }
  return mi.total > 0;
}

uint64_t MemoryCollector::read_total_bytes() {
  MemInfo mi;
  return read_meminfo(mi) ? mi.total : 0;
}

bool MemoryCollector::sample(hostscope::model::Memory& out) {
  clear_error();
  MemInfo mi;
  if (!read_meminfo(mi)) return fail("/proc/meminfo unreadable or missing MemTotal");

  uint64_t reclaimable = mi.free + mi.buffers + mi.cached;
  out.total = mi.total;
  out.available = mi.has_available ? mi.available : reclaimable;
  if (out.available > out.total) out.available = out.total;
  out.used = (mi.total > reclaimable) ? (mi.total - reclaimable)
           : (mi.total > mi.free ? mi.total - mi.free : 0);
  out.percent = hostscope::model::percent_of(out.total - out.available, out.total);
  return true;
}

} // namespace hostscope::collectors
