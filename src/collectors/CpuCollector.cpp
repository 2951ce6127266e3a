#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace hostscope::collectors {

static void parse_cpu_line(const std::string_view& line, hostscope::model::CpuTimes& out) {
  // line starts with 'cpu' or 'cpuN'
  size_t pos = line.find(' ');
  if (pos == std::string::npos) return;
  std::string_view rest = line.substr(pos + 1);
  // read 8 numbers
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) {
      vals[i++] = std::strtoull(std::string(rest.substr(start, end - start)).c_str(), nullptr, 10);
    }
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

static std::string field_value(const std::string& line) {
  auto pos = line.find(':');
  if (pos == std::string::npos) return {};
  std::string v = line.substr(pos + 1);
  while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
  while (!v.empty() && (v.back() == ' ' || v.back() == '\t' || v.back() == '\r')) v.pop_back();
  return v;
}

CpuCollector::CpuCollector(std::chrono::milliseconds sample_interval)
  : sample_interval_(sample_interval) {}

bool CpuCollector::read_times(hostscope::model::CpuTimes& out) {
  auto txt = hostscope::util::read_first_line("/proc/stat");
  if (!txt || txt->rfind("cpu ", 0) != 0) return false;
  parse_cpu_line(*txt, out);
  return true;
}

double CpuCollector::usage_between(const hostscope::model::CpuTimes& before, const hostscope::model::CpuTimes& after) {
  if (after.total() <= before.total()) return 0.0;
  double td = static_cast<double>(after.total() - before.total());
  double wd = after.work() > before.work() ? static_cast<double>(after.work() - before.work()) : 0.0;
  double pct = std::min(100.0, 100.0 * wd / td);
  return std::round(pct * 10.0) / 10.0;
}

// logical = cpuN lines in /proc/stat; physical = unique (physical id, core id)
static std::pair<int, int> count_cores() {
  int logical = 0;
  if (auto stat = hostscope::util::read_file_string("/proc/stat")) {
    std::istringstream ss(*stat); std::string line;
    while (std::getline(ss, line)) {
      if (line.size() > 3 && line.rfind("cpu", 0) == 0 && line[3] >= '0' && line[3] <= '9') ++logical;
    }
  }
  int processors = 0;
  std::set<std::pair<std::string, std::string>> cores;
  if (auto info = hostscope::util::read_file_string("/proc/cpuinfo")) {
    std::istringstream ss(*info); std::string line;
    std::string phys, core;
    auto flush = [&]{ if (!core.empty()) cores.emplace(phys, core); phys.clear(); core.clear(); };
    while (std::getline(ss, line)) {
      if (line.rfind("processor", 0) == 0) ++processors;
      else if (line.rfind("physical id", 0) == 0) phys = field_value(line);
      else if (line.rfind("core id", 0) == 0) core = field_value(line);
      else if (line.empty()) flush();
    }
    flush();
  }
  if (logical == 0) logical = processors;
  int physical = cores.empty() ? logical : static_cast<int>(cores.size());
  return {physical, logical};
}

std::optional<hostscope::model::CpuFrequency> CpuCollector::read_frequency() {
  auto khz = [](const std::string& path) -> double {
    auto v = hostscope::util::read_first_line(path);
    if (!v || v->empty()) return -1.0;
    char* end = nullptr;
    double d = std::strtod(v->c_str(), &end);
    return (end == v->c_str()) ? -1.0 : d;
  };
  double cur = 0.0, mn = 0.0, mx = 0.0; int n = 0;
  for (const auto& entry : hostscope::util::list_dir("/sys/devices/system/cpu")) {
    if (entry.size() < 4 || entry.rfind("cpu", 0) != 0 || !hostscope::util::is_numeric(entry.substr(3))) continue;
    std::string base = "/sys/devices/system/cpu/" + entry + "/cpufreq/";
    double c = khz(base + "scaling_cur_freq");
    if (c < 0) c = khz(base + "cpuinfo_cur_freq");
    if (c < 0) continue;
    double lo = khz(base + "cpuinfo_min_freq"); if (lo < 0) lo = khz(base + "scaling_min_freq");
    double hi = khz(base + "cpuinfo_max_freq"); if (hi < 0) hi = khz(base + "scaling_max_freq");
    cur += c; mn += std::max(0.0, lo); mx += std::max(0.0, hi); ++n;
  }
  if (n > 0) {
    return hostscope::model::CpuFrequency{cur / n / 1000.0, mn / n / 1000.0, mx / n / 1000.0};
  }
  // No cpufreq driver: average the "cpu MHz" lines, min/max unknown
  auto info = hostscope::util::read_file_string("/proc/cpuinfo");
  if (!info) return std::nullopt;
  std::istringstream ss(*info); std::string line;
  double sum = 0.0; int m = 0;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu MHz", 0) != 0) continue;
    std::string v = field_value(line);
    char* end = nullptr;
    double mhz = std::strtod(v.c_str(), &end);
    if (end != v.c_str()) { sum += mhz; ++m; }
  }
  if (m == 0) return std::nullopt;
  return hostscope::model::CpuFrequency{sum / m, 0.0, 0.0};
}

bool CpuCollector::sample(hostscope::model::Cpu& out) {
  clear_error();
  hostscope::model::CpuTimes before{};
  if (sample_interval_.count() > 0) {
    if (!read_times(before)) return fail("/proc/stat unreadable");
    std::this_thread::sleep_for(sample_interval_);
  } else if (has_last_) {
    before = last_;
  }
  hostscope::model::CpuTimes after{};
  if (!read_times(after)) return fail("/proc/stat unreadable");
  bool have_before = sample_interval_.count() > 0 || has_last_;
  out.current_usage = have_before ? usage_between(before, after) : 0.0;
  last_ = after; has_last_ = true;

  auto [physical, logical] = count_cores();
  out.physical_cores = physical;
  out.total_cores = logical;
  out.frequency = read_frequency();
  return true;
}

} // namespace hostscope::collectors
