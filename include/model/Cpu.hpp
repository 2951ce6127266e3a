#pragma once
#include <cstdint>
#include <optional>

namespace hostscope::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

// MHz
struct CpuFrequency {
  double current{};
  double min{};
  double max{};
};

struct Cpu {
  int physical_cores{0};
  int total_cores{0};                     // logical
  std::optional<CpuFrequency> frequency;  // absent when the platform cannot report it
  double current_usage{};                 // 0..100
};

} // namespace hostscope::model
