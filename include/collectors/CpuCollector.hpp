#pragma once
#include <chrono>
#include <optional>
#include "collectors/ICollector.hpp"

namespace hostscope::collectors {

class CpuCollector : public ICollector<hostscope::model::Cpu> {
public:
  // sample_interval > 0: sample() blocks that long between two /proc/stat
  // reads. 0: usage is measured against the previous call (first call 0%).
  explicit CpuCollector(std::chrono::milliseconds sample_interval = std::chrono::milliseconds(1000));
  bool sample(hostscope::model::Cpu& out) override;
  const char* name() const override { return "cpu"; }

  static bool read_times(hostscope::model::CpuTimes& out);
  // Busy share of the interval between two readings, 0..100, one decimal
  static double usage_between(const hostscope::model::CpuTimes& before, const hostscope::model::CpuTimes& after);
  static std::optional<hostscope::model::CpuFrequency> read_frequency();

private:
  std::chrono::milliseconds sample_interval_;
  hostscope::model::CpuTimes last_{};
  bool has_last_{false};
};

} // namespace hostscope::collectors
