#pragma once
#include <chrono>
#include "collectors/CpuCollector.hpp"
#include "collectors/DiskCollector.hpp"
#include "collectors/MemoryCollector.hpp"

namespace hostscope::collectors {

// CPU, memory and disks. The CPU usage sample blocks for cpu_sample_interval;
// that wait is the bounded latency every cycle pays.
class HardwareCollector : public IHardwareCollector {
public:
  explicit HardwareCollector(std::chrono::milliseconds cpu_sample_interval = std::chrono::milliseconds(1000));
  bool sample(hostscope::model::Hardware& out) override;
  const char* name() const override { return "hardware"; }

private:
  CpuCollector cpu_;
  MemoryCollector mem_;
  DiskCollector disk_;
};

} // namespace hostscope::collectors
