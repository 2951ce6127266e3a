#pragma once
#include "collectors/ICollector.hpp"

namespace hostscope::collectors {

class MemoryCollector : public ICollector<hostscope::model::Memory> {
public:
  bool sample(hostscope::model::Memory& out) override; // false if /proc/meminfo is unreadable
  const char* name() const override { return "memory"; }

  // MemTotal in bytes, 0 if unavailable
  static uint64_t read_total_bytes();
};

} // namespace hostscope::collectors
