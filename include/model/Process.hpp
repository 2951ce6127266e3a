#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hostscope::model {

struct ProcessInfo {
  int32_t pid{};
  std::string name;
  std::string username;     // empty when unknown
  double memory_percent{};  // 0..100
};

struct Process {
  // Counted by a separate enumeration pass; may differ from running_processes.size()
  size_t total_processes{};
  std::vector<ProcessInfo> running_processes; // ascending pid
};

} // namespace hostscope::model
