#pragma once
#include <cstdint>
#include <map>
#include <string>

namespace hostscope::model {

struct DiskUsage {
  std::string mountpoint;
  std::string filesystem;
  uint64_t total{};
  uint64_t used{};
  uint64_t free{};
  double   percent{}; // 0..100
};

// Device -> usage. Devices whose usage could not be read are not present.
using DiskMap = std::map<std::string, DiskUsage>;

} // namespace hostscope::model
