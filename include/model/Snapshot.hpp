#pragma once
#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include "model/Platform.hpp"
#include "model/Net.hpp"
#include "model/Cpu.hpp"
#include "model/Disk.hpp"
#include "model/Process.hpp"

namespace hostscope::model {

struct Memory {
  uint64_t total{};
  uint64_t available{};
  uint64_t used{};
  double   percent{}; // 0..100
};

struct Hardware {
  Cpu cpu;
  Memory memory;
  DiskMap disks;
};

// One immutable capture of all categories. Built once per successful cycle
// and shared read-only; the next cycle supersedes it.
struct Snapshot {
  uint64_t seq{};
  std::chrono::system_clock::time_point timestamp{};
  Platform platform;
  Network network;
  Hardware hardware;
  Process process;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

// part/whole as a percentage rounded to one decimal; 0 when whole is 0
inline double percent_of(uint64_t part, uint64_t whole) {
  if (whole == 0) return 0.0;
  double pct = 100.0 * static_cast<double>(part) / static_cast<double>(whole);
  return std::round(pct * 10.0) / 10.0;
}

// ISO-8601 local time with microseconds: 2024-05-01T13:45:09.123456
std::string iso8601(std::chrono::system_clock::time_point tp);

} // namespace hostscope::model
