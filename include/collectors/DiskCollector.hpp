#pragma once
#include <string>
#include <unordered_set>
#include "collectors/ICollector.hpp"

namespace hostscope::collectors {

// Usage of mounted physical partitions, keyed by device
class DiskCollector : public ICollector<hostscope::model::DiskMap> {
public:
  bool sample(hostscope::model::DiskMap& out) override;
  const char* name() const override { return "disk"; }

  // statvfs() one mountpoint. false when the filesystem cannot be queried.
  static bool usage_of(const std::string& mountpoint, hostscope::model::DiskUsage& out);

  // "/mnt/my\040disk" -> "/mnt/my disk"
  static std::string unescape_mount_field(const std::string& s);

private:
  static std::unordered_set<std::string> physical_fs_types();
};

} // namespace hostscope::collectors
