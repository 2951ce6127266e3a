#include "collectors/DiskCollector.hpp"
#include "util/Procfs.hpp"

#include <sys/statvfs.h>
#include <sstream>

namespace hostscope::collectors {

static bool is_pseudo_fs(const std::string& fstype) {
  static const std::unordered_set<std::string> bad = {
    "proc","sysfs","devtmpfs","devpts","tmpfs","cgroup","cgroup2","pstore","securityfs",
    "bpf","autofs","mqueue","hugetlbfs","configfs","debugfs","tracefs","nsfs","ramfs",
    "fusectl","fuse.portal","overlay","squashfs"
  };
  return bad.count(fstype) != 0;
}

std::unordered_set<std::string> DiskCollector::physical_fs_types() {
  std::unordered_set<std::string> types;
  auto txt = hostscope::util::read_file_string("/proc/filesystems");
  if (!txt) return types;
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.empty() || line.rfind("nodev", 0) == 0) continue;
    std::istringstream ls(line); std::string t;
    if (ls >> t) types.insert(t);
  }
  // zfs registers itself as nodev but holds real data
  types.insert("zfs");
  return types;
}

std::string DiskCollector::unescape_mount_field(const std::string& s) {
  std::string out; out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() &&
        s[i+1] >= '0' && s[i+1] <= '7' && s[i+2] >= '0' && s[i+2] <= '7' && s[i+3] >= '0' && s[i+3] <= '7') {
      out.push_back(static_cast<char>((s[i+1]-'0') * 64 + (s[i+2]-'0') * 8 + (s[i+3]-'0')));
      i += 3;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

bool DiskCollector::usage_of(const std::string& mountpoint, hostscope::model::DiskUsage& out) {
  struct statvfs vfs{};
  if (::statvfs(mountpoint.c_str(), &vfs) != 0) return false;
  uint64_t frsize = vfs.f_frsize ? vfs.f_frsize : vfs.f_bsize;
  out.total = static_cast<uint64_t>(vfs.f_blocks) * frsize;
  out.free  = static_cast<uint64_t>(vfs.f_bavail) * frsize;
  uint64_t bfree = static_cast<uint64_t>(vfs.f_bfree) * frsize;
  out.used  = (out.total > bfree) ? (out.total - bfree) : 0ULL;
  // Share of the space usable by unprivileged users, like df(1)
  out.percent = hostscope::model::percent_of(out.used, out.used + out.free);
  return true;
}

bool DiskCollector::sample(hostscope::model::DiskMap& out) {
  clear_error();
  out.clear();
  auto txt = hostscope::util::read_file_string("/proc/self/mounts");
  if (!txt) return fail("/proc/self/mounts unreadable");
  auto physical = physical_fs_types();

  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    if (device.empty() || device == "none") continue;
    if (physical.empty() ? is_pseudo_fs(fstype) : physical.count(fstype) == 0) continue;

    hostscope::model::DiskUsage u;
    u.mountpoint = unescape_mount_field(mountpoint);
    u.filesystem = fstype;
    // Unmounted underneath us, permission denied, stale network mount: leave it out
    if (!usage_of(u.mountpoint, u)) continue;
    out[unescape_mount_field(device)] = std::move(u);
  }
  return true;
}

} // namespace hostscope::collectors
