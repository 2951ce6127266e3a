#include "collectors/PlatformCollector.hpp"
#include "util/Procfs.hpp"

#include <sys/utsname.h>
#include <cerrno>
#include <cstring>
#include <sstream>

#ifndef HOSTSCOPE_VERSION
#define HOSTSCOPE_VERSION "0.0.0"
#endif

namespace hostscope::collectors {

static std::string trim(std::string s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.pop_back();
  return s;
}

// "model name" on x86, "Hardware"/"Processor" on some arm kernels
static std::string cpu_model_name() {
  auto txt = hostscope::util::read_file_string("/proc/cpuinfo");
  if (!txt) return {};
  std::istringstream ss(*txt);
  std::string line, fallback;
  while (std::getline(ss, line)) {
    auto pos = line.find(':');
    if (pos == std::string::npos) continue;
    if (line.rfind("model name", 0) == 0) return trim(line.substr(pos + 1));
    if (fallback.empty() && (line.rfind("Hardware", 0) == 0 || line.rfind("Processor", 0) == 0))
      fallback = trim(line.substr(pos + 1));
  }
  return fallback;
}

std::string PlatformCollector::runtime_version() {
  std::ostringstream os;
  os << "hostscope " << HOSTSCOPE_VERSION;
#if defined(__clang__)
  os << " (clang " << __clang_major__ << "." << __clang_minor__ << "." << __clang_patchlevel__;
#elif defined(__GNUC__)
  os << " (GCC " << __GNUC__ << "." << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__;
#else
  os << " (unknown compiler";
#endif
  os << ", C++ " << __cplusplus << ")";
  return os.str();
}

bool PlatformCollector::sample(hostscope::model::Platform& out) {
  clear_error();
  struct utsname u{};
  if (::uname(&u) != 0) return fail(std::string("uname: ") + std::strerror(errno));
  out.system = u.sysname;
  out.release = u.release;
  out.version = u.version;
  out.machine = u.machine;
  out.processor = cpu_model_name();
  if (out.processor.empty()) out.processor = out.machine;
  out.architecture.bits = std::to_string(sizeof(void*) * 8) + "bit";
#if defined(__ELF__)
  out.architecture.linkage = "ELF";
#else
  out.architecture.linkage = "";
#endif
  out.runtime_version = runtime_version();
  return true;
}

} // namespace hostscope::collectors
