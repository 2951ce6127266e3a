#pragma once
#include <string>

namespace hostscope::model {

struct Architecture {
  std::string bits;     // e.g. "64bit"
  std::string linkage;  // e.g. "ELF"
};

struct Platform {
  std::string system;          // uname sysname
  std::string release;         // uname release
  std::string version;         // uname version
  std::string machine;         // uname machine
  std::string processor;       // cpu model name, falls back to machine
  Architecture architecture;
  std::string runtime_version; // toolchain/build identity of this binary
};

} // namespace hostscope::model
