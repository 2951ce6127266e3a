#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fixtures {

namespace fs = std::filesystem;

// Fresh directory under the temp dir, unique per test and process
inline fs::path make_root(const std::string& tag) {
  auto root = fs::temp_directory_path() / fs::path("hostscope_test_" + tag) / fs::path(std::to_string(::getpid()));
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root / "proc");
  fs::create_directories(root / "sys");
  return root;
}

inline void write_file(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream(p) << content;
}

// Sets an environment variable for the scope of a test
class EnvGuard {
public:
  EnvGuard(const char* name, const std::string& value) : name_(name) {
    if (const char* old = std::getenv(name)) { had_ = true; old_ = old; }
    ::setenv(name, value.c_str(), 1);
  }
  ~EnvGuard() {
    if (had_) ::setenv(name_, old_.c_str(), 1);
    else ::unsetenv(name_);
  }
  EnvGuard(const EnvGuard&) = delete;
  EnvGuard& operator=(const EnvGuard&) = delete;
private:
  const char* name_;
  bool had_{false};
  std::string old_;
};

inline const char* kMeminfo16G =
  "MemTotal:       16000000 kB\n"
  "MemFree:         4000000 kB\n"
  "MemAvailable:    8000000 kB\n"
  "Buffers:         1000000 kB\n"
  "Cached:          3000000 kB\n";

} // namespace fixtures
