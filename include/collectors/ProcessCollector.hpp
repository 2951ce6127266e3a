#pragma once
#include "collectors/ICollector.hpp"
#include <optional>
#include <unordered_map>

namespace hostscope::collectors {

// Two passes over /proc: a pid count, then per-process details. Processes
// that exit, deny access or are zombies between or during the passes are
// dropped from the detail list only, so the two may disagree.
class ProcessCollector : public IProcessCollector {
public:
  bool sample(hostscope::model::Process& out) override;
  const char* name() const override { return "process"; }

  static bool parse_stat_line(const std::string& content, std::string& comm, char& state);

private:
  std::optional<hostscope::model::ProcessInfo> read_process(int32_t pid, uint64_t mem_total_bytes);
  std::optional<std::string> user_from_status(int32_t pid);
  const std::string& user_name_cached(uint32_t uid);

  std::unordered_map<uint32_t, std::string> users_{};
};

} // namespace hostscope::collectors
