#pragma once
#include <string>
#include "model/Snapshot.hpp"

namespace hostscope::collectors {

// One telemetry category. sample() returns true with `out` filled (leaf
// entries that could not be read are left out), or false when the whole
// category failed; last_error() then carries the cause.
template <typename T>
class ICollector {
public:
  virtual ~ICollector() = default;

  [[nodiscard]] virtual bool sample(T& out) = 0;

  // Category name used in failure reports
  [[nodiscard]] virtual const char* name() const = 0;

  [[nodiscard]] const std::string& last_error() const { return last_error_; }

protected:
  bool fail(std::string cause) { last_error_ = std::move(cause); return false; }
  void clear_error() { last_error_.clear(); }

private:
  std::string last_error_;
};

using IPlatformCollector = ICollector<hostscope::model::Platform>;
using INetworkCollector  = ICollector<hostscope::model::Network>;
using IHardwareCollector = ICollector<hostscope::model::Hardware>;
using IProcessCollector  = ICollector<hostscope::model::Process>;

} // namespace hostscope::collectors
