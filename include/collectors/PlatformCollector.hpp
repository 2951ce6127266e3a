#pragma once
#include "collectors/ICollector.hpp"

namespace hostscope::collectors {

class PlatformCollector : public IPlatformCollector {
public:
  bool sample(hostscope::model::Platform& out) override;
  const char* name() const override { return "platform"; }

  // Identity of this build (version, compiler, language level)
  static std::string runtime_version();
};

} // namespace hostscope::collectors
