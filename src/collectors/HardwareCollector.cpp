#include "collectors/HardwareCollector.hpp"

namespace hostscope::collectors {

HardwareCollector::HardwareCollector(std::chrono::milliseconds cpu_sample_interval)
  : cpu_(cpu_sample_interval) {}

bool HardwareCollector::sample(hostscope::model::Hardware& out) {
  clear_error();
  if (!cpu_.sample(out.cpu))     return fail(std::string(cpu_.name()) + ": " + cpu_.last_error());
  if (!mem_.sample(out.memory))  return fail(std::string(mem_.name()) + ": " + mem_.last_error());
  if (!disk_.sample(out.disks))  return fail(std::string(disk_.name()) + ": " + disk_.last_error());
  return true;
}

} // namespace hostscope::collectors
