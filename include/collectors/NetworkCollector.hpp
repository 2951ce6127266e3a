#pragma once
#include <cstdint>
#include <optional>
#include "collectors/ICollector.hpp"

struct ifaddrs;

namespace hostscope::collectors {

class NetworkCollector : public INetworkCollector {
public:
  bool sample(hostscope::model::Network& out) override;
  const char* name() const override { return "network"; }

  // Walk a getifaddrs() list into `out`. Entries without an address, with an
  // unsupported family or an address that cannot be rendered are skipped.
  static void append_interfaces(const ifaddrs* head, hostscope::model::InterfaceMap& out);

  // First non-loopback, non-zero 48-bit hardware address in the list
  static std::optional<uint64_t> hardware_node(const ifaddrs* head);

  // 0x0242ac110002 -> "02:42:ac:11:00:02"
  static std::string format_mac(uint64_t node);

private:
  // Node id is resolved once per process, like a machine identity
  uint64_t node_id(const ifaddrs* head);
  std::optional<uint64_t> node_{};
};

} // namespace hostscope::collectors
