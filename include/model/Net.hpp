#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hostscope::model {

struct NetAddress {
  std::string address;
  std::optional<std::string> netmask;
  std::string family; // AF_INET | AF_INET6 | AF_PACKET
};

// Interface name -> addresses in OS enumeration order
using InterfaceMap = std::map<std::string, std::vector<NetAddress>>;

struct Network {
  std::string hostname;
  std::string ip_address;
  std::string mac_address; // aa:bb:cc:dd:ee:ff, big-endian
  InterfaceMap interfaces;
};

} // namespace hostscope::model
