#include "collectors/NetworkCollector.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <memory>
#include <random>

namespace hostscope::collectors {

std::string NetworkCollector::format_mac(uint64_t node) {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                static_cast<unsigned>((node >> 40) & 0xff), static_cast<unsigned>((node >> 32) & 0xff),
                static_cast<unsigned>((node >> 24) & 0xff), static_cast<unsigned>((node >> 16) & 0xff),
                static_cast<unsigned>((node >> 8) & 0xff),  static_cast<unsigned>(node & 0xff));
  return buf;
}

static std::optional<std::string> numeric_host(const sockaddr* sa, socklen_t len) {
  std::array<char, NI_MAXHOST> host{};
  int rc = ::getnameinfo(sa, len, host.data(), static_cast<socklen_t>(host.size()), nullptr, 0, NI_NUMERICHOST);
  if (rc != 0) return std::nullopt;
  return std::string(host.data());
}

static std::optional<std::string> link_address(const sockaddr* sa) {
  const auto* ll = reinterpret_cast<const sockaddr_ll*>(sa);
  if (ll->sll_halen == 0 || ll->sll_halen > sizeof(ll->sll_addr)) return std::nullopt;
  std::string out;
  char oct[4];
  for (unsigned i = 0; i < ll->sll_halen; ++i) {
    std::snprintf(oct, sizeof(oct), i == 0 ? "%02x" : ":%02x", static_cast<unsigned>(ll->sll_addr[i]));
    out += oct;
  }
  return out;
}

void NetworkCollector::append_interfaces(const ifaddrs* head, hostscope::model::InterfaceMap& out) {
  for (const ifaddrs* it = head; it != nullptr; it = it->ifa_next) {
    if (!it->ifa_name || !it->ifa_addr) continue;
    hostscope::model::NetAddress a;
    switch (it->ifa_addr->sa_family) {
      case AF_INET: {
        auto addr = numeric_host(it->ifa_addr, sizeof(sockaddr_in));
        if (!addr) continue;
        a.address = std::move(*addr);
        if (it->ifa_netmask && it->ifa_netmask->sa_family == AF_INET)
          a.netmask = numeric_host(it->ifa_netmask, sizeof(sockaddr_in));
        a.family = "AF_INET";
        break;
      }
      case AF_INET6: {
        auto addr = numeric_host(it->ifa_addr, sizeof(sockaddr_in6));
        if (!addr) continue;
        a.address = std::move(*addr);
        if (it->ifa_netmask && it->ifa_netmask->sa_family == AF_INET6)
          a.netmask = numeric_host(it->ifa_netmask, sizeof(sockaddr_in6));
        a.family = "AF_INET6";
        break;
      }
      case AF_PACKET: {
        auto addr = link_address(it->ifa_addr);
        if (!addr) continue;
        a.address = std::move(*addr);
        a.family = "AF_PACKET";
        break;
      }
      default:
        continue;
    }
    out[it->ifa_name].push_back(std::move(a));
  }
}

std::optional<uint64_t> NetworkCollector::hardware_node(const ifaddrs* head) {
  for (const ifaddrs* it = head; it != nullptr; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_PACKET) continue;
    if (it->ifa_flags & IFF_LOOPBACK) continue;
    const auto* ll = reinterpret_cast<const sockaddr_ll*>(it->ifa_addr);
    if (ll->sll_halen != 6) continue;
    uint64_t node = 0;
    for (int i = 0; i < 6; ++i) node = (node << 8) | ll->sll_addr[i];
    if (node != 0) return node;
  }
  return std::nullopt;
}

uint64_t NetworkCollector::node_id(const ifaddrs* head) {
  if (node_) return *node_;
  if (auto hw = hardware_node(head)) {
    node_ = *hw;
  } else {
    // No hardware address: random 48-bit node with the multicast bit set
    std::random_device rd;
    std::mt19937_64 gen(rd());
    node_ = (gen() & 0xffffffffffffULL) | (1ULL << 40);
    std::fprintf(stderr, "hostscope: NetworkCollector: no hardware address, using random node %s\n",
                 format_mac(*node_).c_str());
  }
  return *node_;
}

static std::optional<std::string> resolve_ipv4(const std::string& host, std::string& err) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || !res) {
    err = std::string("cannot resolve '") + host + "': " + ::gai_strerror(rc);
    return std::nullopt;
  }
  char buf[INET_ADDRSTRLEN] = {};
  const auto* sin = reinterpret_cast<const sockaddr_in*>(res->ai_addr);
  const char* ok = ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
  ::freeaddrinfo(res);
  if (!ok) {
    err = std::string("inet_ntop: ") + std::strerror(errno);
    return std::nullopt;
  }
  return std::string(buf);
}

bool NetworkCollector::sample(hostscope::model::Network& out) {
  clear_error();
  char host[HOST_NAME_MAX + 1] = {};
  if (::gethostname(host, sizeof(host)) != 0) return fail(std::string("gethostname: ") + std::strerror(errno));
  host[HOST_NAME_MAX] = '\0';
  out.hostname = host;

  std::string err;
  auto ip = resolve_ipv4(out.hostname, err);
  if (!ip) return fail(err);
  out.ip_address = std::move(*ip);

  ifaddrs* raw = nullptr;
  if (::getifaddrs(&raw) != 0) return fail(std::string("getifaddrs: ") + std::strerror(errno));
  std::unique_ptr<ifaddrs, decltype(&::freeifaddrs)> list(raw, &::freeifaddrs);
  out.mac_address = format_mac(node_id(list.get()));
  out.interfaces.clear();
  append_interfaces(list.get(), out.interfaces);
  return true;
}

} // namespace hostscope::collectors
