#include "app/JsonSerializer.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>

using nlohmann::ordered_json;

namespace {

ordered_json platform_json(const hostscope::model::Platform& p) {
  ordered_json j;
  j["system"] = p.system;
  j["release"] = p.release;
  j["version"] = p.version;
  j["machine"] = p.machine;
  j["processor"] = p.processor;
  j["architecture"] = ordered_json::array({p.architecture.bits, p.architecture.linkage});
  j["runtime_version"] = p.runtime_version;
  return j;
}

ordered_json network_json(const hostscope::model::Network& n) {
  ordered_json ifaces = ordered_json::object();
  for (const auto& [name, addrs] : n.interfaces) {
    ordered_json list = ordered_json::array();
    for (const auto& a : addrs) {
      ordered_json e;
      e["address"] = a.address;
      if (a.netmask) e["netmask"] = *a.netmask;
      else e["netmask"] = nullptr;
      e["family"] = a.family;
      list.push_back(std::move(e));
    }
    ifaces[name] = std::move(list);
  }
  ordered_json j;
  j["hostname"] = n.hostname;
  j["ip_address"] = n.ip_address;
  j["mac_address"] = n.mac_address;
  j["network_interfaces"] = std::move(ifaces);
  return j;
}

ordered_json hardware_json(const hostscope::model::Hardware& h) {
  ordered_json cpu;
  cpu["physical_cores"] = h.cpu.physical_cores;
  cpu["total_cores"] = h.cpu.total_cores;
  if (h.cpu.frequency) {
    cpu["max_frequency"] = {
      {"current", h.cpu.frequency->current},
      {"min", h.cpu.frequency->min},
      {"max", h.cpu.frequency->max},
    };
  } else {
    cpu["max_frequency"] = nullptr;
  }
  cpu["current_usage"] = h.cpu.current_usage;

  ordered_json mem;
  mem["total"] = h.memory.total;
  mem["available"] = h.memory.available;
  mem["used"] = h.memory.used;
  mem["percent"] = h.memory.percent;

  ordered_json disks = ordered_json::object();
  for (const auto& [dev, d] : h.disks) {
    disks[dev] = {
      {"mountpoint", d.mountpoint},
      {"filesystem", d.filesystem},
      {"total", d.total},
      {"used", d.used},
      {"free", d.free},
      {"percent", d.percent},
    };
  }

  ordered_json j;
  j["cpu"] = std::move(cpu);
  j["memory"] = std::move(mem);
  j["disk"] = std::move(disks);
  return j;
}

ordered_json process_json(const hostscope::model::Process& p) {
  ordered_json list = ordered_json::array();
  for (const auto& pi : p.running_processes) {
    list.push_back({
      {"pid", pi.pid},
      {"name", pi.name},
      {"username", pi.username},
      {"memory_percent", pi.memory_percent},
    });
  }
  ordered_json j;
  j["total_processes"] = p.total_processes;
  j["running_processes"] = std::move(list);
  return j;
}

// Process names are not guaranteed UTF-8; invalid bytes become U+FFFD
std::string dump_document(const ordered_json& j) {
  return j.dump(4, ' ', false, ordered_json::error_handler_t::replace) + "\n";
}

} // anonymous namespace

namespace hostscope::app {

ordered_json snapshot_document(const hostscope::model::Snapshot& s) {
  ordered_json j;
  j["timestamp"] = hostscope::model::iso8601(s.timestamp);
  j["platform"] = platform_json(s.platform);
  j["network"] = network_json(s.network);
  j["hardware"] = hardware_json(s.hardware);
  j["process"] = process_json(s.process);
  return j;
}

std::string snapshot_to_json(const hostscope::model::Snapshot& s) {
  return dump_document(snapshot_document(s));
}

std::string result_to_json(const hostscope::model::CollectionResult& result) {
  if (result.ok()) return snapshot_to_json(*result.snapshot());
  ordered_json j;
  j["error"] = "Failed to collect system data: " + result.error().describe();
  return dump_document(j);
}

bool save_json(const std::filesystem::path& path, const std::string& text, std::string& err) {
  std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!file) {
    err = "cannot open " + path.string() + ": " + std::strerror(errno);
    return false;
  }
  file.write(text.data(), static_cast<std::streamsize>(text.size()));
  file.flush();
  if (!file) {
    err = "write failed for " + path.string() + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

} // namespace hostscope::app
