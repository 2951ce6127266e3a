#include "minitest.hpp"
#include "fixtures.hpp"
#include "mock_collectors.hpp"
#include "app/JsonSerializer.hpp"
#include <sstream>

using namespace std::chrono;

static hostscope::model::SnapshotPtr sample_snapshot() {
  auto net = mocks::sample_network();
  net.interfaces["eth0"].push_back({"02:42:ac:11:00:02", std::nullopt, "AF_PACKET"});
  net.interfaces["weird\"if"].push_back({"10.9.9.9", std::nullopt, "AF_INET"});
  auto tp = system_clock::time_point(seconds(1700000000)) + microseconds(250);
  return hostscope::app::assemble(7, tp, mocks::sample_platform(), std::move(net),
                                  mocks::sample_hardware(), mocks::sample_process());
}

TEST(json_snapshot_top_level_keys_in_order) {
  auto js = hostscope::app::snapshot_to_json(*sample_snapshot());
  auto ts = js.find("\"timestamp\"");
  auto pl = js.find("\"platform\"");
  auto nw = js.find("\"network\"");
  auto hw = js.find("\"hardware\"");
  auto pr = js.find("\"process\"");
  ASSERT_TRUE(ts != std::string::npos && pl != std::string::npos && nw != std::string::npos);
  ASSERT_TRUE(ts < pl && pl < nw && nw < hw && hw < pr);
  ASSERT_EQ(js.front(), '{');
  ASSERT_EQ(js.substr(js.size() - 2), std::string("}\n"));
}

TEST(json_snapshot_values) {
  auto js = hostscope::app::snapshot_to_json(*sample_snapshot());
  ASSERT_TRUE(js.find("\"architecture\": [\n            \"64bit\",\n            \"ELF\"\n        ]") != std::string::npos);
  ASSERT_TRUE(js.find("\"percent\": 50.0") != std::string::npos);
  ASSERT_TRUE(js.find("\"current_usage\": 42.0") != std::string::npos);
  ASSERT_TRUE(js.find("\"total\": 16000000000") != std::string::npos);
  ASSERT_TRUE(js.find("\"max_frequency\": null") != std::string::npos);
  ASSERT_TRUE(js.find("\"netmask\": null") != std::string::npos);
  ASSERT_TRUE(js.find("\"netmask\": \"255.255.255.0\"") != std::string::npos);
  ASSERT_TRUE(js.find("\"/dev/sda1\": {") != std::string::npos);
  ASSERT_TRUE(js.find("\"total_processes\": 1") != std::string::npos);
  ASSERT_TRUE(js.find("\"pid\": 1,") != std::string::npos);
  ASSERT_TRUE(js.find("\"memory_percent\": 0.5") != std::string::npos);
  ASSERT_TRUE(js.find("\"weird\\\"if\"") != std::string::npos);
  ASSERT_TRUE(js.find(".000250\"") != std::string::npos);
}

TEST(json_frequency_object_when_present) {
  auto hw = mocks::sample_hardware();
  hw.cpu.frequency = hostscope::model::CpuFrequency{2400.0, 800.0, 3600.0};
  auto s = hostscope::app::assemble(1, system_clock::now(), mocks::sample_platform(),
                                    mocks::sample_network(), hw, mocks::sample_process());
  auto js = hostscope::app::snapshot_to_json(*s);
  ASSERT_TRUE(js.find("\"max_frequency\": {\n                \"current\": 2400.0,") != std::string::npos);
  ASSERT_TRUE(js.find("\"max\": 3600.0") != std::string::npos);
}

TEST(json_empty_containers) {
  hostscope::model::Snapshot s;
  auto js = hostscope::app::snapshot_to_json(s);
  ASSERT_TRUE(js.find("\"network_interfaces\": {}") != std::string::npos);
  ASSERT_TRUE(js.find("\"disk\": {}") != std::string::npos);
  ASSERT_TRUE(js.find("\"running_processes\": []") != std::string::npos);
}

TEST(json_failure_document) {
  auto r = hostscope::model::CollectionResult::failure("network", "gethostname: EPERM");
  auto js = hostscope::app::result_to_json(r);
  ASSERT_EQ(js, std::string("{\n    \"error\": \"Failed to collect system data: network: gethostname: EPERM\"\n}\n"));
}

TEST(json_save_and_fail) {
  auto root = fixtures::make_root("json");
  auto path = root / "system_data.json";
  std::string err;
  ASSERT_TRUE(hostscope::app::save_json(path, "{}\n", err));
  std::ifstream in(path);
  std::stringstream ss; ss << in.rdbuf();
  ASSERT_EQ(ss.str(), std::string("{}\n"));

  ASSERT_FALSE(hostscope::app::save_json(root / "no/such/dir/x.json", "{}\n", err));
  ASSERT_TRUE(err.find("cannot open") != std::string::npos);
}

TEST(json_process_names_are_sanitized) {
  auto pr = mocks::sample_process();
  pr.running_processes.push_back({2, std::string("bad\xff") + "name\x01", "root", 0.1});
  pr.total_processes = 2;
  auto s = hostscope::app::assemble(1, system_clock::now(), mocks::sample_platform(),
                                    mocks::sample_network(), mocks::sample_hardware(), std::move(pr));
  auto js = hostscope::app::snapshot_to_json(*s);
  ASSERT_TRUE(js.find("\"bad\xEF\xBF\xBDname\\u0001\"") != std::string::npos);
}

TEST(json_document_value_shape) {
  auto doc = hostscope::app::snapshot_document(*sample_snapshot());
  ASSERT_TRUE(doc.is_object());
  ASSERT_EQ(doc.begin().key(), std::string("timestamp"));
  ASSERT_TRUE(doc["hardware"]["cpu"]["max_frequency"].is_null());
  ASSERT_EQ(doc["hardware"]["memory"]["total"].get<uint64_t>(), 16'000'000'000ULL);
  ASSERT_EQ(doc["network"]["network_interfaces"]["eth0"].size(), static_cast<size_t>(2));
  ASSERT_TRUE(doc["network"]["network_interfaces"]["eth0"][1]["netmask"].is_null());
}
