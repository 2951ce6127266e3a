#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "model/CollectionResult.hpp"

namespace hostscope::app {

// Snapshot as a JSON value, keys in model order
[[nodiscard]] nlohmann::ordered_json snapshot_document(const hostscope::model::Snapshot& snap);

// Serialize a Snapshot as an indented JSON document (4 spaces). Keys mirror
// the data model: timestamp, platform, network, hardware, process.
[[nodiscard]] std::string snapshot_to_json(const hostscope::model::Snapshot& snap);

// A failed cycle becomes {"error": "Failed to collect system data: <cause>"}
[[nodiscard]] std::string result_to_json(const hostscope::model::CollectionResult& result);

// Write text to path, replacing any existing file. On failure returns false
// and fills err.
bool save_json(const std::filesystem::path& path, const std::string& text, std::string& err);

} // namespace hostscope::app
