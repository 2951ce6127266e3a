#pragma once

#include "ui/Config.hpp"
#include <string_view>
#include <vector>

namespace hostscope::ui {

// Map raw key bytes to actions through the keybind table; unbound keys and
// escape sequences are skipped
std::vector<Config::Action> decode_keys(std::string_view bytes, const Config& cfg);

// Read whatever is pending on stdin and decode it
std::vector<Config::Action> handle_keyboard_input(const Config& cfg);

// Helper to check for available input
bool has_input_available(int timeout_ms);

} // namespace hostscope::ui
