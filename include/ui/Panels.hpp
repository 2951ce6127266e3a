#pragma once

#include "model/Snapshot.hpp"
#include <string>
#include <vector>

namespace hostscope::ui {

// Panel bodies (unboxed), inner width iw
std::vector<std::string> render_system_panel(const hostscope::model::Snapshot& s, int iw);
std::vector<std::string> render_hardware_panel(const hostscope::model::Snapshot& s, int iw);
std::vector<std::string> render_network_panel(const hostscope::model::Snapshot& s, int iw);
std::vector<std::string> render_disk_panel(const hostscope::model::Snapshot& s, int iw);

// SYSTEM, HARDWARE, NETWORK, DISKS stacked in boxes
std::vector<std::string> render_right_column(const hostscope::model::Snapshot& s, int width, int target_rows);

} // namespace hostscope::ui
