#pragma once

#include "model/Snapshot.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace hostscope::ui {

// The n processes with the highest memory_percent, descending; ties by pid
std::vector<hostscope::model::ProcessInfo> top_by_memory(const hostscope::model::Process& p, size_t n);

// PID / NAME / USER / MEM% table of the top processes, boxed at width
std::vector<std::string> render_process_table(
    const hostscope::model::Snapshot& s,
    int width,
    int target_rows,
    size_t max_processes
);

} // namespace hostscope::ui
