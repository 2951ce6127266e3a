#pragma once

#include "model/CollectionResult.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hostscope::ui {

// Everything one frame shows
struct View {
  hostscope::model::SnapshotPtr snapshot;                 // last-known-good, may be null
  std::optional<hostscope::model::CollectionError> error; // most recent failure
  bool auto_refresh{true};
  bool collecting{false};
  std::string notification;
  std::size_t max_processes{20};
};

// Box drawing
std::vector<std::string> make_box(
    const std::string& title,
    const std::vector<std::string>& lines,
    int width,
    int min_height = 0
);

// Border/title coloring for a boxed line
std::string colorize_line(const std::string& s);

// "Last Update: 2024-05-01 13:45:09", or "Last Update: Never"
std::string last_update_text(const hostscope::model::Snapshot* s);

// Full frame as rows of exactly cols columns (header, body, status line)
std::vector<std::string> compose_frame(const View& v, int cols, int rows);

// Draw compose_frame() at the terminal size
void render_screen(const View& v);

// Single-column report for non-interactive output
std::string render_text_report(const hostscope::model::Snapshot& s, std::size_t max_processes, int width = 80);

} // namespace hostscope::ui
