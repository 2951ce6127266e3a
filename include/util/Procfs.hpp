// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <string>
#include <vector>
#include <optional>

namespace hostscope::util {

// Map an absolute /proc path to an alternate root if HOSTSCOPE_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if HOSTSCOPE_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// First line of a file without the trailing newline. std::nullopt on error.
auto read_first_line(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// Like list_dir but distinguishes "cannot open" (std::nullopt) from "empty".
auto try_list_dir(const std::string& abs) -> std::optional<std::vector<std::string>>;

// True for names made only of decimal digits (pid directories)
[[nodiscard]] bool is_numeric(const std::string& name);

} // namespace hostscope::util
