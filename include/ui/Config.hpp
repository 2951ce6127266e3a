#pragma once

#include <string>
#include <unordered_map>

namespace hostscope::util { class TomlReader; }

namespace hostscope::ui {

struct Config {
  enum class Action { QUIT, REFRESH, TOGGLE_AUTO, EXPORT };

  struct Refresh {
    int interval_ms{5000};   // timer period
    bool auto_refresh{true}; // initial auto-refresh flag
    int cpu_sample_ms{1000}; // CPU usage sampling window
  } refresh;

  struct Display {
    int max_processes{20};
    bool alt_screen{true};
  } display;

  struct Export {
    std::string path{"system_data.json"};
  } exporting;

  std::unordered_map<char, Action> keybinds;

  // Config file that was read, empty when none
  std::string source;
};

inline constexpr int kMinIntervalMs = 250;
inline constexpr int kMaxCpuSampleMs = 5000;
inline constexpr int kMaxProcessesCap = 1000;

// Process-wide configuration, resolved once: TOML -> env -> default
const Config& config();

// Resolution against an explicit TOML source (have_toml=false: env/defaults)
Config resolve_config(const hostscope::util::TomlReader& toml, bool have_toml);

// $XDG_CONFIG_HOME/hostscope/config.toml or ~/.config/hostscope/config.toml
std::string config_file_path();

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace hostscope::ui
