#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace hostscope::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("HOSTSCOPE_", 0) == 0) {
    alt = std::string("hostscope_") + n.substr(10);
  } else if (n.rfind("hostscope_", 0) == 0) {
    alt = std::string("HOSTSCOPE_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  int out = 0;
  const char* end = v + std::strlen(v);
  auto [ptr, ec] = std::from_chars(v, end, out);
  if (ec != std::errc{} || ptr != end) {
    std::fprintf(stderr, "hostscope: Config: ignoring %s=%s (not an integer)\n", name, v);
    return defv;
  }
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/hostscope/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/hostscope/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const hostscope::util::TomlReader& toml, bool have_toml,
                        const char* section, const char* key,
                        const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const hostscope::util::TomlReader& toml, bool have_toml,
                          const char* section, const char* key,
                          const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const hostscope::util::TomlReader& toml, bool have_toml,
                                   const char* section, const char* key,
                                   const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static int clamp_logged(const char* what, int v, int lo, int hi) {
  int c = std::clamp(v, lo, hi);
  if (c != v)
    std::fprintf(stderr, "hostscope: Config: %s=%d out of range, using %d\n", what, v, c);
  return c;
}

struct KeybindDef { const char* name; char key; Config::Action action; };
static constexpr KeybindDef default_keybinds[] = {
  {"quit",         'q', Config::Action::QUIT},
  {"refresh",      'r', Config::Action::REFRESH},
  {"toggle_auto",  't', Config::Action::TOGGLE_AUTO},
  {"export",       'e', Config::Action::EXPORT},
};

static void populate_keybinds(Config& c, const hostscope::util::TomlReader& toml, bool have_toml) {
  for (const auto& kb : default_keybinds) {
    char key = kb.key;
    if (have_toml && toml.has("keybinds", kb.name)) {
      std::string val = toml.get_string("keybinds", kb.name);
      if (!val.empty()) key = val[0];
    }
    c.keybinds[key] = kb.action;
  }
  // Upper-case aliases, unless that key is bound on its own
  const auto bound = c.keybinds;
  for (const auto& [key, action] : bound) {
    if (!std::islower(static_cast<unsigned char>(key))) continue;
    c.keybinds.try_emplace(static_cast<char>(std::toupper(static_cast<unsigned char>(key))), action);
  }
}

Config resolve_config(const hostscope::util::TomlReader& toml, bool have_toml) {
  Config c{};

  // --- [refresh] ---
  c.refresh.interval_ms   = resolve_int(toml, have_toml, "refresh", "interval_ms",   "HOSTSCOPE_REFRESH_MS", 5000);
  c.refresh.auto_refresh  = resolve_bool(toml, have_toml, "refresh", "auto",         "HOSTSCOPE_AUTO_REFRESH", true);
  c.refresh.cpu_sample_ms = resolve_int(toml, have_toml, "refresh", "cpu_sample_ms", "HOSTSCOPE_CPU_SAMPLE_MS", 1000);

  // --- [display] ---
  c.display.max_processes = resolve_int(toml, have_toml, "display", "max_processes", "HOSTSCOPE_MAX_PROCS", 20);
  c.display.alt_screen    = resolve_bool(toml, have_toml, "display", "alt_screen",   "HOSTSCOPE_ALT_SCREEN", true);

  // --- [export] ---
  c.exporting.path = resolve_string(toml, have_toml, "export", "path", "HOSTSCOPE_EXPORT_PATH", "system_data.json");

  c.refresh.interval_ms   = clamp_logged("refresh.interval_ms", c.refresh.interval_ms, kMinIntervalMs, 24 * 3600 * 1000);
  c.refresh.cpu_sample_ms = clamp_logged("refresh.cpu_sample_ms", c.refresh.cpu_sample_ms, 0, kMaxCpuSampleMs);
  c.display.max_processes = clamp_logged("display.max_processes", c.display.max_processes, 1, kMaxProcessesCap);

  // --- [keybinds] ---
  populate_keybinds(c, toml, have_toml);
  return c;
}

const Config& config() {
  static Config cfg = []{
    hostscope::util::TomlReader toml;
    auto path = config_file_path();
    bool have_toml = !path.empty() && toml.load(path);
    Config c = resolve_config(toml, have_toml);
    if (have_toml) c.source = path;
    return c;
  }();
  return cfg;
}

} // namespace hostscope::ui
