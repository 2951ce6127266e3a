#include "app/JsonSerializer.hpp"
#include "app/RefreshScheduler.hpp"
#include "app/SnapshotManager.hpp"
#include "app/SnapshotStore.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"

#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>

using namespace std::chrono;
using hostscope::ui::Config;

namespace {

struct Options {
  bool once{false};
  bool do_export{false};
  std::string export_path;
  int interval_ms{-1};
  bool no_auto{false};
  int iterations{0}; // 0: until quit
};

void usage(FILE* out) {
  std::fprintf(out,
      "Usage: hostscope [--once] [--export [FILE]] [--interval-ms N] [--no-auto] [--iterations N]\n"
      "  --once           collect one snapshot, print a text report, exit\n"
      "  --export [FILE]  collect one snapshot, write it as JSON (default from config)\n"
      "  --interval-ms N  auto-refresh period (min %d)\n"
      "  --no-auto        start with auto-refresh disabled\n"
      "  --iterations N   stop the interactive view after N frames\n"
      "Keys: q quit  r refresh  t toggle auto-refresh  e export\n",
      hostscope::ui::kMinIntervalMs);
}

bool parse_int_arg(const char* s, int& out) {
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0' || v < INT_MIN || v > INT_MAX) return false;
  out = static_cast<int>(v);
  return true;
}

// 0: ok, 1: error, 2: bad usage, -1: help printed
int parse_args(int argc, char** argv, Options& o) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--once") o.once = true;
    else if (a == "--no-auto") o.no_auto = true;
    else if (a == "--export") {
      o.do_export = true;
      if (i + 1 < argc && argv[i + 1][0] != '-') o.export_path = argv[++i];
    }
    else if ((a == "--interval-ms" || a == "--iterations") && i + 1 < argc) {
      int v = 0;
      if (!parse_int_arg(argv[++i], v) || v < 0) {
        std::fprintf(stderr, "hostscope: invalid value for %s: %s\n", a.c_str(), argv[i]);
        return 2;
      }
      (a == "--interval-ms" ? o.interval_ms : o.iterations) = v;
    }
    else if (a == "-h" || a == "--help") { usage(stdout); return -1; }
    else {
      std::fprintf(stderr, "hostscope: unknown argument: %s\n", a.c_str());
      usage(stderr);
      return 2;
    }
  }
  return 0;
}

int run_export(hostscope::app::SnapshotManager& manager, const std::string& path) {
  auto result = manager.collect();
  std::string err;
  if (!hostscope::app::save_json(path, hostscope::app::result_to_json(result), err)) {
    std::fprintf(stderr, "hostscope: Export: %s\n", err.c_str());
    return 1;
  }
  if (!result) {
    std::fprintf(stderr, "hostscope: Export: collection failed: %s (error written to %s)\n",
                 result.error().describe().c_str(), path.c_str());
    return 1;
  }
  std::printf("System data has been collected and saved to %s\n", path.c_str());
  return 0;
}

int run_once(hostscope::app::SnapshotManager& manager, size_t max_procs) {
  auto result = manager.collect();
  if (!result) {
    std::fprintf(stderr, "hostscope: Failed to collect system data: %s\n", result.error().describe().c_str());
    return 1;
  }
  std::string report = hostscope::ui::render_text_report(*result.snapshot(), max_procs,
                                                         hostscope::ui::tty_stdout() ? hostscope::ui::term_cols() : 80);
  std::fwrite(report.data(), 1, report.size(), stdout);
  return 0;
}

int run_interactive(hostscope::app::SnapshotManager& manager, const Config& cfg, int iterations) {
  // Outlives the scheduler, whose thread calls the listener
  std::atomic<bool> dirty{true};
  hostscope::app::SnapshotStore store;
  hostscope::app::RefreshScheduler scheduler(manager, store, milliseconds(cfg.refresh.interval_ms),
                                             cfg.refresh.auto_refresh);
  scheduler.set_listener([&dirty](const hostscope::model::CollectionResult&){ dirty.store(true); });
  scheduler.start();
  // First frame gets data without waiting a whole interval
  (void)scheduler.trigger_manual_refresh();

  bool use_alt = cfg.display.alt_screen;
  hostscope::ui::RawTermGuard raw{};
  hostscope::ui::CursorGuard curs{};
  hostscope::ui::AltScreenGuard alt{use_alt};
  std::atexit(&hostscope::ui::on_atexit_restore);
  if (hostscope::ui::g_alt_in_use.load()) hostscope::ui::best_effort_write(STDOUT_FILENO, "\x1B[2J\x1B[H", 7);

  hostscope::ui::View view;
  view.max_processes = static_cast<size_t>(cfg.display.max_processes);
  auto note_until = steady_clock::time_point{};
  auto notify = [&](std::string msg){
    view.notification = std::move(msg);
    note_until = steady_clock::now() + 3s;
  };

  auto next_paint = steady_clock::time_point{};
  for (int frame = 0; (iterations <= 0 || frame < iterations) && !hostscope::ui::g_stop.load(); ++frame) {
    bool had_input = hostscope::ui::has_input_available(200);
    if (had_input) {
      for (auto action : hostscope::ui::handle_keyboard_input(cfg)) {
        switch (action) {
          case Config::Action::QUIT:
            hostscope::ui::g_stop.store(true);
            break;
          case Config::Action::REFRESH:
            notify(scheduler.trigger_manual_refresh() ? "Refreshing..." : "Refresh already in progress");
            break;
          case Config::Action::TOGGLE_AUTO:
            notify(scheduler.toggle_auto_refresh() ? "Auto-refresh enabled" : "Auto-refresh disabled");
            break;
          case Config::Action::EXPORT: {
            auto snap = store.latest();
            if (!snap) { notify("Nothing to export yet"); break; }
            std::string err;
            if (hostscope::app::save_json(cfg.exporting.path, hostscope::app::snapshot_to_json(*snap), err))
              notify("Exported to " + cfg.exporting.path);
            else
              notify("Export failed: " + err);
            break;
          }
        }
      }
    }
    if (hostscope::ui::g_stop.load()) break;
    auto now = steady_clock::now();
    if (!view.notification.empty() && now >= note_until) view.notification.clear();
    // Repaint on new results, on input, and once a second for the status line
    if (!dirty.exchange(false) && !had_input && now < next_paint) continue;
    next_paint = now + 1s;
    view.snapshot = store.latest();
    view.error = store.last_error();
    view.auto_refresh = scheduler.auto_refresh_enabled();
    view.collecting = scheduler.state() == hostscope::app::RefreshScheduler::State::Collecting;
    hostscope::ui::render_screen(view);
  }
  scheduler.stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, hostscope::ui::on_sigint);
  std::signal(SIGTERM, hostscope::ui::on_sigint);

  Options opt;
  int rc = parse_args(argc, argv, opt);
  if (rc < 0) return 0;
  if (rc > 0) return rc;

  Config cfg = hostscope::ui::config();
  if (opt.interval_ms >= 0) {
    if (opt.interval_ms < hostscope::ui::kMinIntervalMs) {
      std::fprintf(stderr, "hostscope: Config: --interval-ms %d below minimum, using %d\n",
                   opt.interval_ms, hostscope::ui::kMinIntervalMs);
      opt.interval_ms = hostscope::ui::kMinIntervalMs;
    }
    cfg.refresh.interval_ms = opt.interval_ms;
  }
  if (opt.no_auto) cfg.refresh.auto_refresh = false;
  if (!opt.export_path.empty()) cfg.exporting.path = opt.export_path;

  try {
    hostscope::app::SnapshotManager manager(
        hostscope::app::make_host_collectors(milliseconds(cfg.refresh.cpu_sample_ms)));
    if (opt.do_export) return run_export(manager, cfg.exporting.path);
    if (opt.once || !hostscope::ui::tty_stdout())
      return run_once(manager, static_cast<size_t>(cfg.display.max_processes));
    return run_interactive(manager, cfg, opt.iterations);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "hostscope: %s\n", e.what());
    return 1;
  }
}
