#include "config.hpp"
#include "exercise.hpp"
#include "file_watcher.hpp"
#include "ncurses_terminal.hpp"
#include "progress.hpp"
#include "runner.hpp"
#include "session.hpp"
#include "terminal.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

static void setup_logging(const std::filesystem::path& root, const Config& cfg) {
  std::filesystem::path log_path = cfg.log_file.empty() ? root / TUTOR_LOG_FILE : std::filesystem::path(cfg.log_file);
  try {
    auto logger = spdlog::basic_logger_mt("tutor", log_path.string());
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    // The terminal belongs to the UI; without a log file, logging is off.
    std::cerr << "tutor: cannot open log " << log_path << ": " << e.what() << "\n";
    spdlog::set_level(spdlog::level::off);
    return;
  }
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));
  spdlog::flush_on(spdlog::level::warn);
}

int main(int argc, char** argv) {
  std::filesystem::path root = argc >= 2 ? std::filesystem::path(argv[1]) : std::filesystem::path(".");
  std::error_code ec;
  root = std::filesystem::absolute(root, ec);
  if (ec) {
    std::cerr << "tutor: " << ec.message() << "\n";
    return 1;
  }

  Config cfg;
  std::vector<std::string> messages;
  load_config(root, cfg, messages);
  setup_logging(root, cfg);
  for (const auto& m : messages) spdlog::warn("config: {}", m);

  ManifestExerciseSource source;
  std::string msg;
  if (!ManifestExerciseSource::load(root, source, msg)) {
    std::cerr << "tutor: " << msg << "\n";
    spdlog::error("{}", msg);
    return 1;
  }
  std::vector<std::string> ids;
  for (const auto& ex : source.exercises()) ids.push_back(ex.id);
  spdlog::info("loaded {} exercises from {}", ids.size(), root.string());

  ProgressTracker progress(root / TUTOR_PROGRESS_FILE, ids);
  EventQueue events;

  RunnerOptions ropts;
  ropts.toolchain = cfg.toolchain;
  ropts.timeout = cfg.timeout;
  ropts.success_marker = cfg.success_marker;
  AsyncRunner runner(ropts, events);
  FileWatcher watcher(events, cfg.debounce);

  SessionOptions sopts;
  sopts.auto_advance = cfg.auto_advance;
  sopts.watch = cfg.watch;
  sopts.check_on_change = cfg.check_on_change;
  sopts.run_on_save = cfg.run_on_save;
  sopts.tab_width = cfg.tab_width;
  SessionController session(source, progress, runner, watcher, sopts);
  if (!session.start(msg)) {
    std::cerr << "tutor: " << msg << "\n";
    return 1;
  }

  {
    Terminal term(static_cast<int>(cfg.tick.count()));
    NcursesTerminal screen(cfg.color);
    session.run(screen, events);
  }
  spdlog::info("session finished: {}/{} done", progress.done_count(), progress.total());
  spdlog::shutdown();
  return 0;
}
