#pragma once
/*
 * SessionController
 *
 * Purpose: top-level orchestrator and sole writer of SessionState.
 * Flow: keys → EditorCore → Command → dispatch; watcher/runner events arrive
 * through the EventQueue and are applied on the main thread between frames.
 * Invariants:
 *   - buffer and current exercise always describe the same exercise; a
 *     switch reads the new text first and only then replaces both;
 *   - a RunCompleted is applied only if its generation and exercise id
 *     match the latest request.
 */
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "command.hpp"
#include "events.hpp"
#include "exercise.hpp"
#include "file_watcher.hpp"
#include "iterminal.hpp"
#include "progress.hpp"
#include "renderer.hpp"
#include "runner.hpp"
#include "session_state.hpp"

struct SessionOptions {
  bool auto_advance = true;
  bool watch = true;
  bool check_on_change = true;
  bool run_on_save = false;
  int tab_width = 4;
};

class SessionController {
public:
  SessionController(const IExerciseSource& source, ProgressTracker& progress,
                    IRunService& runner, IWatchService& watcher,
                    SessionOptions opts = SessionOptions());

  // Loads progress and opens the exercise to resume at. False only when there are no exercises.
  bool start(std::string& msg);

  const SessionState& state() const { return state_; }
  const ExerciseDescriptor& current_exercise() const;
  bool should_quit() const { return state_.quit; }

  void handle_key(int ch);
  void handle_event(const Event& ev);
  void dispatch(const Command& cmd);

  bool save();
  void check(std::optional<RunMode> mode);
  // Re-runs every exercise in order; the first one that fails becomes pending and current.
  void check_all();
  bool switch_to(size_t index);
  bool reload();
  void shutdown();

  void update_viewport(int rows, int cols);
  FrameInput frame(std::chrono::milliseconds elapsed) const;

  // Main loop: render, read one key (bounded by the terminal read timeout), drain events.
  void run(ITerminal& term, EventQueue& events);

private:
  void on_file_changed(const FileChanged& ev);
  void on_watcher_failed(const WatcherFailed& ev);
  void on_run_completed(const RunCompleted& ev);
  void on_verify_result(const RunResult& result);
  void start_verify_step();
  bool load_exercise(size_t index, std::string& msg);
  void quit(bool force);
  void reset_exercise();
  void toggle_solution();
  void show_hint();
  bool handle_pane_key(int ch);
  void scroll_output(int delta);
  void scroll_solution(int delta);
  int max_output_scroll() const;
  int max_solution_scroll() const;
  void subscribe_watcher();
  void remember_mtime();
  void set_status(std::string msg, bool error = false);
  void set_output(std::vector<std::string> lines, OutputStyle style);

  const IExerciseSource& source_;
  ProgressTracker& progress_;
  IRunService& runner_;
  IWatchService& watcher_;
  SessionOptions opts_;
  SessionState state_;
  std::optional<std::filesystem::file_time_type> known_mtime_;
  // pane heights from the last laid-out frame
  int output_body_ = 1;
  int solution_body_ = 1;
  bool shut_down_ = false;
};
