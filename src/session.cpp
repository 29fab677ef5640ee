#include "session.hpp"
#include "file_reader.hpp"
#include "file_writer.hpp"
#include "highlighter.hpp"
#include <spdlog/spdlog.h>
#include <ncurses.h>
#include <algorithm>

static constexpr int kOutputStep = 5;
static constexpr int kOutputPage = 10;
static constexpr int kCtrlD = 4;
static constexpr int kCtrlU = 21;

static bool same_file(const std::filesystem::path& a, const std::filesystem::path& b) {
  std::error_code ec;
  if (std::filesystem::equivalent(a, b, ec)) return true;
  return std::filesystem::absolute(a, ec).lexically_normal() == std::filesystem::absolute(b, ec).lexically_normal();
}

static std::vector<std::string> text_lines(const std::string& text) {
  std::vector<std::string> lines = split_lines(text);
  if (lines.size() > 1 && lines.back().empty()) lines.pop_back();
  return lines;
}

SessionController::SessionController(const IExerciseSource& source, ProgressTracker& progress,
                                     IRunService& runner, IWatchService& watcher, SessionOptions opts)
    : source_(source), progress_(progress), runner_(runner), watcher_(watcher), opts_(opts) {
  state_.auto_advance = opts_.auto_advance;
  state_.watch_enabled = opts_.watch;
  state_.editor.set_tab_width(opts_.tab_width);
}

const ExerciseDescriptor& SessionController::current_exercise() const {
  return source_.exercises().at(state_.current);
}

bool SessionController::start(std::string& msg) {
  const auto& exercises = source_.exercises();
  if (exercises.empty()) { msg = "no exercises to run"; return false; }
  ProgressRecord rec = progress_.load();
  size_t index = progress_.first_pending().value_or(0);
  for (size_t i = 0; i < exercises.size(); ++i) {
    if (exercises[i].id == rec.current) { index = i; break; }
  }
  std::string err;
  if (!load_exercise(index, err)) {
    // Keep descriptor and buffer consistent: an empty buffer for this exercise.
    spdlog::warn("cannot open {}: {}", exercises[index].id, err);
    state_.current = index;
    state_.editor.load("");
    state_.editor.set_language(language_for_extension(exercises[index].path.extension().string()));
    known_mtime_.reset();
    subscribe_watcher();
    set_status(err, true);
  }
  return true;
}

bool SessionController::load_exercise(size_t index, std::string& msg) {
  const auto& exercises = source_.exercises();
  if (index >= exercises.size()) { msg = "no such exercise"; return false; }
  const ExerciseDescriptor& ex = exercises[index];
  std::string text;
  if (!read_file_text(ex.path, text, msg)) return false;

  runner_.cancel();
  state_.current = index;
  state_.editor.load(text);
  state_.editor.set_language(language_for_extension(ex.path.extension().string()));
  state_.viewport = Viewport{};
  state_.last_run.reset();
  state_.verifying.reset();
  state_.generation++;
  state_.output_scroll = 0;
  state_.show_solution = false;
  state_.solution_lines.clear();
  state_.solution_scroll = 0;
  set_output({"Exercise " + std::to_string(index + 1) + "/" + std::to_string(exercises.size()) +
                  ": " + ex.display_name,
              "Edit the file, then :c to check it. :h shows a hint, :help lists keys."},
             OutputStyle::Info);
  remember_mtime();
  subscribe_watcher();
  progress_.set_current(ex.id);
  spdlog::info("switched to {} ({})", ex.id, ex.path.string());
  return true;
}

bool SessionController::switch_to(size_t index) {
  std::string msg;
  set_status("");
  if (!load_exercise(index, msg)) {
    spdlog::warn("switch to #{} failed: {}", index, msg);
    set_status(msg, true);
    return false;
  }
  return true;
}

bool SessionController::reload() {
  const ExerciseDescriptor& ex = current_exercise();
  std::string text, msg;
  if (!read_file_text(ex.path, text, msg)) {
    set_status(msg, true);
    return false;
  }
  Cursor cur = state_.editor.cursor();
  state_.editor.load(text);
  state_.editor.set_cursor(cur.row, cur.col);
  remember_mtime();
  return true;
}

void SessionController::remember_mtime() {
  std::filesystem::file_time_type t;
  if (file_mtime(current_exercise().path, t)) known_mtime_ = t;
  else known_mtime_.reset();
}

void SessionController::subscribe_watcher() {
  if (!state_.watch_enabled) {
    watcher_.unwatch();
    return;
  }
  std::string msg;
  if (!watcher_.watch(current_exercise().path, msg)) {
    state_.watch_enabled = false;
    set_status("file watching disabled: " + msg, true);
  }
}

void SessionController::set_status(std::string msg, bool error) {
  state_.status = std::move(msg);
  state_.status_error = error;
}

void SessionController::set_output(std::vector<std::string> lines, OutputStyle style) {
  state_.output = std::move(lines);
  state_.output_style = style;
  state_.output_scroll = 0;
}

bool SessionController::save() {
  const ExerciseDescriptor& ex = current_exercise();
  std::string msg;
  if (!state_.editor.buffer().write_file(ex.path, msg)) {
    spdlog::error("save {} failed: {}", ex.id, msg);
    set_status(msg, true);
    return false;
  }
  state_.editor.mark_saved();
  remember_mtime();
  set_status(msg);
  return true;
}

void SessionController::check(std::optional<RunMode> mode) {
  if (state_.editor.dirty() && !save()) return;
  const ExerciseDescriptor& ex = current_exercise();
  RunRequest req;
  req.exercise = ex;
  req.steps = mode ? std::vector<RunMode>{*mode} : default_run_steps(ex);
  req.generation = ++state_.generation;
  state_.last_run = RunPending{};
  state_.verifying.reset();
  set_output({"Checking " + ex.display_name + "..."}, OutputStyle::Info);
  spdlog::info("check {} #{}", ex.id, req.generation);
  runner_.start(std::move(req));
}

void SessionController::check_all() {
  if (state_.editor.dirty() && !save()) return;
  spdlog::info("checking all {} exercises", source_.exercises().size());
  state_.verifying = 0;
  start_verify_step();
}

void SessionController::start_verify_step() {
  const auto& exercises = source_.exercises();
  size_t i = *state_.verifying;
  const ExerciseDescriptor& ex = exercises.at(i);
  RunRequest req;
  req.exercise = ex;
  req.steps = default_run_steps(ex);
  req.generation = ++state_.generation;
  state_.last_run = RunPending{};
  set_output({"Checking every exercise: " + std::to_string(i + 1) + "/" + std::to_string(exercises.size()) +
                  " " + ex.display_name + "..."},
             OutputStyle::Info);
  runner_.start(std::move(req));
}

void SessionController::quit(bool force) {
  if (!force && state_.editor.dirty()) {
    set_output({"✗ Unsaved changes! Use :wq to save and quit, or :q! to discard them."}, OutputStyle::Error);
    set_status("unsaved changes", true);
    return;
  }
  state_.quit = true;
  shutdown();
}

void SessionController::shutdown() {
  if (shut_down_) return;
  shut_down_ = true;
  runner_.cancel();
  watcher_.unwatch();
  if (!progress_.persist()) spdlog::error("progress not saved at exit: {}", progress_.last_error());
}

void SessionController::reset_exercise() {
  const ExerciseDescriptor& ex = current_exercise();
  std::string text, msg;
  if (!source_.original_text(ex, text, msg)) { set_status(msg, true); return; }
  if (!write_file_atomic(ex.path, text, msg)) { set_status(msg, true); return; }
  progress_.mark_pending(ex.id);
  if (!reload()) return;
  state_.editor.set_cursor(0, 0);
  state_.last_run.reset();
  state_.generation++;
  runner_.cancel();
  set_output({"Exercise " + ex.display_name + " reset to its original state."}, OutputStyle::Info);
  set_status("reset " + ex.path.filename().string());
  spdlog::info("reset {}", ex.id);
}

void SessionController::toggle_solution() {
  if (state_.show_solution) {
    state_.show_solution = false;
    state_.solution_lines.clear();
    return;
  }
  std::string text, msg;
  if (!source_.solution_text(current_exercise(), text, msg)) { set_status(msg, true); return; }
  state_.solution_lines = text_lines(text);
  state_.solution_scroll = 0;
  state_.show_solution = true;
}

void SessionController::show_hint() {
  const ExerciseDescriptor& ex = current_exercise();
  if (ex.hint.empty()) {
    set_output({"No hint for " + ex.display_name + "."}, OutputStyle::Hint);
    return;
  }
  std::vector<std::string> lines{"Hint for " + ex.display_name + ":"};
  for (auto& l : text_lines(ex.hint)) lines.push_back("  " + l);
  set_output(std::move(lines), OutputStyle::Hint);
}

void SessionController::dispatch(const Command& cmd) {
  using K = Command::Kind;
  size_t count = source_.exercises().size();
  switch (cmd.kind) {
    case K::Save:
      if (save() && opts_.run_on_save) check(std::nullopt);
      break;
    case K::Quit: quit(cmd.force); break;
    case K::SaveAndQuit:
      if (save()) quit(true);
      break;
    case K::Check: check(cmd.mode); break;
    case K::CheckAll: check_all(); break;
    case K::ShowHint: show_hint(); break;
    case K::ToggleSolution: toggle_solution(); break;
    case K::Next:
      if (state_.current + 1 < count) switch_to(state_.current + 1);
      else set_status("already at the last exercise");
      break;
    case K::Previous:
      if (state_.current > 0) switch_to(state_.current - 1);
      else set_status("already at the first exercise");
      break;
    case K::ToggleAutoAdvance:
      state_.auto_advance = !state_.auto_advance;
      set_status(state_.auto_advance ? "auto-advance on" : "auto-advance off");
      break;
    case K::ToggleWatch:
      state_.watch_enabled = !state_.watch_enabled;
      if (state_.watch_enabled) remember_mtime();
      set_status(state_.watch_enabled ? "watching for changes" : "file watching off");
      subscribe_watcher();
      break;
    case K::Reload:
      if (reload()) set_status("reloaded " + current_exercise().path.filename().string());
      break;
    case K::Reset: reset_exercise(); break;
    case K::Help: state_.help_visible = true; break;
    case K::ToggleOutput: state_.output_expanded = !state_.output_expanded; break;
    case K::Unknown:
      if (!cmd.text.empty()) set_status("unknown command: " + cmd.text, true);
      break;
  }
}

int SessionController::max_output_scroll() const {
  return std::max(0, static_cast<int>(state_.output.size()) - output_body_);
}

int SessionController::max_solution_scroll() const {
  return std::max(0, static_cast<int>(state_.solution_lines.size()) - solution_body_);
}

void SessionController::scroll_output(int delta) {
  state_.output_scroll = std::clamp(state_.output_scroll + delta, 0, max_output_scroll());
}

void SessionController::scroll_solution(int delta) {
  state_.solution_scroll = std::clamp(state_.solution_scroll + delta, 0, max_solution_scroll());
}

bool SessionController::handle_pane_key(int ch) {
  switch (ch) {
    case 'J': scroll_output(kOutputStep); return true;
    case 'K': scroll_output(-kOutputStep); return true;
    case KEY_NPAGE: scroll_output(kOutputPage); return true;
    case KEY_PPAGE: scroll_output(-kOutputPage); return true;
    case KEY_HOME: state_.output_scroll = 0; return true;
    case KEY_END: state_.output_scroll = max_output_scroll(); return true;
    case kCtrlD:
      if (!state_.show_solution) return false;
      scroll_solution(kOutputStep);
      return true;
    case kCtrlU:
      if (!state_.show_solution) return false;
      scroll_solution(-kOutputStep);
      return true;
    default: return false;
  }
}

void SessionController::handle_key(int ch) {
  if (state_.help_visible) { state_.help_visible = false; return; }
  if (ch == KEY_RESIZE) return;
  // a pending operator takes the next key itself (rJ replaces with J)
  if (state_.editor.mode() == Mode::Normal && !state_.editor.operator_pending() && handle_pane_key(ch)) {
    state_.editor.cancel_pending();
    return;
  }
  std::optional<Command> cmd = state_.editor.handle_key(ch);
  if (cmd) dispatch(*cmd);
}

void SessionController::handle_event(const Event& ev) {
  if (auto* changed = std::get_if<FileChanged>(&ev)) on_file_changed(*changed);
  else if (auto* failed = std::get_if<WatcherFailed>(&ev)) on_watcher_failed(*failed);
  else if (auto* done = std::get_if<RunCompleted>(&ev)) on_run_completed(*done);
}

void SessionController::on_file_changed(const FileChanged& ev) {
  if (!state_.watch_enabled) return;
  const ExerciseDescriptor& ex = current_exercise();
  if (!same_file(ev.path, ex.path)) return;
  std::filesystem::file_time_type t;
  if (!file_mtime(ex.path, t)) return;
  if (known_mtime_ && *known_mtime_ == t) {
    spdlog::debug("ignoring change notification for our own write of {}", ex.id);
    return;
  }
  spdlog::info("{} changed on disk", ex.path.string());
  if (!reload()) return;
  set_status("reloaded " + ex.path.filename().string() + " (changed on disk)");
  if (opts_.check_on_change) check(std::nullopt);
}

void SessionController::on_watcher_failed(const WatcherFailed& ev) {
  if (!same_file(ev.path, current_exercise().path)) {
    spdlog::debug("ignoring watcher failure for {}", ev.path.string());
    return;
  }
  state_.watch_enabled = false;
  watcher_.unwatch();
  set_status("file watching disabled: " + ev.message, true);
}

void SessionController::on_run_completed(const RunCompleted& ev) {
  const auto& exercises = source_.exercises();
  const ExerciseDescriptor& expected = state_.verifying ? exercises.at(*state_.verifying) : current_exercise();
  if (ev.generation != state_.generation || ev.exercise_id != expected.id) {
    spdlog::debug("dropping stale result for {} #{}", ev.exercise_id, ev.generation);
    return;
  }
  if (state_.verifying) {
    on_verify_result(ev.result);
    return;
  }
  const ExerciseDescriptor& ex = expected;
  state_.last_run = ev.result;

  if (auto* ok = std::get_if<RunSuccess>(&ev.result)) {
    progress_.mark_done(ex.id);
    std::vector<std::string> lines{"✓ Exercise " + ex.display_name + " passed!"};
    std::optional<size_t> next = progress_.next_pending_after(state_.current);
    if (state_.auto_advance) {
      if (next) {
        std::string from = ex.display_name;
        if (switch_to(*next)) {
          set_output({"✓ Exercise " + from + " passed!",
                      "Moved on to " + current_exercise().display_name + "."},
                     OutputStyle::Success);
          set_status(from + " done");
          return;
        }
      } else {
        // everything is marked done: make sure it still is
        set_status(ex.display_name + " done, checking every exercise");
        check_all();
        return;
      }
    } else if (next) {
      lines.push_back("Press n for the next exercise.");
    } else {
      lines.push_back("All exercises are marked done. :checkall checks them again.");
    }
    if (!ok->output.empty()) lines.push_back("");
    lines.insert(lines.end(), ok->output.begin(), ok->output.end());
    set_output(std::move(lines), OutputStyle::Success);
  } else if (auto* bad = std::get_if<RunFailure>(&ev.result)) {
    std::vector<std::string> lines{"✗ Exercise " + ex.display_name + " is not passing yet:", ""};
    lines.insert(lines.end(), bad->output.begin(), bad->output.end());
    set_output(std::move(lines), OutputStyle::Failure);
  } else if (auto* err = std::get_if<RunToolError>(&ev.result)) {
    set_output({"✗ Toolchain error: " + err->message, "Fix the setup, then retry with :c."}, OutputStyle::Error);
  }
}

void SessionController::on_verify_result(const RunResult& result) {
  const auto& exercises = source_.exercises();
  size_t i = *state_.verifying;
  const ExerciseDescriptor& ex = exercises.at(i);
  if (std::holds_alternative<RunSuccess>(result)) {
    progress_.mark_done(ex.id);
    if (i + 1 < exercises.size()) {
      state_.verifying = i + 1;
      start_verify_step();
      return;
    }
    state_.verifying.reset();
    state_.last_run = result;
    set_output({"✓ Every exercise passed its final check.", "✓ Congratulations! All exercises are done."},
               OutputStyle::Success);
    spdlog::info("all {} exercises passed", exercises.size());
    return;
  }
  state_.verifying.reset();
  if (auto* err = std::get_if<RunToolError>(&result)) {
    state_.last_run = result;
    set_output({"✗ Toolchain error while checking " + ex.display_name + ": " + err->message,
                "Fix the setup, then retry with :checkall."},
               OutputStyle::Error);
    return;
  }
  progress_.mark_pending(ex.id);
  spdlog::info("{} no longer passes", ex.id);
  std::vector<std::string> lines{"✗ Exercise " + ex.display_name + " no longer passes and is pending again:", ""};
  if (auto* bad = std::get_if<RunFailure>(&result)) lines.insert(lines.end(), bad->output.begin(), bad->output.end());
  if (i != state_.current && !switch_to(i)) return;
  state_.last_run = result;
  set_output(std::move(lines), OutputStyle::Failure);
}

void SessionController::update_viewport(int rows, int cols) {
  FrameLayout f = frame_layout(rows, cols, state_);
  Rect text = editor_text_area(f.editor, state_.editor.buffer().line_count());
  state_.viewport = follow_cursor(state_.viewport, state_.editor.cursor(), text.height, text.width);
  output_body_ = std::max(1, pane_body_rows(f.output));
  solution_body_ = std::max(1, pane_body_rows(f.solution));
  state_.output_scroll = std::clamp(state_.output_scroll, 0, max_output_scroll());
  state_.solution_scroll = std::clamp(state_.solution_scroll, 0, max_solution_scroll());
}

FrameInput SessionController::frame(std::chrono::milliseconds elapsed) const {
  const ExerciseDescriptor& ex = current_exercise();
  return FrameInput{state_, ex, static_cast<int>(source_.exercises().size()),
                    progress_.done_count(), progress_.is_done(ex.id), elapsed};
}

void SessionController::run(ITerminal& term, EventQueue& events) {
  Renderer renderer;
  auto t0 = std::chrono::steady_clock::now();
  while (!state_.quit) {
    TermSize sz = term.getSize();
    update_viewport(sz.rows, sz.cols);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
    renderer.render(term, frame(elapsed));
    int ch = getch();
    if (ch != ERR) handle_key(ch);
    for (const Event& ev : events.drain()) handle_event(ev);
  }
  shutdown();
}
