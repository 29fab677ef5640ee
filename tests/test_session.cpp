#include "session.hpp"
#include "file_reader.hpp"
#include "headless_terminal.hpp"
#include <ncurses.h>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

class FakeRunner : public IRunService {
public:
  void start(RunRequest req) override { started.push_back(std::move(req)); }
  void cancel() override { cancels++; }

  std::vector<RunRequest> started;
  int cancels = 0;
};

class FakeWatcher : public IWatchService {
public:
  bool watch(const fs::path& file, std::string& msg) override {
    if (fail_next) { msg = "inotify limit reached"; fail_next = false; return false; }
    watched.push_back(file);
    active = true;
    return true;
  }
  void unwatch() override { unwatches++; active = false; }
  bool watching() const override { return active; }

  std::vector<fs::path> watched;
  int unwatches = 0;
  bool active = false;
  bool fail_next = false;
};

static const char* kIntro1 = "fn main() {\n    let x = 5;\n}\n";
static const char* kIntro1Solution = "fn main() {\n    let x: i32 = 5;\n}\n";

static std::string read_all(const fs::path& p) {
  std::string text, msg;
  bool ok = read_file_text(p, text, msg);
  assert(ok);
  return text;
}

static void write_all(const fs::path& p, const std::string& text) {
  std::ofstream out(p, std::ios::trunc);
  out << text;
}

struct Fixture {
  fs::path dir;
  InMemoryExerciseSource source;
  std::unique_ptr<ProgressTracker> progress;
  FakeRunner runner;
  FakeWatcher watcher;
  std::unique_ptr<SessionController> session;

  explicit Fixture(SessionOptions opts = SessionOptions(), const std::string& progress_text = "",
                   bool start = true) {
    static int counter = 0;
    dir = fs::temp_directory_path() / ("tutor_session_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    fs::create_directories(dir);
    add("intro1", kIntro1, kIntro1Solution, "Read the docs.\nThen fix it.");
    add("intro2", "fn main() {}\n", "", "");
    add("vars1", "let y;\n", "", "");
    if (!progress_text.empty()) write_all(dir / ".tutor-progress", progress_text);
    rebuild(opts, start);
  }

  // New tracker and controller over the current exercise list.
  void rebuild(SessionOptions opts = SessionOptions(), bool start = true) {
    session.reset();
    std::vector<std::string> ids;
    for (const auto& ex : source.exercises()) ids.push_back(ex.id);
    progress = std::make_unique<ProgressTracker>(dir / ".tutor-progress", ids);
    session = std::make_unique<SessionController>(source, *progress, runner, watcher, opts);
    if (start) {
      std::string msg;
      bool ok = session->start(msg);
      assert(ok);
    }
  }

  ~Fixture() {
    session.reset();
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  void add(const std::string& id, const std::string& text, const std::string& solution, const std::string& hint) {
    ExerciseDescriptor ex;
    ex.id = id;
    ex.path = dir / (id + ".rs");
    ex.work_dir = dir;
    ex.hint = hint;
    write_all(ex.path, text);
    source.add(ex, text, solution);
  }

  SessionController& s() { return *session; }
  const SessionState& st() { return session->state(); }
  fs::path path(size_t i) { return source.exercises().at(i).path; }

  void keys(const std::string& k) {
    for (unsigned char c : k) session->handle_key(c);
  }
  void command(const std::string& c) { keys(":" + c + "\n"); }

  void complete(const RunResult& r) {
    complete(session->current_exercise().id, r);
  }
  void complete(const std::string& id, const RunResult& r) {
    session->handle_event(RunCompleted{id, st().generation, r});
  }
};

static RunResult success(std::vector<std::string> out) { return RunSuccess{std::move(out)}; }
static RunResult failure(std::vector<std::string> out) { return RunFailure{std::move(out)}; }

static void test_start_and_resume() {
  {
    Fixture f;
    assert(f.st().current == 0);
    assert(f.st().editor.serialize() == kIntro1);
    assert(!f.st().editor.dirty());
    assert(f.watcher.watched.size() == 1 && f.watcher.watched[0] == f.path(0));
    assert(f.progress->record().current == "intro1");
    assert(f.s().frame(std::chrono::milliseconds(0)).exercise_count == 3);
  }
  {
    Fixture f(SessionOptions(), "intro1 = done\n");
    assert(f.st().current == 1);
    assert(f.s().frame(std::chrono::milliseconds(0)).done_count == 1);
  }
  {
    Fixture f(SessionOptions(), "current = vars1\nintro1 = done\n");
    assert(f.st().current == 2);
    assert(f.st().editor.serialize() == "let y;\n");
  }
  {
    // a missing exercise file still opens, with an empty buffer and an error
    Fixture f(SessionOptions(), "", false);
    fs::remove(f.path(0));
    std::string msg;
    assert(f.s().start(msg));
    assert(f.st().current == 0);
    assert(f.st().editor.buffer().empty());
    assert(f.st().status_error);
  }
}

static void test_save_and_quit() {
  Fixture f;
  f.keys("ix");
  f.keys("\x1b");
  assert(f.st().editor.dirty());
  f.command("wq");
  assert(f.s().should_quit());
  assert(read_all(f.path(0)) == std::string("x") + kIntro1);
  assert(!f.progress->dirty());
  assert(fs::exists(f.dir / ".tutor-progress"));
  assert(f.runner.cancels > 0);
  assert(!f.watcher.active);
  // shutting down twice is harmless
  f.s().shutdown();
}

static void test_quit_guard() {
  Fixture f;
  f.keys("ix\x1b");
  f.keys("q");
  assert(!f.s().should_quit());
  assert(f.st().output.at(0).find("Unsaved changes!") != std::string::npos);
  assert(f.st().status_error);
  f.command("q");
  assert(!f.s().should_quit());
  f.command("q!");
  assert(f.s().should_quit());
  assert(read_all(f.path(0)) == kIntro1);

  Fixture clean;
  clean.keys("q");
  assert(clean.s().should_quit());
}

static void test_check_and_advance() {
  Fixture f;
  f.keys("ix\x1b");
  f.command("c");
  assert(!f.st().editor.dirty());
  assert(read_all(f.path(0)).front() == 'x');
  assert(f.runner.started.size() == 1);
  const RunRequest& req = f.runner.started[0];
  assert(req.exercise.id == "intro1");
  assert(req.generation == f.st().generation);
  assert(req.steps.size() == 1 && req.steps[0] == RunMode::Check);
  assert(f.st().running());
  assert(f.st().output.at(0) == "Checking intro1...");

  f.complete(success({"compiled"}));
  assert(f.progress->is_done("intro1"));
  assert(f.st().current == 1);
  assert(f.st().editor.serialize() == "fn main() {}\n");
  assert(f.st().output.at(0) == "✓ Exercise intro1 passed!");
  assert(f.st().output_style == OutputStyle::Success);
  assert(!f.st().running());
  assert(f.progress->record().current == "intro2");

  f.command("test");
  assert(f.runner.started.back().steps.at(0) == RunMode::Test);
  f.command("lint");
  assert(f.runner.started.back().steps.at(0) == RunMode::Lint);
}

static void test_stale_results() {
  Fixture f;
  f.command("c");
  std::uint64_t old_gen = f.st().generation;
  f.command("c");
  assert(f.st().generation == old_gen + 1);

  f.s().handle_event(RunCompleted{"intro1", old_gen, success({})});
  assert(!f.progress->is_done("intro1"));
  assert(f.st().running());

  f.s().handle_event(RunCompleted{"intro2", f.st().generation, success({})});
  assert(!f.progress->is_done("intro1"));
  assert(!f.progress->is_done("intro2"));

  f.complete(failure({"error[E0384]: cannot assign twice"}));
  assert(!f.progress->is_done("intro1"));
  assert(f.st().current == 0);
  assert(f.st().output.at(0) == "✗ Exercise intro1 is not passing yet:");
  assert(f.st().output.back() == "error[E0384]: cannot assign twice");
  assert(f.st().output_style == OutputStyle::Failure);
  assert(!f.st().running());

  f.command("c");
  f.complete(RunToolError{"cannot start toolchain 'x'"});
  assert(f.st().output.at(0).find("Toolchain error") != std::string::npos);
  assert(f.st().output_style == OutputStyle::Error);

  // switching exercises makes a pending result stale
  f.command("c");
  std::uint64_t before_switch = f.st().generation;
  f.keys("n");
  f.s().handle_event(RunCompleted{"intro1", before_switch, success({})});
  assert(!f.progress->is_done("intro1"));
}

static void test_manual_advance_and_completion() {
  Fixture f;
  f.command("auto");
  assert(!f.st().auto_advance);
  f.command("c");
  f.complete(success({"ok"}));
  assert(f.st().current == 0);
  assert(f.progress->is_done("intro1"));
  bool prompt = false;
  for (const auto& l : f.st().output) if (l == "Press n for the next exercise.") prompt = true;
  assert(prompt);
  assert(f.st().output.back() == "ok");

  // finishing the last pending exercise checks every exercise again
  Fixture g(SessionOptions(), "intro1 = done\nintro2 = done\ncurrent = vars1\n");
  g.command("c");
  g.complete(success({}));
  assert(g.st().current == 2);
  assert(g.st().verifying == std::optional<size_t>(0));
  assert(g.st().running());
  assert(g.runner.started.back().exercise.id == "intro1");
  assert(g.st().output.at(0) == "Checking every exercise: 1/3 intro1...");
  g.complete("intro1", success({}));
  assert(g.st().verifying == std::optional<size_t>(1));
  assert(g.runner.started.back().exercise.id == "intro2");
  // a result for the wrong exercise is ignored
  g.complete("vars1", success({}));
  assert(g.st().verifying == std::optional<size_t>(1));
  g.complete("intro2", success({}));
  g.complete("vars1", success({}));
  assert(!g.st().verifying);
  assert(!g.st().running());
  assert(g.st().current == 2);
  assert(g.st().output.back() == "✓ Congratulations! All exercises are done.");
  assert(g.s().frame(std::chrono::milliseconds(0)).done_count == 3);

  // an exercise that no longer passes becomes pending and current
  Fixture h(SessionOptions(), "intro1 = done\nintro2 = done\nvars1 = done\ncurrent = vars1\n");
  h.command("checkall");
  assert(h.st().verifying == std::optional<size_t>(0));
  h.complete("intro1", success({}));
  h.complete("intro2", failure({"error: expected `;`"}));
  assert(!h.st().verifying);
  assert(h.st().current == 1);
  assert(!h.progress->is_done("intro2"));
  assert(h.progress->is_done("intro1"));
  assert(h.st().output.at(0).find("no longer passes") != std::string::npos);
  assert(h.st().output.back() == "error: expected `;`");
  assert(h.st().output_style == OutputStyle::Failure);
  assert(h.progress->record().current == "intro2");

  // a plain check stops the pass
  h.command("checkall");
  h.command("c");
  assert(!h.st().verifying);
  h.complete(success({}));
  assert(h.progress->is_done("intro2"));

  // without auto-advance nothing runs on its own
  Fixture m(SessionOptions(), "intro1 = done\nintro2 = done\ncurrent = vars1\n");
  m.command("auto");
  m.command("c");
  size_t runs = m.runner.started.size();
  m.complete(success({}));
  assert(m.runner.started.size() == runs);
  assert(!m.st().verifying);
  assert(m.st().output.at(1).find(":checkall") != std::string::npos);
}

static void test_hint_and_solution() {
  Fixture f;
  f.command("hint");
  std::vector<std::string> long_form = f.st().output;
  f.command("h");
  assert(f.st().output == long_form);
  assert(long_form.size() == 3);
  assert(long_form[0] == "Hint for intro1:");
  assert(long_form[1] == "  Read the docs.");
  assert(f.st().output_style == OutputStyle::Hint);

  f.keys("s");
  assert(f.st().show_solution);
  assert(f.st().solution_lines.size() == 3);
  assert(f.st().solution_lines[1] == "    let x: i32 = 5;");
  f.command("solution");
  assert(!f.st().show_solution);

  f.keys("n");
  f.command("h");
  assert(f.st().output.at(0) == "No hint for intro2.");
  f.keys("s");
  assert(!f.st().show_solution);
  assert(f.st().status_error);
}

static void test_navigation() {
  Fixture f;
  f.keys("p");
  assert(f.st().current == 0);
  assert(f.st().status == "already at the first exercise");
  f.keys("ix\x1b");
  f.keys("n");
  assert(f.st().current == 1);
  // unsaved edits are dropped on switch
  assert(read_all(f.path(0)) == kIntro1);
  assert(!f.st().editor.dirty());
  f.command("next");
  f.keys("]");
  assert(f.st().current == 2);
  assert(f.st().status == "already at the last exercise");
  f.keys("[");
  assert(f.st().current == 1);
  assert(f.watcher.watched.back() == f.path(1));
  assert(f.progress->record().current == "intro2");
}

static void test_file_changes() {
  Fixture f;
  f.keys("ix\x1b");
  f.command("w");
  size_t checks = f.runner.started.size();
  f.s().handle_event(FileChanged{f.path(0)});
  assert(f.runner.started.size() == checks);
  assert(f.st().status.find("saved") != std::string::npos);

  auto t = fs::last_write_time(f.path(0));
  write_all(f.path(0), "fn main() { println!(\"edited\"); }\n");
  fs::last_write_time(f.path(0), t + std::chrono::seconds(5));
  f.s().handle_event(FileChanged{f.dir / "." / "intro1.rs"});
  assert(f.st().editor.serialize() == "fn main() { println!(\"edited\"); }\n");
  assert(f.runner.started.size() == checks + 1);
  assert(f.st().status.find("changed on disk") != std::string::npos);

  // other files and disabled watching are ignored
  f.s().handle_event(FileChanged{f.path(1)});
  assert(f.runner.started.size() == checks + 1);
  f.command("watch");
  assert(!f.st().watch_enabled);
  assert(!f.watcher.active);
  write_all(f.path(0), "changed again\n");
  fs::last_write_time(f.path(0), t + std::chrono::seconds(10));
  f.s().handle_event(FileChanged{f.path(0)});
  assert(f.st().editor.serialize() != "changed again\n");
  f.command("watch");
  assert(f.st().watch_enabled);
  assert(f.watcher.active);

  // a failure from an earlier subscription does not stop the current one
  f.s().handle_event(WatcherFailed{f.path(1), "directory of intro2.rs is gone"});
  assert(f.st().watch_enabled);
  assert(f.watcher.active);
  f.s().handle_event(WatcherFailed{f.path(0), "directory of intro1.rs is gone"});
  assert(!f.st().watch_enabled);
  assert(f.st().status_error);

  f.watcher.fail_next = true;
  f.command("watch");
  assert(!f.st().watch_enabled);
  assert(f.st().status.find("inotify limit reached") != std::string::npos);

  SessionOptions quiet;
  quiet.check_on_change = false;
  Fixture g(quiet);
  auto t2 = fs::last_write_time(g.path(0));
  write_all(g.path(0), "external\n");
  fs::last_write_time(g.path(0), t2 + std::chrono::seconds(5));
  g.s().handle_event(FileChanged{g.path(0)});
  assert(g.st().editor.serialize() == "external\n");
  assert(g.runner.started.empty());
}

static void test_reset_and_reload() {
  Fixture f;
  f.command("c");
  f.complete(success({}));
  f.keys("p");
  assert(f.progress->is_done("intro1"));
  write_all(f.path(0), "broken\n");
  f.command("r");
  assert(f.st().editor.serialize() == "broken\n");
  f.command("reset");
  assert(read_all(f.path(0)) == kIntro1);
  assert(f.st().editor.serialize() == kIntro1);
  assert(!f.progress->is_done("intro1"));
  assert(f.st().output.at(0).find("reset to its original state") != std::string::npos);
}

static void test_keys_and_commands() {
  SessionOptions opts;
  opts.run_on_save = true;
  Fixture f(opts);
  f.command("w");
  assert(f.runner.started.size() == 1);

  std::vector<std::string> lines;
  for (int i = 0; i < 30; ++i) lines.push_back("note " + std::to_string(i));
  f.complete(failure(lines));
  assert(f.st().output.size() == 32);
  // 24x80: the output pane shows 7 lines, so the last start row is 25
  f.s().update_viewport(24, 80);
  f.keys("J");
  assert(f.st().output_scroll == 5);
  f.keys("K");
  f.keys("K");
  assert(f.st().output_scroll == 0);
  f.s().handle_key(KEY_NPAGE);
  assert(f.st().output_scroll == 10);
  f.s().handle_key(KEY_END);
  assert(f.st().output_scroll == 25);

  HeadlessTerminal term(24, 80);
  Renderer renderer;
  renderer.render(term, f.s().frame(std::chrono::milliseconds(0)));
  assert(term.row_text(15) == " note 23");
  assert(term.row_text(21) == " note 29");
  f.keys("K");
  assert(f.st().output_scroll == 20);
  renderer.render(term, f.s().frame(std::chrono::milliseconds(0)));
  assert(term.row_text(15) == " note 18");
  f.s().handle_key(KEY_HOME);
  assert(f.st().output_scroll == 0);

  // Ctrl+O gives the output the main area
  f.keys("\x0f");
  assert(f.st().output_expanded);
  f.s().update_viewport(24, 80);
  f.s().handle_key(KEY_END);
  assert(f.st().output_scroll == 15);
  renderer.render(term, f.s().frame(std::chrono::milliseconds(0)));
  assert(term.contains("(Ctrl+O to shrink)"));
  assert(term.row_text(1).find("─ intro1.rs") == 0);
  f.command("output");
  assert(!f.st().output_expanded);
  f.s().update_viewport(24, 80);
  assert(f.st().output_scroll == 15);

  f.command("help");
  assert(f.st().help_visible);
  f.keys("q");
  assert(!f.st().help_visible);
  assert(!f.s().should_quit());

  f.command("frobnicate");
  assert(f.st().status == "unknown command: frobnicate");
  assert(f.st().status_error);

  // the viewport follows the cursor
  f.keys("ix\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\x1b");
  f.s().update_viewport(24, 80);
  assert(f.st().viewport.top_line > 0);
  assert(f.st().editor.cursor().row - f.st().viewport.top_line < 12);
}

static void test_pending_keys() {
  Fixture f;
  f.command("c");
  std::vector<std::string> lines;
  for (int i = 0; i < 30; ++i) lines.push_back("note " + std::to_string(i));
  f.complete(failure(lines));
  f.s().update_viewport(24, 80);

  // an output key drops a half-typed operator instead of completing it later
  f.keys("dJd");
  assert(f.st().editor.buffer().line_count() == 3);
  f.keys("d");
  assert(f.st().editor.buffer().line_count() == 2);

  // a scroll consumes a pending count
  int before = f.st().output_scroll;
  f.keys("2J");
  assert(f.st().output_scroll == before + 5);
  f.keys("dd");
  assert(f.st().editor.buffer().line_count() == 1);

  // r takes the next key even when it is an output key
  f.keys("0rJ");
  assert(f.st().editor.buffer().line(0).front() == 'J');
  assert(f.st().output_scroll == before + 5);
}

static void test_solution_scroll() {
  Fixture f(SessionOptions(), "", false);
  std::string sol;
  for (int i = 0; i < 40; ++i) sol += "// step " + std::to_string(i) + "\n";
  f.add("long1", "fn main() {}\n", sol, "");
  f.rebuild();
  assert(f.s().switch_to(3));

  // without the solution pane Ctrl+D is an editor key
  f.s().handle_key(4);
  assert(f.st().solution_scroll == 0);

  f.keys("s");
  assert(f.st().show_solution);
  f.s().update_viewport(24, 80);
  f.s().handle_key(4);
  assert(f.st().solution_scroll == 5);
  for (int i = 0; i < 10; ++i) f.s().handle_key(4);
  assert(f.st().solution_scroll == 28);
  f.s().handle_key(21);
  assert(f.st().solution_scroll == 23);

  HeadlessTerminal term(24, 80);
  Renderer renderer;
  renderer.render(term, f.s().frame(std::chrono::milliseconds(0)));
  assert(term.row_text(2).find("// step 23") != std::string::npos);
  assert(term.row_text(13).find("// step 34") != std::string::npos);

  f.keys("s");
  f.keys("s");
  assert(f.st().solution_scroll == 0);
}

int main() {
  test_start_and_resume();
  test_save_and_quit();
  test_quit_guard();
  test_check_and_advance();
  test_stale_results();
  test_manual_advance_and_completion();
  test_hint_and_solution();
  test_navigation();
  test_file_changes();
  test_reset_and_reload();
  test_keys_and_commands();
  test_pending_keys();
  test_solution_scroll();
  return 0;
}
