#include "runner.hpp"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path g_dir;

static std::string script(const std::string& name, const std::string& body) {
  fs::path p = g_dir / name;
  {
    std::ofstream out(p);
    out << "#!/bin/sh\n" << body << "\n";
  }
  fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
  return p.string();
}

static ExerciseDescriptor exercise() {
  ExerciseDescriptor ex;
  ex.id = "intro1";
  ex.path = g_dir / "intro1.rs";
  ex.work_dir = g_dir;
  return ex;
}

static RunResult run_with(const std::string& toolchain, RunMode mode = RunMode::Check,
                          const std::string& marker = "") {
  RunnerOptions opts;
  opts.toolchain = toolchain;
  opts.success_marker = marker;
  opts.timeout = std::chrono::milliseconds(5000);
  return ExerciseRunner(opts).run(exercise(), mode);
}

static void test_output_cleanup() {
  assert(strip_ansi("\x1b[1;32mok\x1b[0m") == "ok");
  assert(strip_ansi("\x1b]0;title\x07text") == "text");
  assert(strip_ansi("a\x1b]8;;http://x\x1b\\link") == "alink");
  auto lines = output_lines("a\tb\r\nprogress 10%\rprogress 100%\n\n\n");
  assert(lines.size() == 2);
  assert(lines[0] == "a    b");
  assert(lines[1] == "progress 100%");
  assert(output_lines("").empty());
}

static void test_classify() {
  assert(std::holds_alternative<RunSuccess>(ExerciseRunner::classify(0, "", "")));
  assert(std::holds_alternative<RunToolError>(ExerciseRunner::classify(0, "done\n", "PASSED")));
  assert(std::holds_alternative<RunSuccess>(ExerciseRunner::classify(0, "all PASSED here\n", "PASSED")));
  assert(std::holds_alternative<RunFailure>(ExerciseRunner::classify(1, "error\n", "")));
  assert(std::holds_alternative<RunToolError>(ExerciseRunner::classify(2, "\n\n", "")));
}

static void test_runs() {
  RunResult r = run_with(script("ok.sh", "printf '\\033[32mAll good\\033[0m\\n'"));
  auto* ok = std::get_if<RunSuccess>(&r);
  assert(ok);
  assert(ok->output.size() == 1 && ok->output[0] == "All good");

  r = run_with(script("args.sh", "echo \"$1 $2\""), RunMode::Test);
  ok = std::get_if<RunSuccess>(&r);
  assert(ok && ok->output[0] == "test " + (g_dir / "intro1.rs").string());

  r = run_with(script("pwd.sh", "pwd"));
  ok = std::get_if<RunSuccess>(&r);
  assert(ok && fs::equivalent(fs::path(ok->output.at(0)), g_dir));

  r = run_with(script("fail.sh", "echo 'error[E0308]: mismatched types' >&2\nexit 1"));
  auto* bad = std::get_if<RunFailure>(&r);
  assert(bad);
  assert(bad->output.at(0) == "error[E0308]: mismatched types");

  r = run_with(script("silent.sh", "exit 3"));
  auto* err = std::get_if<RunToolError>(&r);
  assert(err && err->message.find("status 3") != std::string::npos);

  r = run_with(script("nomarker.sh", "echo compiled"), RunMode::Check, "PASSED");
  assert(std::holds_alternative<RunToolError>(r));
  r = run_with(script("marker.sh", "echo '3 tests PASSED'"), RunMode::Check, "PASSED");
  assert(std::holds_alternative<RunSuccess>(r));

  r = run_with((g_dir / "no-such-toolchain").string());
  err = std::get_if<RunToolError>(&r);
  assert(err && err->message.find("cannot start") != std::string::npos);

  ExerciseDescriptor ex = exercise();
  ex.work_dir = g_dir / "missing-dir";
  RunnerOptions opts;
  opts.toolchain = script("never.sh", "echo unreachable");
  r = ExerciseRunner(opts).run(ex, RunMode::Check);
  err = std::get_if<RunToolError>(&r);
  assert(err && err->message.find("cannot enter") != std::string::npos);
}

static void test_limits() {
  RunnerOptions opts;
  opts.toolchain = script("slow.sh", "sleep 5");
  opts.timeout = std::chrono::milliseconds(200);
  auto t0 = std::chrono::steady_clock::now();
  RunResult r = ExerciseRunner(opts).run(exercise(), RunMode::Check);
  auto took = std::chrono::steady_clock::now() - t0;
  auto* err = std::get_if<RunToolError>(&r);
  assert(err && err->message.find("timed out") != std::string::npos);
  assert(took < std::chrono::seconds(3));

  opts = RunnerOptions();
  opts.toolchain = script("chatty.sh", "i=0\nwhile [ $i -lt 200 ]; do echo line $i; i=$((i+1)); done");
  opts.output_capacity = 64;
  r = ExerciseRunner(opts).run(exercise(), RunMode::Check);
  auto* ok = std::get_if<RunSuccess>(&r);
  assert(ok);
  assert(ok->output.back() == "[output truncated]");
  assert(ok->output.size() < 20);
}

static void test_steps() {
  RunnerOptions opts;
  opts.toolchain = script("steps.sh", "if [ \"$1\" = lint ]; then echo 'warning: unused'; exit 1; fi\necho \"$1 ok\"");
  ExerciseRunner runner(opts);
  RunResult r = runner.run_steps(exercise(), {RunMode::Check, RunMode::Lint});
  auto* bad = std::get_if<RunFailure>(&r);
  assert(bad);
  assert(bad->output.size() == 2);
  assert(bad->output[0] == "check ok");
  assert(bad->output[1] == "warning: unused");

  r = runner.run_steps(exercise(), {RunMode::Check, RunMode::Test});
  auto* ok = std::get_if<RunSuccess>(&r);
  assert(ok && ok->output.size() == 2 && ok->output[1] == "test ok");
}

static void test_async() {
  EventQueue events;
  RunnerOptions opts;
  opts.toolchain = script("async.sh", "echo done");
  {
    AsyncRunner runner(opts, events);
    runner.start(RunRequest{exercise(), {RunMode::Check}, 7});
    Event ev;
    assert(events.pop_for(ev, std::chrono::milliseconds(5000)));
    auto* done = std::get_if<RunCompleted>(&ev);
    assert(done);
    assert(done->exercise_id == "intro1");
    assert(done->generation == 7);
    assert(std::holds_alternative<RunSuccess>(done->result));
  }

  opts.toolchain = script("sleepy.sh", "sleep 3\necho late");
  {
    AsyncRunner runner(opts, events);
    runner.start(RunRequest{exercise(), {RunMode::Check}, 8});
    runner.cancel();
    Event ev;
    assert(!events.pop_for(ev, std::chrono::milliseconds(1000)));
    assert(!runner.busy());
  }

  // a newer request supersedes the running one; only the newer posts
  opts.toolchain = script("modes.sh", "if [ \"$1\" = check ]; then sleep 3; fi\necho \"$1 done\"");
  {
    AsyncRunner runner(opts, events);
    runner.start(RunRequest{exercise(), {RunMode::Check}, 9});
    runner.start(RunRequest{exercise(), {RunMode::Test}, 10});
    Event ev;
    assert(events.pop_for(ev, std::chrono::milliseconds(5000)));
    auto& done = std::get<RunCompleted>(ev);
    assert(done.generation == 10);
    assert(std::get<RunSuccess>(done.result).output.at(0) == "test done");
    assert(!events.pop_for(ev, std::chrono::milliseconds(1000)));
  }
}

int main() {
  g_dir = fs::temp_directory_path() / ("tutor_run_" + std::to_string(::getpid()));
  fs::create_directories(g_dir);
  test_output_cleanup();
  test_classify();
  test_runs();
  test_limits();
  test_steps();
  test_async();
  fs::remove_all(g_dir);
  return 0;
}
