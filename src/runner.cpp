#include "runner.hpp"
#include "posix_fd.hpp"
#include <spdlog/spdlog.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

using Clock = std::chrono::steady_clock;

namespace {

enum class SpawnStage : int { Chdir = 1, Exec = 2 };

struct SpawnReport {
  int stage = 0;
  int error = 0;
};

}

std::string strip_ansi(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    if (s[i] != '\x1b') { out.push_back(s[i++]); continue; }
    if (i + 1 >= s.size()) break;
    char kind = s[i + 1];
    i += 2;
    if (kind == '[') {
      // CSI: parameters until a final byte in 0x40..0x7E
      while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i++]);
        if (c >= 0x40 && c <= 0x7E) break;
      }
    } else if (kind == ']') {
      // OSC: until BEL or ESC backslash
      while (i < s.size()) {
        if (s[i] == '\x07') { i++; break; }
        if (s[i] == '\x1b' && i + 1 < s.size() && s[i + 1] == '\\') { i += 2; break; }
        i++;
      }
    }
  }
  return out;
}

std::vector<std::string> output_lines(const std::string& raw) {
  std::vector<std::string> lines;
  std::string clean = strip_ansi(raw);
  size_t start = 0;
  while (start <= clean.size()) {
    size_t nl = clean.find('\n', start);
    std::string line = clean.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    size_t cr = line.rfind('\r');
    if (cr != std::string::npos) line.erase(0, cr + 1);
    std::string expanded;
    expanded.reserve(line.size());
    for (char c : line) {
      if (c == '\t') expanded += "    ";
      else expanded.push_back(c);
    }
    lines.push_back(std::move(expanded));
    if (nl == std::string::npos) break;
    start = nl + 1;
  }
  while (!lines.empty() && lines.back().empty()) lines.pop_back();
  return lines;
}

ExerciseRunner::ExerciseRunner(RunnerOptions opts) : opts_(std::move(opts)) {}

RunResult ExerciseRunner::classify(int exit_code, const std::string& output, const std::string& marker) {
  std::vector<std::string> lines = output_lines(output);
  if (exit_code == 0) {
    if (marker.empty()) return RunSuccess{std::move(lines)};
    for (const auto& l : lines) {
      if (l.find(marker) != std::string::npos) return RunSuccess{std::move(lines)};
    }
    return RunToolError{"toolchain exited 0 without success marker '" + marker + "'"};
  }
  if (!lines.empty()) return RunFailure{std::move(lines)};
  return RunToolError{"toolchain exited with status " + std::to_string(exit_code) + " and no output"};
}

RunResult ExerciseRunner::run(const ExerciseDescriptor& ex, RunMode mode, const RunCancel* cancel) const {
  UniquePipe out, report;
  if (!make_pipe(out) || !make_pipe(report)) {
    return RunToolError{std::string("cannot create pipe: ") + std::strerror(errno)};
  }
  std::string program = opts_.toolchain;
  std::string verb = run_mode_name(mode);
  std::string path = ex.path.string();
  std::string dir = ex.work_dir.empty() ? std::string(".") : ex.work_dir.string();
  std::vector<char*> argv{program.data(), verb.data(), path.data(), nullptr};

  spdlog::info("run {}: {} {} {} (cwd {})", ex.id, program, verb, path, dir);
  pid_t pid = ::fork();
  if (pid < 0) {
    return RunToolError{std::string("fork failed: ") + std::strerror(errno)};
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    SpawnReport rep;
    if (::chdir(dir.c_str()) != 0) {
      rep = SpawnReport{static_cast<int>(SpawnStage::Chdir), errno};
      (void)!::write(report.write_end.get(), &rep, sizeof rep);
      ::_exit(127);
    }
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out.write_end.get(), STDOUT_FILENO);
    ::dup2(out.write_end.get(), STDERR_FILENO);
    ::execvp(argv[0], argv.data());
    rep = SpawnReport{static_cast<int>(SpawnStage::Exec), errno};
    (void)!::write(report.write_end.get(), &rep, sizeof rep);
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  out.write_end.reset();
  report.write_end.reset();

  SpawnReport rep;
  ssize_t n;
  do { n = ::read(report.read_end.get(), &rep, sizeof rep); } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof rep)) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    if (rep.stage == static_cast<int>(SpawnStage::Chdir)) {
      return RunToolError{"cannot enter " + dir + ": " + std::strerror(rep.error)};
    }
    return RunToolError{"cannot start toolchain '" + program + "': " + std::strerror(rep.error)};
  }

  std::string raw;
  bool truncated = false;
  bool eof = false;
  bool timed_out = false;
  bool killed = false;
  bool reaped = false;
  int status = 0;
  auto deadline = Clock::now() + opts_.timeout;
  std::optional<Clock::time_point> kill_at;
  char buf[4096];
  auto append = [&](const char* p, size_t len) {
    size_t room = opts_.output_capacity > raw.size() ? opts_.output_capacity - raw.size() : 0;
    if (len > room) truncated = true;
    raw.append(p, std::min(len, room));
  };

  while (!reaped) {
    auto now = Clock::now();
    if (!killed && now >= deadline) {
      timed_out = true;
      killed = true;
      ::kill(-pid, SIGKILL);
    }
    if (cancel && cancel->cancelled() && !kill_at && !killed) {
      ::kill(-pid, SIGTERM);
      kill_at = now + opts_.cancel_grace;
    }
    if (kill_at && !killed && now >= *kill_at) {
      killed = true;
      ::kill(-pid, SIGKILL);
    }
    if (!eof) {
      pollfd pfd{out.read_end.get(), POLLIN, 0};
      int pr = ::poll(&pfd, 1, 50);
      if (pr < 0 && errno != EINTR) {
        eof = true;
      } else if (pr > 0) {
        ssize_t r = ::read(out.read_end.get(), buf, sizeof buf);
        if (r > 0) append(buf, static_cast<size_t>(r));
        else if (r == 0) eof = true;
        else if (errno != EINTR && errno != EAGAIN) eof = true;
      }
    } else {
      ::poll(nullptr, 0, 10);
    }
    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      reaped = true;
    } else if (w < 0 && errno != EINTR) {
      spdlog::warn("waitpid for {} failed: {}", ex.id, std::strerror(errno));
      return RunToolError{std::string("lost track of toolchain process: ") + std::strerror(errno)};
    }
  }

  // Drain what the child wrote before exiting; a lingering grandchild must not block us.
  int fl = ::fcntl(out.read_end.get(), F_GETFL);
  if (fl >= 0) ::fcntl(out.read_end.get(), F_SETFL, fl | O_NONBLOCK);
  while (!eof) {
    ssize_t r = ::read(out.read_end.get(), buf, sizeof buf);
    if (r > 0) append(buf, static_cast<size_t>(r));
    else if (r < 0 && errno == EINTR) continue;
    else break;
  }

  if (cancel && cancel->cancelled()) return RunToolError{"run cancelled"};
  if (timed_out) {
    return RunToolError{"toolchain timed out after " + std::to_string(opts_.timeout.count()) + " ms"};
  }
  if (WIFSIGNALED(status)) {
    return RunToolError{"toolchain killed by signal " + std::to_string(WTERMSIG(status))};
  }
  int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (truncated) {
    spdlog::warn("output of {} truncated at {} bytes", ex.id, opts_.output_capacity);
    raw += "\n[output truncated]\n";
  }
  spdlog::debug("run {} exited with {}", ex.id, code);
  return classify(code, raw, opts_.success_marker);
}

RunResult ExerciseRunner::run_steps(const ExerciseDescriptor& ex, const std::vector<RunMode>& steps,
                                    const RunCancel* cancel) const {
  if (steps.empty()) return run(ex, ex.mode, cancel);
  std::vector<std::string> collected;
  for (RunMode m : steps) {
    RunResult r = run(ex, m, cancel);
    if (auto* ok = std::get_if<RunSuccess>(&r)) {
      collected.insert(collected.end(), ok->output.begin(), ok->output.end());
      continue;
    }
    if (auto* bad = std::get_if<RunFailure>(&r)) {
      collected.insert(collected.end(), bad->output.begin(), bad->output.end());
      return RunFailure{std::move(collected)};
    }
    return r;
  }
  return RunSuccess{std::move(collected)};
}

AsyncRunner::AsyncRunner(RunnerOptions opts, EventQueue& events)
    : runner_(std::move(opts)), events_(events) {}

AsyncRunner::~AsyncRunner() {
  cancel();
  reap(true);
}

void AsyncRunner::start(RunRequest req) {
  cancel();
  reap(false);
  Job job;
  job.cancel = std::make_shared<RunCancel>();
  job.finished = std::make_shared<std::atomic<bool>>(false);
  auto cancel_flag = job.cancel;
  auto finished = job.finished;
  const ExerciseRunner* runner = &runner_;
  EventQueue* events = &events_;
  job.thread = std::thread([runner, events, cancel_flag, finished, req = std::move(req)]() {
    RunResult r = runner->run_steps(req.exercise, req.steps, cancel_flag.get());
    if (cancel_flag->cancelled()) {
      spdlog::info("run {} #{} cancelled", req.exercise.id, req.generation);
    } else {
      spdlog::info("run {} #{} finished: {}", req.exercise.id, req.generation, run_result_name(r));
      events->push(RunCompleted{req.exercise.id, req.generation, std::move(r)});
    }
    finished->store(true);
  });
  active_ = std::move(job);
}

void AsyncRunner::cancel() {
  if (!active_) return;
  active_->cancel->cancel();
  retired_.push_back(std::move(*active_));
  active_.reset();
}

bool AsyncRunner::busy() const {
  return active_ && !active_->finished->load();
}

void AsyncRunner::reap(bool wait_all) {
  for (auto it = retired_.begin(); it != retired_.end();) {
    if (wait_all || it->finished->load()) {
      if (it->thread.joinable()) it->thread.join();
      it = retired_.erase(it);
    } else {
      ++it;
    }
  }
}
