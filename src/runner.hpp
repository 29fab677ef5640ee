#pragma once
/*
 * ExerciseRunner
 *
 * Purpose: run `<toolchain> <check|test|lint> <path>` out of process and
 * classify the outcome into a RunResult.
 * Process: fork/exec in the exercise work dir, stdin from /dev/null,
 * stdout+stderr on one pipe, exec errors reported through a CLOEXEC pipe.
 * Limits: bounded wall-clock timeout and bounded captured output.
 *
 * AsyncRunner moves runs onto a worker thread, owns at most one in-flight
 * run and posts RunCompleted to the event queue. A cancelled run posts
 * nothing.
 */
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "config.hpp"
#include "events.hpp"
#include "exercise.hpp"
#include "run_result.hpp"
#include "types.hpp"

struct RunnerOptions {
  std::string toolchain = TUTOR_DEFAULT_TOOLCHAIN;
  std::chrono::milliseconds timeout{TUTOR_DEFAULT_TIMEOUT_MS};
  std::chrono::milliseconds cancel_grace{TUTOR_CANCEL_GRACE_MS};
  std::string success_marker = TUTOR_DEFAULT_SUCCESS_MARKER;
  size_t output_capacity = TUTOR_OUTPUT_CAPACITY;
};

class RunCancel {
public:
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }
private:
  std::atomic<bool> cancelled_{false};
};

std::string strip_ansi(const std::string& s);
std::vector<std::string> output_lines(const std::string& raw);

class ExerciseRunner {
public:
  explicit ExerciseRunner(RunnerOptions opts = RunnerOptions());

  RunResult run(const ExerciseDescriptor& ex, RunMode mode, const RunCancel* cancel = nullptr) const;
  // Runs each step in order, stops at the first non-success; output accumulates.
  RunResult run_steps(const ExerciseDescriptor& ex, const std::vector<RunMode>& steps,
                      const RunCancel* cancel = nullptr) const;

  static RunResult classify(int exit_code, const std::string& output, const std::string& marker);

  const RunnerOptions& options() const { return opts_; }

private:
  RunnerOptions opts_;
};

struct RunRequest {
  ExerciseDescriptor exercise;
  std::vector<RunMode> steps;
  std::uint64_t generation = 0;
};

class IRunService {
public:
  virtual ~IRunService() = default;
  virtual void start(RunRequest req) = 0;
  virtual void cancel() = 0;
};

class AsyncRunner : public IRunService {
public:
  AsyncRunner(RunnerOptions opts, EventQueue& events);
  ~AsyncRunner() override;
  AsyncRunner(const AsyncRunner&) = delete;
  AsyncRunner& operator=(const AsyncRunner&) = delete;

  void start(RunRequest req) override;
  void cancel() override;
  bool busy() const;

private:
  struct Job {
    std::shared_ptr<RunCancel> cancel;
    std::shared_ptr<std::atomic<bool>> finished;
    std::thread thread;
  };
  void reap(bool wait_all);

  ExerciseRunner runner_;
  EventQueue& events_;
  std::optional<Job> active_;
  std::vector<Job> retired_;
};
