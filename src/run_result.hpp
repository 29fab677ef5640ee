#pragma once
/*
 * RunResult
 *
 * Outcome of one toolchain invocation. Superseded by the next run, never mutated.
 */
#include <string>
#include <variant>
#include <vector>

struct RunPending {};
struct RunSuccess { std::vector<std::string> output; };
struct RunFailure { std::vector<std::string> output; };
struct RunToolError { std::string message; };

using RunResult = std::variant<RunPending, RunSuccess, RunFailure, RunToolError>;

inline const char* run_result_name(const RunResult& r) {
  switch (r.index()) {
    case 0: return "pending";
    case 1: return "success";
    case 2: return "failure";
    case 3: return "tool-error";
  }
  return "";
}
