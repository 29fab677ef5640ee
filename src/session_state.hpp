#pragma once
/*
 * SessionState
 *
 * Everything a frame shows. Written only by SessionController; the renderer
 * and tests read it through SessionController::state().
 */
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "editor_core.hpp"
#include "run_result.hpp"
#include "types.hpp"

enum class OutputStyle { Info, Hint, Success, Failure, Error };

struct SessionState {
  size_t current = 0;
  EditorCore editor;
  Viewport viewport;
  std::optional<RunResult> last_run;
  std::uint64_t generation = 0;
  // index of the exercise being re-checked while checking every exercise
  std::optional<size_t> verifying;
  std::vector<std::string> output;
  OutputStyle output_style = OutputStyle::Info;
  int output_scroll = 0;
  bool output_expanded = false;
  bool show_solution = false;
  std::vector<std::string> solution_lines;
  int solution_scroll = 0;
  bool watch_enabled = true;
  bool auto_advance = true;
  bool help_visible = false;
  std::string status;
  bool status_error = false;
  bool quit = false;

  bool running() const {
    return last_run && std::holds_alternative<RunPending>(*last_run);
  }
};
