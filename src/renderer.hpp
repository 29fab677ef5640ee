#pragma once
/*
 * Renderer
 *
 * Purpose: draw one frame (header, editor, solution, output, progress bar,
 * status line, help overlay) from a read-only snapshot.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; the only time input is `elapsed`, so a given
 * snapshot and elapsed time always produce the same frame.
 */
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "exercise.hpp"
#include "iterminal.hpp"
#include "pane_layout.hpp"
#include "session_state.hpp"

struct FrameInput {
  const SessionState& state;
  const ExerciseDescriptor& exercise;
  int exercise_count = 0;
  int done_count = 0;
  bool exercise_done = false;
  std::chrono::milliseconds elapsed{0};
};

// Regions for the current view. The expanded output view takes the main
// area and leaves the editor its minimum height.
FrameLayout frame_layout(int rows, int cols, const SessionState& s);
// Rows under a pane's title row.
int pane_body_rows(const Rect& pane);

// Text area of the editor pane: below its title row, right of the line-number gutter.
Rect editor_text_area(const Rect& editor, int line_count);
int gutter_width(int line_count);

// Scrolls vp the minimum needed to keep cur inside a rows × cols window.
Viewport follow_cursor(Viewport vp, Cursor cur, int rows, int cols);

// Animation frames derived from elapsed wall-clock time only.
const char* spinner_frame(std::chrono::milliseconds elapsed);
int pulse_position(std::chrono::milliseconds elapsed, int width);

std::string progress_bar_text(int done, int total, int width, std::chrono::milliseconds elapsed);

// Cuts s to at most max_cells terminal cells, skipping the first skip graphemes.
std::string clip_to_cells(std::string_view s, int skip, int max_cells);
int text_cells(std::string_view s);

class Renderer {
public:
  void render(ITerminal& term, const FrameInput& in);

private:
  void draw_header(ITerminal& term, const Rect& r, const FrameInput& in);
  void draw_editor(ITerminal& term, const Rect& r, const FrameInput& in);
  void draw_solution(ITerminal& term, const Rect& r, const FrameInput& in);
  void draw_output(ITerminal& term, const Rect& r, const FrameInput& in);
  void draw_progress(ITerminal& term, const Rect& r, const FrameInput& in);
  void draw_status(ITerminal& term, const Rect& r, const FrameInput& in);
  void draw_help(ITerminal& term, int rows, int cols);
  void draw_title(ITerminal& term, const Rect& r, const std::string& title, bool active);
  void draw_code_line(ITerminal& term, int row, int col, int width, std::string_view line,
                      const std::vector<HighlightSpan>& spans, int skip,
                      const std::optional<TextRange>& sel, int line_index);
};
