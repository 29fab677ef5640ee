#pragma once
/*
 * PaneLayout
 *
 * Purpose: split the screen into the frame's fixed regions.
 * Top to bottom: header (1 row), main area, output pane, progress bar (1),
 * status line (1). The main area holds the editor and, when the solution is
 * shown, the solution pane on its right half.
 * Degenerate sizes shrink regions down to empty; rects are never negative.
 */
#include <algorithm>

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
  bool empty() const { return height <= 0 || width <= 0; }
  int bottom() const { return row + height; }
  int right() const { return col + width; }
};

struct FrameLayout {
  Rect header;
  Rect editor;
  Rect solution;
  Rect output;
  Rect progress;
  Rect status;
};

#define TUTOR_OUTPUT_PANE_ROWS 8

int clamp_split(int total, float ratio);
FrameLayout compute_layout(int rows, int cols, bool show_solution, int output_rows = TUTOR_OUTPUT_PANE_ROWS);

// Centred box of the given share of the screen, for overlays.
Rect centered_rect(int rows, int cols, float width_share, float height_share);
