#include "pane_layout.hpp"

int clamp_split(int total, float ratio) {
  if (total <= 1) return total;
  int primary = static_cast<int>(total * ratio);
  primary = std::clamp(primary, 1, total - 1);
  return primary;
}

FrameLayout compute_layout(int rows, int cols, bool show_solution, int output_rows) {
  FrameLayout f;
  rows = std::max(0, rows);
  cols = std::max(0, cols);
  int left = rows;
  auto take = [&](int want) { int got = std::clamp(want, 0, left); left -= got; return got; };

  int status_h = take(1);
  int progress_h = take(1);
  int header_h = take(1);
  // Keep at least a few editor rows before giving the output pane its full height.
  int out_h = take(std::min(std::max(0, output_rows), std::max(0, left - 3)));
  int main_h = left;

  f.header = Rect{0, 0, header_h, cols};
  int main_row = header_h;
  int out_row = main_row + main_h;
  f.output = Rect{out_row, 0, out_h, cols};
  f.progress = Rect{out_row + out_h, 0, progress_h, cols};
  f.status = Rect{out_row + out_h + progress_h, 0, status_h, cols};

  if (show_solution && cols >= 2) {
    int editor_w = clamp_split(cols, 0.5f);
    f.editor = Rect{main_row, 0, main_h, editor_w};
    f.solution = Rect{main_row, editor_w, main_h, cols - editor_w};
  } else {
    f.editor = Rect{main_row, 0, main_h, cols};
    f.solution = Rect{main_row, cols, 0, 0};
  }
  return f;
}

Rect centered_rect(int rows, int cols, float width_share, float height_share) {
  rows = std::max(0, rows);
  cols = std::max(0, cols);
  int w = std::clamp(static_cast<int>(cols * width_share), 0, cols);
  int h = std::clamp(static_cast<int>(rows * height_share), 0, rows);
  return Rect{(rows - h) / 2, (cols - w) / 2, h, w};
}
