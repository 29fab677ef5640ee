#include "headless_terminal.hpp"
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(0), cols_(0) { resize(rows, cols); }

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows < 0 ? 0 : rows;
  cols_ = cols < 0 ? 0 : cols;
  cells_.assign(static_cast<size_t>(rows_) * static_cast<size_t>(cols_), Cell{});
}

HeadlessTerminal::Cell* HeadlessTerminal::cell(int row, int col) {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return nullptr;
  return &cells_[static_cast<size_t>(row) * static_cast<size_t>(cols_) + static_cast<size_t>(col)];
}

void HeadlessTerminal::clear() {
  for (auto& c : cells_) c = Cell{};
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  draw_styled(row, col, text, TextStyle{});
}

void HeadlessTerminal::draw_styled(int row, int col, const std::string& text, TextStyle style) {
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = next_grapheme_end(text, pos);
    std::string g = text.substr(pos, end - pos);
    int w = display_width(g);
    if (Cell* c = cell(row, col)) {
      c->text = g;
      c->style = style;
    }
    for (int k = 1; k < w; ++k) {
      if (Cell* c = cell(row, col + k)) { c->text.clear(); c->style = style; }
    }
    col += w;
    pos = end;
  }
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  for (int c = col; c < cols_; ++c) {
    if (Cell* p = cell(row, c)) *p = Cell{};
  }
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::string s;
  for (int c = 0; c < cols_; ++c) {
    s += cells_[static_cast<size_t>(row) * static_cast<size_t>(cols_) + static_cast<size_t>(c)].text;
  }
  size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

std::string HeadlessTerminal::screen_text() const {
  std::string out;
  for (int r = 0; r < rows_; ++r) { out += row_text(r); out += '\n'; }
  return out;
}

bool HeadlessTerminal::contains(const std::string& needle) const {
  return find_row(needle) >= 0;
}

int HeadlessTerminal::find_row(const std::string& needle) const {
  for (int r = 0; r < rows_; ++r) {
    if (row_text(r).find(needle) != std::string::npos) return r;
  }
  return -1;
}

TextStyle HeadlessTerminal::style_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return TextStyle{};
  return cells_[static_cast<size_t>(row) * static_cast<size_t>(cols_) + static_cast<size_t>(col)].style;
}
