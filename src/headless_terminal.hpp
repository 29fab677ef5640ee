#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal used by tests to check rendered frames.
 * Model: rows × cols grid, one grapheme plus its style per cell; text past
 * the right edge is dropped like a real terminal would.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_styled(int row, int col, const std::string& text, TextStyle style) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void set_cursor_visible(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;

  void resize(int rows, int cols);
  // Row contents with trailing blanks removed.
  std::string row_text(int row) const;
  std::string screen_text() const;
  bool contains(const std::string& needle) const;
  int find_row(const std::string& needle) const;
  TextStyle style_at(int row, int col) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  int refreshes() const { return refreshes_; }

private:
  struct Cell {
    std::string text = " ";
    TextStyle style;
  };
  Cell* cell(int row, int col);

  int rows_;
  int cols_;
  std::vector<Cell> cells_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  bool cursor_visible_ = true;
  int refreshes_ = 0;
};
