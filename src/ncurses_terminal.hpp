#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing.
 * Note: initialization/teardown is managed by Terminal RAII wrapper; one
 * color pair per ColorRole is set up when color is enabled.
 */
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(bool enable_color);
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_styled(int row, int col, const std::string& text, TextStyle style) override;
  void move_cursor(int row, int col) override;
  void set_cursor_visible(bool visible) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
private:
  bool color_ = false;
};
