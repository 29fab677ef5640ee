#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Text is UTF-8; backends place one grapheme per cell.
 */
#include <string>

struct TermSize { int rows; int cols; };

enum class ColorRole {
  Default,
  Keyword,
  Type,
  Number,
  String,
  Comment,
  Punctuation,
  Accent,
  Success,
  Error,
  Warning,
  Muted,
  Badge,
};

struct TextStyle {
  ColorRole role = ColorRole::Default;
  bool bold = false;
  bool reverse = false;
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_styled(int row, int col, const std::string& text, TextStyle style) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void set_cursor_visible(bool visible) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
};
