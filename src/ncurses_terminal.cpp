#include "ncurses_terminal.hpp"
#include <ncurses.h>

static short pair_for(ColorRole role) { return static_cast<short>(static_cast<int>(role) + 1); }

NcursesTerminal::NcursesTerminal(bool enable_color) {
  if (!enable_color || !has_colors()) return;
  start_color();
  short bg = (use_default_colors() == OK) ? -1 : COLOR_BLACK;
  init_pair(pair_for(ColorRole::Default), -1, bg);
  init_pair(pair_for(ColorRole::Keyword), COLOR_MAGENTA, bg);
  init_pair(pair_for(ColorRole::Type), COLOR_CYAN, bg);
  init_pair(pair_for(ColorRole::Number), COLOR_YELLOW, bg);
  init_pair(pair_for(ColorRole::String), COLOR_GREEN, bg);
  init_pair(pair_for(ColorRole::Comment), COLOR_BLUE, bg);
  init_pair(pair_for(ColorRole::Punctuation), -1, bg);
  init_pair(pair_for(ColorRole::Accent), COLOR_CYAN, bg);
  init_pair(pair_for(ColorRole::Success), COLOR_GREEN, bg);
  init_pair(pair_for(ColorRole::Error), COLOR_RED, bg);
  init_pair(pair_for(ColorRole::Warning), COLOR_YELLOW, bg);
  init_pair(pair_for(ColorRole::Muted), COLOR_WHITE, bg);
  init_pair(pair_for(ColorRole::Badge), COLOR_BLACK, COLOR_CYAN);
  color_ = true;
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), static_cast<int>(text.size()));
}

void NcursesTerminal::draw_styled(int row, int col, const std::string& text, TextStyle style) {
  attr_t attrs = 0;
  if (color_) attrs |= COLOR_PAIR(pair_for(style.role));
  if (style.bold) attrs |= A_BOLD;
  if (style.reverse) attrs |= A_REVERSE;
  if (!color_ && style.role == ColorRole::Badge) attrs |= A_REVERSE;
  attron(attrs);
  mvaddnstr(row, col, text.c_str(), static_cast<int>(text.size()));
  attroff(attrs);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::set_cursor_visible(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}
