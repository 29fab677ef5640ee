#include "terminal.hpp"
#include <ncurses.h>
#include <locale.h>

Terminal::Terminal(int read_timeout_ms) {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  timeout(read_timeout_ms);
}

Terminal::~Terminal() {
  endwin();
}
