#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main; destructor restores terminal.
 * Note: manages terminal modes (raw/noecho/keypad, read timeout), not rendering.
 */

class Terminal {
public:
  explicit Terminal(int read_timeout_ms);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
