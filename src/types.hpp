#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Cursor/Viewport/RunMode).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <compare>

enum class Mode { Normal, Insert, Command };

enum class Direction { Left, Right, Up, Down };
enum class Unit { Char, Word, Line, Buffer };

enum class RunMode { Check, Test, Lint };

struct Cursor {
  int row = 0;
  int col = 0;
  bool operator==(const Cursor&) const = default;
  auto operator<=>(const Cursor&) const = default;
};

struct Viewport { int top_line = 0; int left_col = 0; };

// half-open [begin, end) in (row, grapheme column) units
struct TextRange {
  Cursor begin;
  Cursor end;
};

struct Selection {
  Cursor anchor;
  Cursor head;
};

inline const char* mode_name(Mode m) {
  switch (m) {
    case Mode::Normal: return "NORMAL";
    case Mode::Insert: return "INSERT";
    case Mode::Command: return "COMMAND";
  }
  return "";
}

inline const char* run_mode_name(RunMode m) {
  switch (m) {
    case RunMode::Check: return "check";
    case RunMode::Test: return "test";
    case RunMode::Lint: return "lint";
  }
  return "";
}
