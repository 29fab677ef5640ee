#pragma once
/*
 * Command
 *
 * Purpose: parse `:`-line input into a closed set of session actions.
 * Contract: parse_command is total; anything unrecognised becomes Unknown
 * carrying the original text.
 */
#include <optional>
#include <string>
#include <string_view>
#include "types.hpp"

struct Command {
  enum class Kind {
    Save,
    Quit,
    SaveAndQuit,
    Check,
    CheckAll,
    ShowHint,
    ToggleSolution,
    Next,
    Previous,
    ToggleAutoAdvance,
    ToggleWatch,
    Reload,
    Reset,
    Help,
    ToggleOutput,
    Unknown
  };
  Kind kind = Kind::Unknown;
  bool force = false;            // Quit
  std::optional<RunMode> mode;   // Check; empty = exercise default
  std::string text;              // input as typed, trimmed

  static Command of(Kind k) { Command c; c.kind = k; return c; }
};

Command parse_command(std::string_view input);
const char* command_name(Command::Kind k);
