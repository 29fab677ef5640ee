#include "command.hpp"
#include "cmd_registry.hpp"
#include <cctype>

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

static const CommandRegistry<Command>& command_table() {
  static const CommandRegistry<Command> table = [] {
    using K = Command::Kind;
    CommandRegistry<Command> t;
    t.register_command("w", Command::of(K::Save));
    t.register_command("q", Command::of(K::Quit));
    Command force_quit = Command::of(K::Quit);
    force_quit.force = true;
    t.register_command("q!", force_quit);
    t.register_command("wq", Command::of(K::SaveAndQuit));
    t.register_alias("x", "wq");
    t.register_command("check", Command::of(K::Check));
    t.register_alias("c", "check");
    Command test = Command::of(K::Check);
    test.mode = RunMode::Test;
    t.register_command("test", test);
    Command lint = Command::of(K::Check);
    lint.mode = RunMode::Lint;
    t.register_command("lint", lint);
    t.register_command("checkall", Command::of(K::CheckAll));
    t.register_command("hint", Command::of(K::ShowHint));
    t.register_alias("h", "hint");
    t.register_command("solution", Command::of(K::ToggleSolution));
    t.register_alias("sol", "solution");
    t.register_alias("s", "solution");
    t.register_command("next", Command::of(K::Next));
    t.register_alias("n", "next");
    t.register_command("prev", Command::of(K::Previous));
    t.register_alias("p", "prev");
    t.register_command("auto", Command::of(K::ToggleAutoAdvance));
    t.register_command("watch", Command::of(K::ToggleWatch));
    t.register_command("reload", Command::of(K::Reload));
    t.register_alias("r", "reload");
    t.register_command("reset", Command::of(K::Reset));
    t.register_command("help", Command::of(K::Help));
    t.register_command("output", Command::of(K::ToggleOutput));
    return t;
  }();
  return table;
}

Command parse_command(std::string_view input) {
  std::string_view s = trim(input);
  if (!s.empty() && s.front() == ':') s = trim(s.substr(1));
  Command cmd;
  if (const Command* proto = command_table().find(std::string(s))) cmd = *proto;
  cmd.text = std::string(s);
  return cmd;
}

const char* command_name(Command::Kind k) {
  switch (k) {
    case Command::Kind::Save: return "save";
    case Command::Kind::Quit: return "quit";
    case Command::Kind::SaveAndQuit: return "save-and-quit";
    case Command::Kind::Check: return "check";
    case Command::Kind::CheckAll: return "checkall";
    case Command::Kind::ShowHint: return "hint";
    case Command::Kind::ToggleSolution: return "solution";
    case Command::Kind::Next: return "next";
    case Command::Kind::Previous: return "prev";
    case Command::Kind::ToggleAutoAdvance: return "auto";
    case Command::Kind::ToggleWatch: return "watch";
    case Command::Kind::Reload: return "reload";
    case Command::Kind::Reset: return "reset";
    case Command::Kind::Help: return "help";
    case Command::Kind::ToggleOutput: return "output";
    case Command::Kind::Unknown: return "unknown";
  }
  return "unknown";
}
