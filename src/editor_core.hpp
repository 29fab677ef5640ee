#pragma once
/*
 * EditorCore
 *
 * Purpose: modal editing state for one buffer: text, cursor, selection,
 * mode and command line. Knows nothing about exercises or the terminal.
 * Contract: every operation is total; motions clamp. Normal mode keeps the
 * cursor column in [0, len) (0 on an empty line), Insert mode allows len.
 * Columns are grapheme clusters, never bytes.
 * Dirty flag: set by any text mutation, cleared only by mark_saved()/load().
 * Register: one unnamed register filled by yy, dd, x and the word text
 * objects, read by put (P). Linewise content holds whole lines joined by \n.
 */
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "types.hpp"
#include "text_buffer.hpp"
#include "highlighter.hpp"
#include "command.hpp"
#include "input.hpp"

struct Register {
  std::string text;
  bool linewise = false;
};

class EditorCore {
public:
  EditorCore();

  void load(std::string_view text);
  std::string serialize() const;
  const TextBuffer& buffer() const { return buf_; }
  bool dirty() const { return dirty_; }
  void mark_saved() { dirty_ = false; }

  Mode mode() const { return mode_; }
  bool set_mode(Mode m);
  const std::string& cmdline() const { return cmdline_; }

  Cursor cursor() const { return cur_; }
  void set_cursor(int row, int col);
  void move_cursor(Direction dir, Unit unit, int count = 1);

  const std::optional<Selection>& selection() const { return sel_; }
  void set_selection(Cursor anchor, Cursor head);
  void clear_selection() { sel_.reset(); }
  void extend_selection(Direction dir, Unit unit);
  std::optional<TextRange> selection_range() const;

  void insert_char(std::string_view text);
  void insert_newline();
  void backspace();
  void delete_char();
  bool delete_range(TextRange r);
  bool delete_selection();
  void delete_line(int count = 1);
  void open_line_below();
  void open_line_above();

  std::string range_text(TextRange r) const;
  const Register& yank_register() const { return reg_; }
  void yank_lines(int count = 1);
  void put(int count = 1);
  bool replace_char(std::string_view text, int count = 1);
  bool delete_word_object(bool around);

  Command apply_command(const Command& cmd);
  std::optional<Command> handle_key(int ch);
  // An operator (d, c, y, r) waits for its next key.
  bool operator_pending() const { return !input_.operatorKeys().empty(); }
  void cancel_pending() { input_.reset(); }

  void set_language(const LanguageSpec& lang);
  const LanguageSpec& language() const { return *lang_; }
  std::vector<HighlightSpan> highlight_line(int row) const;

  void set_tab_width(int w) { if (w > 0) tab_width_ = w; }
  int tab_width() const { return tab_width_; }

  int line_length(int row) const;

private:
  std::optional<Command> handle_normal_key(int ch);
  void handle_operator_key(int ch);
  void handle_insert_key(int ch);
  std::optional<Command> handle_command_key(int ch);

  int max_col(int row) const;
  void clamp_cursor();
  Cursor clamp_position(Cursor c) const;
  Cursor next_word_start(Cursor c) const;
  Cursor prev_word_start(Cursor c) const;
  std::vector<int> word_classes(int row) const;
  std::string indent_of(int row) const;
  void touch(int row);

  TextBuffer buf_;
  Cursor cur_;
  int preferred_col_ = 0;
  Mode mode_ = Mode::Normal;
  std::string cmdline_;
  std::optional<Selection> sel_;
  bool dirty_ = false;
  Input input_;
  Register reg_;
  int tab_width_ = 4;
  const LanguageSpec* lang_;
  mutable HighlightCache hl_;
};
