#include "editor_core.hpp"
#include "utf8.hpp"
#include "file_reader.hpp"
#include <ncurses.h>
#include <algorithm>
#include <cctype>

static constexpr int kEsc = 27;
static constexpr int kCtrlO = 15;

static bool is_backspace_key(int ch) { return ch == KEY_BACKSPACE || ch == 127 || ch == 8; }
static bool is_enter_key(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
static bool is_text_byte(int ch) { return ch >= 0x20 && ch <= 0xFF && ch != 0x7F; }

EditorCore::EditorCore() : lang_(&language_for_extension("")) {}

void EditorCore::load(std::string_view text) {
  buf_.set_text(text);
  cur_ = Cursor{};
  preferred_col_ = 0;
  sel_.reset();
  dirty_ = false;
  hl_.clear();
  mode_ = Mode::Normal;
  cmdline_.clear();
  input_.reset();
}

std::string EditorCore::serialize() const { return buf_.text(); }

int EditorCore::line_length(int row) const { return grapheme_count(buf_.line(row)); }

int EditorCore::max_col(int row) const {
  int len = line_length(row);
  if (mode_ == Mode::Insert) return len;
  return std::max(0, len - 1);
}

Cursor EditorCore::clamp_position(Cursor c) const {
  c.row = std::clamp(c.row, 0, buf_.line_count() - 1);
  c.col = std::clamp(c.col, 0, line_length(c.row));
  return c;
}

void EditorCore::clamp_cursor() {
  cur_.row = std::clamp(cur_.row, 0, buf_.line_count() - 1);
  cur_.col = std::clamp(cur_.col, 0, max_col(cur_.row));
}

void EditorCore::touch(int row) {
  dirty_ = true;
  hl_.invalidate_from(row);
}

bool EditorCore::set_mode(Mode m) {
  switch (m) {
    case Mode::Insert:
      if (mode_ != Mode::Normal) return false;
      mode_ = Mode::Insert;
      input_.reset();
      return true;
    case Mode::Command:
      if (mode_ != Mode::Normal) return false;
      mode_ = Mode::Command;
      cmdline_.clear();
      input_.reset();
      return true;
    case Mode::Normal:
      if (mode_ == Mode::Command) cmdline_.clear();
      mode_ = Mode::Normal;
      clamp_cursor();
      return true;
  }
  return false;
}

void EditorCore::set_cursor(int row, int col) {
  cur_.row = row;
  cur_.col = col;
  clamp_cursor();
  preferred_col_ = cur_.col;
}

std::vector<int> EditorCore::word_classes(int row) const {
  std::vector<int> cls;
  std::string_view s = buf_.line(row);
  size_t pos = 0;
  while (pos < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    int k = 2;
    if (c == ' ' || c == '\t') k = 0;
    else if (std::isalnum(c) || c == '_' || c >= 0x80) k = 1;
    cls.push_back(k);
    pos = next_grapheme_end(s, pos);
  }
  return cls;
}

Cursor EditorCore::next_word_start(Cursor c) const {
  int row = c.row;
  std::vector<int> cls = word_classes(row);
  int n = static_cast<int>(cls.size());
  int i = std::min(c.col, n);
  if (i < n && cls[i] != 0) {
    int k = cls[i];
    while (i < n && cls[i] == k) i++;
  }
  while (true) {
    while (i < n && cls[i] == 0) i++;
    if (i < n) return Cursor{row, i};
    if (row + 1 >= buf_.line_count()) return Cursor{row, n};
    row++;
    cls = word_classes(row);
    n = static_cast<int>(cls.size());
    i = 0;
    if (n == 0) return Cursor{row, 0};
  }
}

Cursor EditorCore::prev_word_start(Cursor c) const {
  int row = c.row;
  std::vector<int> cls = word_classes(row);
  int i = std::min(c.col, static_cast<int>(cls.size())) - 1;
  while (true) {
    while (i >= 0 && cls[i] == 0) i--;
    if (i >= 0) break;
    if (row == 0) return Cursor{0, 0};
    row--;
    cls = word_classes(row);
    if (cls.empty()) return Cursor{row, 0};
    i = static_cast<int>(cls.size()) - 1;
  }
  int k = cls[i];
  while (i > 0 && cls[i - 1] == k) i--;
  return Cursor{row, i};
}

void EditorCore::move_cursor(Direction dir, Unit unit, int count) {
  count = std::max(1, count);
  int last = buf_.line_count() - 1;
  clamp_cursor();
  bool vertical = false;
  switch (unit) {
    case Unit::Char:
    case Unit::Line:
      if (dir == Direction::Up) { cur_.row = std::max(0, cur_.row - count); vertical = true; }
      else if (dir == Direction::Down) { cur_.row = std::min(last, cur_.row + count); vertical = true; }
      else if (unit == Unit::Line) cur_.col = dir == Direction::Left ? 0 : max_col(cur_.row);
      else if (dir == Direction::Left) cur_.col -= count;
      else cur_.col += count;
      break;
    case Unit::Word:
      if (dir == Direction::Up || dir == Direction::Down) {
        move_cursor(dir, Unit::Char, count);
        return;
      }
      for (int i = 0; i < count; ++i) {
        cur_ = dir == Direction::Right ? next_word_start(cur_) : prev_word_start(cur_);
      }
      break;
    case Unit::Buffer:
      if (dir == Direction::Up || dir == Direction::Left) cur_ = Cursor{0, 0};
      else if (dir == Direction::Down) cur_ = Cursor{last, 0};
      else cur_ = Cursor{last, max_col(last)};
      break;
  }
  if (vertical) {
    cur_.col = preferred_col_;
    clamp_cursor();
  } else {
    clamp_cursor();
    preferred_col_ = cur_.col;
  }
}

void EditorCore::set_selection(Cursor anchor, Cursor head) {
  sel_ = Selection{clamp_position(anchor), clamp_position(head)};
}

void EditorCore::extend_selection(Direction dir, Unit unit) {
  Cursor anchor = sel_ ? sel_->anchor : cur_;
  // Allow the head to reach line end so the last grapheme can be selected.
  Mode saved = mode_;
  mode_ = Mode::Insert;
  move_cursor(dir, unit);
  mode_ = saved;
  sel_ = Selection{anchor, cur_};
  if (mode_ == Mode::Normal && cur_.col > max_col(cur_.row)) {
    cur_.col = max_col(cur_.row);
  }
}

std::optional<TextRange> EditorCore::selection_range() const {
  if (!sel_) return std::nullopt;
  Cursor a = sel_->anchor, b = sel_->head;
  if (b < a) std::swap(a, b);
  if (a == b) return std::nullopt;
  return TextRange{a, b};
}

void EditorCore::insert_char(std::string_view text) {
  sel_.reset();
  size_t nl = text.find('\n');
  if (nl != std::string_view::npos) {
    insert_char(text.substr(0, nl));
    insert_newline();
    insert_char(text.substr(nl + 1));
    return;
  }
  if (text.empty()) return;
  cur_ = clamp_position(cur_);
  std::string s = buf_.line(cur_.row);
  size_t at = grapheme_byte_offset(s, cur_.col);
  s.insert(at, text);
  buf_.replace_line(cur_.row, s);
  cur_.col = grapheme_count(std::string_view(s).substr(0, at + text.size()));
  touch(cur_.row);
  if (mode_ != Mode::Insert) clamp_cursor();
  preferred_col_ = cur_.col;
}

std::string EditorCore::indent_of(int row) const {
  const std::string& s = buf_.line(row);
  size_t n = 0;
  while (n < s.size() && (s[n] == ' ' || s[n] == '\t')) n++;
  return s.substr(0, n);
}

void EditorCore::insert_newline() {
  sel_.reset();
  cur_ = clamp_position(cur_);
  std::string s = buf_.line(cur_.row);
  size_t at = grapheme_byte_offset(s, cur_.col);
  std::string indent = indent_of(cur_.row);
  if (indent.size() > at) indent.resize(at);
  std::string rest = s.substr(at);
  s.erase(at);
  buf_.replace_line(cur_.row, s);
  buf_.insert_line(cur_.row + 1, indent + rest);
  touch(cur_.row);
  cur_ = Cursor{cur_.row + 1, grapheme_count(indent)};
  if (mode_ != Mode::Insert) clamp_cursor();
  preferred_col_ = cur_.col;
}

bool EditorCore::delete_range(TextRange r) {
  Cursor a = clamp_position(r.begin);
  Cursor b = clamp_position(r.end);
  if (b < a) std::swap(a, b);
  if (a == b) return false;
  const std::string& first = buf_.line(a.row);
  const std::string& last = buf_.line(b.row);
  std::string joined = first.substr(0, grapheme_byte_offset(first, a.col)) +
                       last.substr(grapheme_byte_offset(last, b.col));
  if (b.row > a.row) buf_.erase_lines(a.row + 1, b.row + 1);
  buf_.replace_line(a.row, joined);
  sel_.reset();
  touch(a.row);
  cur_ = a;
  clamp_cursor();
  preferred_col_ = cur_.col;
  return true;
}

bool EditorCore::delete_selection() {
  auto r = selection_range();
  sel_.reset();
  if (!r) return false;
  return delete_range(*r);
}

void EditorCore::backspace() {
  if (delete_selection()) return;
  cur_ = clamp_position(cur_);
  if (cur_.col > 0) {
    delete_range(TextRange{{cur_.row, cur_.col - 1}, cur_});
  } else if (cur_.row > 0) {
    int prev = cur_.row - 1;
    delete_range(TextRange{{prev, line_length(prev)}, {cur_.row, 0}});
  }
}

void EditorCore::delete_char() {
  if (delete_selection()) return;
  cur_ = clamp_position(cur_);
  int len = line_length(cur_.row);
  if (cur_.col < len) {
    delete_range(TextRange{cur_, {cur_.row, cur_.col + 1}});
  } else if (mode_ == Mode::Insert && cur_.row + 1 < buf_.line_count()) {
    delete_range(TextRange{cur_, {cur_.row + 1, 0}});
  }
}

void EditorCore::delete_line(int count) {
  count = std::max(1, count);
  sel_.reset();
  int row = std::clamp(cur_.row, 0, buf_.line_count() - 1);
  if (buf_.line_count() == 1 && buf_.line(0).empty()) return;
  yank_lines(count);
  buf_.erase_lines(row, row + count);
  touch(row);
  cur_ = Cursor{std::min(row, buf_.line_count() - 1), 0};
  clamp_cursor();
  preferred_col_ = cur_.col;
}

void EditorCore::open_line_below() {
  sel_.reset();
  int row = std::clamp(cur_.row, 0, buf_.line_count() - 1);
  std::string indent = indent_of(row);
  buf_.insert_line(row + 1, indent);
  touch(row + 1);
  set_mode(Mode::Insert);
  cur_ = Cursor{row + 1, grapheme_count(indent)};
  preferred_col_ = cur_.col;
}

void EditorCore::open_line_above() {
  sel_.reset();
  int row = std::clamp(cur_.row, 0, buf_.line_count() - 1);
  std::string indent = indent_of(row);
  buf_.insert_line(row, indent);
  touch(row);
  set_mode(Mode::Insert);
  cur_ = Cursor{row, grapheme_count(indent)};
  preferred_col_ = cur_.col;
}

std::string EditorCore::range_text(TextRange r) const {
  Cursor a = clamp_position(r.begin);
  Cursor b = clamp_position(r.end);
  if (b < a) std::swap(a, b);
  std::string out;
  for (int row = a.row; row <= b.row; ++row) {
    const std::string& s = buf_.line(row);
    size_t from = row == a.row ? grapheme_byte_offset(s, a.col) : 0;
    size_t to = row == b.row ? grapheme_byte_offset(s, b.col) : s.size();
    if (to > from) out.append(s, from, to - from);
    if (row != b.row) out.push_back('\n');
  }
  return out;
}

void EditorCore::yank_lines(int count) {
  int row = std::clamp(cur_.row, 0, buf_.line_count() - 1);
  int end = std::min(buf_.line_count(), row + std::max(1, count));
  reg_.text.clear();
  for (int r = row; r < end; ++r) {
    if (r > row) reg_.text.push_back('\n');
    reg_.text += buf_.line(r);
  }
  reg_.linewise = true;
}

// Linewise content goes below the cursor line; characters go in at the cursor
// and leave it on the last one put.
void EditorCore::put(int count) {
  if (reg_.text.empty() && !reg_.linewise) return;
  sel_.reset();
  count = std::max(1, count);
  int row = std::clamp(cur_.row, 0, buf_.line_count() - 1);
  if (reg_.linewise) {
    std::vector<std::string> lines = split_lines(reg_.text);
    std::vector<std::string> block;
    for (int i = 0; i < count; ++i) block.insert(block.end(), lines.begin(), lines.end());
    buf_.insert_lines(row + 1, block);
    touch(row + 1);
    cur_ = Cursor{row + 1, 0};
    clamp_cursor();
    preferred_col_ = cur_.col;
    return;
  }
  std::string text;
  for (int i = 0; i < count; ++i) text += reg_.text;
  std::vector<std::string> pieces = split_lines(text);
  std::string s = buf_.line(row);
  size_t at = grapheme_byte_offset(s, std::clamp(cur_.col, 0, line_length(row)));
  std::string head = s.substr(0, at);
  std::string tail = s.substr(at);
  int last_row = row + static_cast<int>(pieces.size()) - 1;
  std::string before_end = (pieces.size() == 1 ? head : std::string()) + pieces.back();
  if (pieces.size() == 1) {
    buf_.replace_line(row, head + pieces[0] + tail);
  } else {
    buf_.replace_line(row, head + pieces[0]);
    std::vector<std::string> rest(pieces.begin() + 1, pieces.end());
    rest.back() += tail;
    buf_.insert_lines(row + 1, rest);
  }
  touch(row);
  cur_ = Cursor{last_row, std::max(0, grapheme_count(before_end) - 1)};
  clamp_cursor();
  preferred_col_ = cur_.col;
}

bool EditorCore::replace_char(std::string_view text, int count) {
  count = std::max(1, count);
  if (text.empty()) return false;
  cur_ = clamp_position(cur_);
  if (cur_.col + count > line_length(cur_.row)) return false;
  std::string s = buf_.line(cur_.row);
  size_t from = grapheme_byte_offset(s, cur_.col);
  size_t to = grapheme_byte_offset(s, cur_.col + count);
  std::string with;
  for (int i = 0; i < count; ++i) with += text;
  s.replace(from, to - from, with);
  buf_.replace_line(cur_.row, s);
  touch(cur_.row);
  cur_.col += count - 1;
  clamp_cursor();
  preferred_col_ = cur_.col;
  return true;
}

// iw: the run of same-class graphemes under the cursor. aw adds the trailing
// blanks, or the leading ones when nothing trails.
bool EditorCore::delete_word_object(bool around) {
  cur_ = clamp_position(cur_);
  int row = cur_.row;
  std::vector<int> cls = word_classes(row);
  int n = static_cast<int>(cls.size());
  if (n == 0 || cur_.col >= n) return false;
  int start = cur_.col;
  int end = cur_.col + 1;
  int k = cls[start];
  while (start > 0 && cls[start - 1] == k) start--;
  while (end < n && cls[end] == k) end++;
  if (around) {
    int word_end = end;
    while (end < n && cls[end] == 0) end++;
    if (end == word_end) {
      while (start > 0 && cls[start - 1] == 0) start--;
    }
  }
  TextRange r{{row, start}, {row, end}};
  reg_ = Register{range_text(r), false};
  return delete_range(r);
}

Command EditorCore::apply_command(const Command& cmd) {
  if (mode_ == Mode::Command) set_mode(Mode::Normal);
  return cmd;
}

std::optional<Command> EditorCore::handle_key(int ch) {
  switch (mode_) {
    case Mode::Normal: return handle_normal_key(ch);
    case Mode::Insert: handle_insert_key(ch); return std::nullopt;
    case Mode::Command: return handle_command_key(ch);
  }
  return std::nullopt;
}

std::optional<Command> EditorCore::handle_normal_key(int ch) {
  if (ch == kEsc) { input_.reset(); sel_.reset(); return std::nullopt; }
  if (!input_.operatorKeys().empty()) { handle_operator_key(ch); return std::nullopt; }
  if (input_.consumeDigit(ch)) return std::nullopt;
  bool had_count = input_.hasCount();
  if (ch == 'g') {
    if (input_.consumeGg(ch)) {
      size_t n = input_.takeCount();
      sel_.reset();
      if (had_count) set_cursor(static_cast<int>(n) - 1, 0);
      else move_cursor(Direction::Up, Unit::Buffer);
    }
    return std::nullopt;
  }
  if (ch == 'd' || ch == 'c' || ch == 'y' || ch == 'r') {
    input_.beginOperator(static_cast<char>(ch));
    return std::nullopt;
  }
  int n = had_count ? static_cast<int>(input_.takeCount()) : 1;
  input_.reset();

  switch (ch) {
    case 'h': case KEY_LEFT: sel_.reset(); move_cursor(Direction::Left, Unit::Char, n); break;
    case 'l': case KEY_RIGHT: sel_.reset(); move_cursor(Direction::Right, Unit::Char, n); break;
    case 'k': case KEY_UP: sel_.reset(); move_cursor(Direction::Up, Unit::Char, n); break;
    case 'j': case KEY_DOWN: sel_.reset(); move_cursor(Direction::Down, Unit::Char, n); break;
    case KEY_SLEFT: extend_selection(Direction::Left, Unit::Char); break;
    case KEY_SRIGHT: extend_selection(Direction::Right, Unit::Char); break;
    case KEY_SR: extend_selection(Direction::Up, Unit::Char); break;
    case KEY_SF: extend_selection(Direction::Down, Unit::Char); break;
    case 'w': sel_.reset(); move_cursor(Direction::Right, Unit::Word, n); break;
    case 'b': sel_.reset(); move_cursor(Direction::Left, Unit::Word, n); break;
    case '0': sel_.reset(); move_cursor(Direction::Left, Unit::Line); break;
    case '$': sel_.reset(); move_cursor(Direction::Right, Unit::Line); break;
    case 'G':
      sel_.reset();
      if (had_count) set_cursor(n - 1, 0);
      else move_cursor(Direction::Down, Unit::Buffer);
      break;
    case 'x': case KEY_DC: {
      auto r = selection_range();
      if (!r) {
        cur_ = clamp_position(cur_);
        r = TextRange{cur_, {cur_.row, std::min(line_length(cur_.row), cur_.col + n)}};
      }
      std::string cut = range_text(*r);
      if (delete_range(*r)) reg_ = Register{cut, false};
      sel_.reset();
      break;
    }
    case 'P': put(n); break;
    case 'o': open_line_below(); break;
    case 'O': open_line_above(); break;
    case 'i': sel_.reset(); set_mode(Mode::Insert); break;
    case 'I':
      sel_.reset();
      set_mode(Mode::Insert);
      cur_.col = grapheme_count(indent_of(cur_.row));
      break;
    case 'a':
      sel_.reset();
      set_mode(Mode::Insert);
      if (line_length(cur_.row) > 0) move_cursor(Direction::Right, Unit::Char);
      break;
    case 'A':
      sel_.reset();
      set_mode(Mode::Insert);
      move_cursor(Direction::Right, Unit::Line);
      break;
    case ':': set_mode(Mode::Command); break;
    case 's': return Command::of(Command::Kind::ToggleSolution);
    case 'n': case ']': return Command::of(Command::Kind::Next);
    case 'p': case '[': return Command::of(Command::Kind::Previous);
    case 'q': return Command::of(Command::Kind::Quit);
    case kCtrlO: return Command::of(Command::Kind::ToggleOutput);
    default: break;
  }
  return std::nullopt;
}

void EditorCore::handle_operator_key(int ch) {
  std::string keys = input_.operatorKeys();
  char op = keys[0];
  if (op == 'r') {
    if (!is_text_byte(ch)) { input_.reset(); return; }
    std::string text;
    if (!input_.pushByte(ch, text)) return;
    int n = input_.hasCount() ? static_cast<int>(input_.takeCount()) : 1;
    input_.reset();
    sel_.reset();
    replace_char(text, n);
    return;
  }
  if (input_.consumeDigit(ch)) return;
  int n = input_.hasCount() ? static_cast<int>(input_.takeCount()) : 1;
  if (keys.size() == 1 && ch == op && op != 'c') {
    input_.reset();
    if (op == 'd') delete_line(n);
    else yank_lines(n);
    return;
  }
  if (keys.size() == 1 && op != 'y' && (ch == 'i' || ch == 'a')) {
    input_.pushOperatorKey(static_cast<char>(ch));
    return;
  }
  input_.reset();
  if (keys.size() == 2 && ch == 'w') {
    sel_.reset();
    if (op == 'c') set_mode(Mode::Insert);
    delete_word_object(keys[1] == 'a');
  }
}

void EditorCore::handle_insert_key(int ch) {
  if (ch == kEsc) { set_mode(Mode::Normal); return; }
  if (is_backspace_key(ch)) { backspace(); return; }
  if (ch == KEY_DC) { delete_char(); return; }
  if (is_enter_key(ch)) { insert_newline(); return; }
  if (ch == '\t') { insert_char(std::string(static_cast<size_t>(tab_width_), ' ')); return; }
  switch (ch) {
    case KEY_LEFT: move_cursor(Direction::Left, Unit::Char); return;
    case KEY_RIGHT: move_cursor(Direction::Right, Unit::Char); return;
    case KEY_UP: move_cursor(Direction::Up, Unit::Char); return;
    case KEY_DOWN: move_cursor(Direction::Down, Unit::Char); return;
    case KEY_HOME: move_cursor(Direction::Left, Unit::Line); return;
    case KEY_END: move_cursor(Direction::Right, Unit::Line); return;
    default: break;
  }
  if (ch < 0x20 || ch > 0xFF || ch == 0x7F) return;
  std::string text;
  if (input_.pushByte(ch, text)) insert_char(text);
}

std::optional<Command> EditorCore::handle_command_key(int ch) {
  if (ch == kEsc) { set_mode(Mode::Normal); return std::nullopt; }
  if (is_enter_key(ch)) return apply_command(parse_command(cmdline_));
  if (is_backspace_key(ch)) {
    if (cmdline_.empty()) { set_mode(Mode::Normal); return std::nullopt; }
    while (!cmdline_.empty() && (static_cast<unsigned char>(cmdline_.back()) & 0xC0) == 0x80) cmdline_.pop_back();
    if (!cmdline_.empty()) cmdline_.pop_back();
    return std::nullopt;
  }
  if (ch < 0x20 || ch > 0xFF || ch == 0x7F) return std::nullopt;
  std::string text;
  if (input_.pushByte(ch, text)) cmdline_ += text;
  return std::nullopt;
}

void EditorCore::set_language(const LanguageSpec& lang) {
  lang_ = &lang;
  hl_.clear();
}

std::vector<HighlightSpan> EditorCore::highlight_line(int row) const {
  if (row < 0 || row >= buf_.line_count()) return {};
  HighlightState entry = hl_.entry_state(row, [this](int r) { return std::string_view(buf_.line(r)); }, *lang_);
  return ::highlight_line(buf_.line(row), entry, *lang_).spans;
}
