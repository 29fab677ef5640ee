#pragma once
/*
 * Highlighter
 *
 * Purpose: split one line into styled spans for display.
 * Model: a single left-to-right scan driven by a LanguageSpec; the state at
 * the end of a line (open string / block comment) feeds the next line.
 * Output: non-overlapping byte spans covering the whole line; gaps are Plain.
 */
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

enum class TokenClass { Plain, Keyword, Type, Number, String, Comment, Punctuation };

const char* token_class_name(TokenClass c);

struct HighlightSpan {
  size_t begin = 0;
  size_t end = 0;
  TokenClass cls = TokenClass::Plain;
  bool operator==(const HighlightSpan&) const = default;
};

struct HighlightState {
  enum class Kind { Default, InString, InBlockComment };
  Kind kind = Kind::Default;
  char delim = 0;  // InString
  int depth = 0;   // InBlockComment
  bool operator==(const HighlightState&) const = default;

  static HighlightState in_string(char d) { return {Kind::InString, d, 0}; }
  static HighlightState in_comment(int depth) { return {Kind::InBlockComment, 0, depth}; }
};

struct LanguageSpec {
  std::string name;
  std::unordered_set<std::string> keywords;
  std::unordered_set<std::string> types;
  std::string punctuation;
  std::string line_comment;
  std::string block_open;
  std::string block_close;
  bool nested_blocks = false;
  std::string string_delims;
  char escape = '\\';
  bool char_literals = false;
  bool capitalized_types = false;

  static LanguageSpec rust();
  static LanguageSpec cpp();
  static LanguageSpec plain();
};

// Built-in spec chosen from a file extension ("rs", ".cpp", ...); unknown → plain.
const LanguageSpec& language_for_extension(std::string ext);

class LineTokenizer {
public:
  LineTokenizer(std::string_view line, HighlightState entry, const LanguageSpec& lang);
  bool next(HighlightSpan& out);
  void restart();
  // After next() returns false this is the exit state for the following line.
  HighlightState state() const { return state_; }

private:
  size_t scan_string(size_t from);
  size_t scan_block_comment(size_t from);
  size_t scan_char_literal(size_t from) const;
  size_t scan_number(size_t from) const;
  size_t scan_word(size_t from) const;
  size_t scan_plain(size_t from) const;
  bool starts_with(size_t pos, const std::string& tok) const;
  bool is_punct(char c) const;
  TokenClass classify_word(std::string_view w) const;

  std::string_view line_;
  HighlightState entry_;
  HighlightState state_;
  const LanguageSpec* lang_;
  size_t pos_ = 0;
};

struct HighlightedLine {
  std::vector<HighlightSpan> spans;
  HighlightState exit;
};

HighlightedLine highlight_line(std::string_view line, HighlightState entry, const LanguageSpec& lang);
HighlightState scan_exit_state(std::string_view line, HighlightState entry, const LanguageSpec& lang);

/*
 * HighlightCache
 *
 * Keeps the exit state of lines [0, valid_rows()). Entry state of a row is
 * computed lazily from the last valid row; edits call invalidate_from(row).
 */
class HighlightCache {
public:
  using LineProvider = std::function<std::string_view(int)>;
  void clear() { exit_states_.clear(); }
  void invalidate_from(int row);
  HighlightState entry_state(int row, const LineProvider& line_at, const LanguageSpec& lang);
  int valid_rows() const { return static_cast<int>(exit_states_.size()); }
private:
  std::vector<HighlightState> exit_states_;
};
