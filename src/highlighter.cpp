#include "highlighter.hpp"
#include <algorithm>
#include <cctype>

const char* token_class_name(TokenClass c) {
  switch (c) {
    case TokenClass::Plain: return "plain";
    case TokenClass::Keyword: return "keyword";
    case TokenClass::Type: return "type";
    case TokenClass::Number: return "number";
    case TokenClass::String: return "string";
    case TokenClass::Comment: return "comment";
    case TokenClass::Punctuation: return "punctuation";
  }
  return "plain";
}

LanguageSpec LanguageSpec::rust() {
  LanguageSpec l;
  l.name = "rust";
  l.keywords = {
    "fn", "let", "mut", "const", "if", "else", "match", "loop", "while", "for", "in", "return",
    "break", "continue", "struct", "enum", "impl", "trait", "pub", "mod", "use", "self",
    "Self", "super", "crate", "where", "async", "await", "move", "ref", "static", "type",
    "unsafe", "extern", "dyn", "as"
  };
  l.types = {
    "i8", "i16", "i32", "i64", "i128", "isize", "u8", "u16", "u32", "u64", "u128", "usize",
    "f32", "f64", "bool", "char", "str", "String", "Vec", "Option", "Result", "Box", "Rc",
    "Arc", "Ok", "Err", "Some", "None", "true", "false"
  };
  l.punctuation = "(){}[];:,.+-*/=<>!&|^?%#@";
  l.line_comment = "//";
  l.block_open = "/*";
  l.block_close = "*/";
  l.nested_blocks = true;
  l.string_delims = "\"";
  l.char_literals = true;
  l.capitalized_types = true;
  return l;
}

LanguageSpec LanguageSpec::cpp() {
  LanguageSpec l;
  l.name = "cpp";
  l.keywords = {
    "if", "else", "for", "while", "do", "return", "switch", "case", "default", "break", "continue",
    "struct", "class", "public", "private", "protected", "const", "constexpr", "static", "enum",
    "sizeof", "typedef", "namespace", "using", "new", "delete", "template", "typename", "virtual",
    "override", "inline", "explicit", "noexcept", "this", "operator", "friend", "try", "catch",
    "throw", "nullptr", "include", "define", "pragma"
  };
  l.types = {
    "void", "int", "char", "float", "double", "long", "short", "signed", "unsigned", "bool",
    "auto", "size_t", "true", "false"
  };
  l.punctuation = "(){}[];:,.+-*/=<>!&|^?%~#";
  l.line_comment = "//";
  l.block_open = "/*";
  l.block_close = "*/";
  l.string_delims = "\"";
  l.char_literals = true;
  return l;
}

LanguageSpec LanguageSpec::plain() {
  LanguageSpec l;
  l.name = "plain";
  return l;
}

static std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

const LanguageSpec& language_for_extension(std::string ext) {
  static const LanguageSpec rust = LanguageSpec::rust();
  static const LanguageSpec cxx = LanguageSpec::cpp();
  static const LanguageSpec none = LanguageSpec::plain();
  if (!ext.empty() && ext[0] == '.') ext.erase(ext.begin());
  std::string e = to_lower(ext);
  if (e == "rs") return rust;
  if (e == "c" || e == "h" || e == "cpp" || e == "cxx" || e == "cc" || e == "hpp" || e == "hxx") return cxx;
  return none;
}

static bool is_word_start(unsigned char c) { return std::isalpha(c) || c == '_' || c >= 0x80; }
static bool is_word_char(unsigned char c) { return std::isalnum(c) || c == '_' || c >= 0x80; }

LineTokenizer::LineTokenizer(std::string_view line, HighlightState entry, const LanguageSpec& lang)
    : line_(line), entry_(entry), state_(entry), lang_(&lang) {}

void LineTokenizer::restart() {
  state_ = entry_;
  pos_ = 0;
}

bool LineTokenizer::starts_with(size_t pos, const std::string& tok) const {
  return !tok.empty() && line_.substr(pos, tok.size()) == tok;
}

bool LineTokenizer::is_punct(char c) const {
  return c != '\0' && lang_->punctuation.find(c) != std::string::npos;
}

// Consumes up to and including the closing delimiter; leaves state_ InString if none.
size_t LineTokenizer::scan_string(size_t from) {
  size_t i = from;
  while (i < line_.size()) {
    char c = line_[i];
    if (c == lang_->escape) { i += 2; continue; }
    if (c == state_.delim) { state_ = HighlightState{}; return i + 1; }
    ++i;
  }
  return line_.size();
}

size_t LineTokenizer::scan_block_comment(size_t from) {
  size_t i = from;
  while (i < line_.size()) {
    if (lang_->nested_blocks && starts_with(i, lang_->block_open)) {
      state_.depth++;
      i += lang_->block_open.size();
      continue;
    }
    if (starts_with(i, lang_->block_close)) {
      i += lang_->block_close.size();
      if (--state_.depth <= 0) { state_ = HighlightState{}; return i; }
      continue;
    }
    ++i;
  }
  return line_.size();
}

// 'x', '\n', '\u{1F600}', 'é'. Returns from when this is not a char literal (a lifetime, say).
size_t LineTokenizer::scan_char_literal(size_t from) const {
  size_t i = from + 1;
  if (i >= line_.size()) return from;
  if (line_[i] == lang_->escape) {
    size_t close = line_.find('\'', i + 2);
    if (close == std::string_view::npos || close - from > 12) return from;
    return close + 1;
  }
  if (line_[i] == '\'') return from;
  size_t n = 1;
  while (i + n < line_.size() && (static_cast<unsigned char>(line_[i + n]) & 0xC0) == 0x80) ++n;
  if (i + n < line_.size() && line_[i + n] == '\'') return i + n + 1;
  return from;
}

size_t LineTokenizer::scan_number(size_t from) const {
  size_t i = from;
  while (i < line_.size()) {
    unsigned char c = static_cast<unsigned char>(line_[i]);
    if (std::isalnum(c) || c == '_') { ++i; continue; }
    if (c == '.' && i + 1 < line_.size() && std::isdigit(static_cast<unsigned char>(line_[i + 1]))) { ++i; continue; }
    break;
  }
  return i;
}

size_t LineTokenizer::scan_word(size_t from) const {
  size_t i = from;
  while (i < line_.size() && is_word_char(static_cast<unsigned char>(line_[i]))) ++i;
  return i;
}

size_t LineTokenizer::scan_plain(size_t from) const {
  size_t i = from + 1;
  while (i < line_.size()) {
    unsigned char c = static_cast<unsigned char>(line_[i]);
    if (is_word_start(c) || std::isdigit(c) || is_punct(static_cast<char>(c))) break;
    if (lang_->string_delims.find(static_cast<char>(c)) != std::string::npos) break;
    if (lang_->char_literals && c == '\'') break;
    if (starts_with(i, lang_->line_comment) || starts_with(i, lang_->block_open)) break;
    ++i;
  }
  return i;
}

TokenClass LineTokenizer::classify_word(std::string_view w) const {
  std::string s(w);
  if (lang_->keywords.count(s)) return TokenClass::Keyword;
  if (lang_->types.count(s)) return TokenClass::Type;
  if (lang_->capitalized_types && !s.empty() && std::isupper(static_cast<unsigned char>(s[0]))) return TokenClass::Type;
  return TokenClass::Plain;
}

bool LineTokenizer::next(HighlightSpan& out) {
  if (pos_ >= line_.size()) return false;
  size_t start = pos_;
  size_t end = start;
  TokenClass cls = TokenClass::Plain;
  unsigned char c = static_cast<unsigned char>(line_[start]);

  if (state_.kind == HighlightState::Kind::InBlockComment) {
    end = scan_block_comment(start);
    cls = TokenClass::Comment;
  } else if (state_.kind == HighlightState::Kind::InString) {
    end = scan_string(start);
    cls = TokenClass::String;
  } else if (starts_with(start, lang_->line_comment)) {
    end = line_.size();
    cls = TokenClass::Comment;
  } else if (starts_with(start, lang_->block_open)) {
    state_ = HighlightState::in_comment(1);
    end = scan_block_comment(start + lang_->block_open.size());
    cls = TokenClass::Comment;
  } else if (lang_->string_delims.find(static_cast<char>(c)) != std::string::npos) {
    state_ = HighlightState::in_string(static_cast<char>(c));
    end = scan_string(start + 1);
    cls = TokenClass::String;
  } else if (lang_->char_literals && c == '\'' && scan_char_literal(start) != start) {
    end = scan_char_literal(start);
    cls = TokenClass::String;
  } else if (std::isdigit(c)) {
    end = scan_number(start);
    cls = TokenClass::Number;
  } else if (is_word_start(c)) {
    end = scan_word(start);
    cls = classify_word(line_.substr(start, end - start));
  } else if (is_punct(static_cast<char>(c)) || c == '\'') {
    end = start + 1;
    cls = c == '\'' ? TokenClass::Plain : TokenClass::Punctuation;
  } else {
    end = scan_plain(start);
  }

  end = std::min(std::max(end, start + 1), line_.size());
  pos_ = end;
  out = HighlightSpan{start, end, cls};
  return true;
}

HighlightedLine highlight_line(std::string_view line, HighlightState entry, const LanguageSpec& lang) {
  HighlightedLine hl;
  LineTokenizer tok(line, entry, lang);
  HighlightSpan span;
  while (tok.next(span)) hl.spans.push_back(span);
  hl.exit = tok.state();
  return hl;
}

HighlightState scan_exit_state(std::string_view line, HighlightState entry, const LanguageSpec& lang) {
  LineTokenizer tok(line, entry, lang);
  HighlightSpan span;
  while (tok.next(span)) {}
  return tok.state();
}

void HighlightCache::invalidate_from(int row) {
  if (row < 0) row = 0;
  if (row < valid_rows()) exit_states_.resize(static_cast<size_t>(row));
}

HighlightState HighlightCache::entry_state(int row, const LineProvider& line_at, const LanguageSpec& lang) {
  if (row <= 0) return HighlightState{};
  while (valid_rows() < row) {
    int r = valid_rows();
    HighlightState in = r == 0 ? HighlightState{} : exit_states_.back();
    exit_states_.push_back(scan_exit_state(line_at(r), in, lang));
  }
  return exit_states_[static_cast<size_t>(row - 1)];
}
