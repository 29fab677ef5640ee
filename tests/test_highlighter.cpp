#include "highlighter.hpp"
#include <cassert>
#include <string>
#include <vector>

static const LanguageSpec& rust() { return language_for_extension("rs"); }

static TokenClass class_at(const std::vector<HighlightSpan>& spans, size_t byte) {
  for (const auto& s : spans) if (byte >= s.begin && byte < s.end) return s.cls;
  return TokenClass::Plain;
}

// spans are contiguous and cover the whole line
static void check_cover(const std::string& line, const std::vector<HighlightSpan>& spans) {
  size_t at = 0;
  for (const auto& s : spans) {
    assert(s.begin == at);
    assert(s.end > s.begin);
    at = s.end;
  }
  assert(at == line.size());
}

static void test_tokens() {
  std::string line = "let mut v: Vec<u32> = Point::new(0x1F, 2.5); // done";
  auto hl = highlight_line(line, HighlightState{}, rust());
  check_cover(line, hl.spans);
  assert(hl.exit == HighlightState{});
  assert(class_at(hl.spans, 0) == TokenClass::Keyword);
  assert(class_at(hl.spans, 4) == TokenClass::Keyword);
  assert(class_at(hl.spans, 8) == TokenClass::Plain);
  assert(class_at(hl.spans, 9) == TokenClass::Punctuation);
  assert(class_at(hl.spans, line.find("Vec")) == TokenClass::Type);
  assert(class_at(hl.spans, line.find("u32")) == TokenClass::Type);
  assert(class_at(hl.spans, line.find("Point")) == TokenClass::Type);
  assert(class_at(hl.spans, line.find("new")) == TokenClass::Plain);
  assert(class_at(hl.spans, line.find("0x1F") + 3) == TokenClass::Number);
  assert(class_at(hl.spans, line.find("2.5") + 2) == TokenClass::Number);
  assert(class_at(hl.spans, line.find("// done") + 4) == TokenClass::Comment);

  std::string chars = "let c = 'x'; fn f<'a>(s: &'a str)";
  hl = highlight_line(chars, HighlightState{}, rust());
  check_cover(chars, hl.spans);
  assert(class_at(hl.spans, chars.find("'x'")) == TokenClass::String);
  assert(class_at(hl.spans, chars.find("'a>")) == TokenClass::Plain);

  std::string s = "print(\"a \\\" b\") x";
  hl = highlight_line(s, HighlightState{}, rust());
  assert(class_at(hl.spans, s.find('b')) == TokenClass::String);
  assert(class_at(hl.spans, s.size() - 1) == TokenClass::Plain);

  auto plain = highlight_line("let x = 1;", HighlightState{}, language_for_extension(".txt"));
  for (const auto& sp : plain.spans) assert(sp.cls != TokenClass::Keyword);
  assert(class_at(highlight_line("int x;", HighlightState{}, language_for_extension("CPP")).spans, 0) == TokenClass::Type);
}

static void test_multiline_state() {
  auto a = highlight_line("let s = \"open", HighlightState{}, rust());
  assert(a.exit == HighlightState::in_string('"'));
  auto b = highlight_line("still open", a.exit, rust());
  assert(b.spans.size() == 1 && b.spans[0].cls == TokenClass::String);
  auto c = highlight_line("done\"; let", b.exit, rust());
  assert(c.exit == HighlightState{});
  assert(class_at(c.spans, 0) == TokenClass::String);
  assert(class_at(c.spans, 7) == TokenClass::Keyword);

  auto d = highlight_line("/* outer /* inner */", HighlightState{}, rust());
  assert(d.exit == HighlightState::in_comment(1));
  auto e = highlight_line("*/ fn", d.exit, rust());
  assert(e.exit == HighlightState{});
  assert(class_at(e.spans, 0) == TokenClass::Comment);
  assert(class_at(e.spans, 3) == TokenClass::Keyword);

  // C++ block comments do not nest
  auto f = highlight_line("/* a /* b */ int", HighlightState{}, language_for_extension("cpp"));
  assert(f.exit == HighlightState{});

  auto empty = highlight_line("", HighlightState::in_comment(2), rust());
  assert(empty.spans.empty());
  assert(empty.exit == HighlightState::in_comment(2));
}

static void test_idempotent_and_restart() {
  std::string line = "fn main() { let x = \"hi\"; }";
  auto first = highlight_line(line, HighlightState{}, rust());
  auto second = highlight_line(line, HighlightState{}, rust());
  assert(first.spans == second.spans);
  assert(scan_exit_state(line, HighlightState{}, rust()) == first.exit);

  LineTokenizer tok(line, HighlightState{}, rust());
  std::vector<HighlightSpan> pass1, pass2;
  HighlightSpan sp;
  while (tok.next(sp)) pass1.push_back(sp);
  tok.restart();
  while (tok.next(sp)) pass2.push_back(sp);
  assert(pass1 == pass2);
  assert(pass1 == first.spans);
}

static void test_cache() {
  std::vector<std::string> lines = {"let a = 1;", "/* start", "middle", "end */", "let b = 2;"};
  auto provider = [&lines](int r) { return std::string_view(lines[static_cast<size_t>(r)]); };
  HighlightCache cache;
  assert(cache.entry_state(0, provider, rust()) == HighlightState{});
  assert(cache.entry_state(2, provider, rust()) == HighlightState::in_comment(1));
  assert(cache.valid_rows() == 2);
  assert(cache.entry_state(4, provider, rust()) == HighlightState{});
  assert(cache.valid_rows() == 4);

  lines[1] = "let start = 0;";
  cache.invalidate_from(1);
  assert(cache.valid_rows() == 1);
  assert(cache.entry_state(2, provider, rust()) == HighlightState{});
  lines[1] = "\"open";
  cache.invalidate_from(1);
  assert(cache.entry_state(4, provider, rust()) == HighlightState::in_string('"'));
  cache.clear();
  assert(cache.valid_rows() == 0);
}

int main() {
  test_tokens();
  test_multiline_state();
  test_idempotent_and_restart();
  test_cache();
  assert(std::string(token_class_name(TokenClass::Keyword)) == "keyword");
  return 0;
}
