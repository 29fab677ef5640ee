#include "utf8.hpp"
#include <cassert>
#include <string>

int main() {
  size_t len = 0;
  assert(decode_utf8("a", 0, len) == U'a' && len == 1);
  assert(decode_utf8("\xC3\xA9", 0, len) == 0xE9 && len == 2);
  assert(decode_utf8("\xE2\x9C\x93", 0, len) == 0x2713 && len == 3);
  assert(decode_utf8("\xF0\x9F\x98\x80", 0, len) == 0x1F600 && len == 4);
  // truncated and stray continuation bytes
  assert(decode_utf8("\xE2\x9C", 0, len) == 0xFFFD && len == 1);
  assert(decode_utf8("\x80", 0, len) == 0xFFFD && len == 1);

  assert(encode_utf8(0x2713) == "\xE2\x9C\x93");
  assert(encode_utf8(U'x') == "x");
  assert(utf8_sequence_length(0xF0) == 4);
  assert(utf8_sequence_length(0x80) == 0);

  assert(grapheme_count("") == 0);
  assert(grapheme_count("abc") == 3);
  // e + combining acute is one cluster
  assert(grapheme_count("e\xCC\x81x") == 2);
  // family emoji joined by ZWJ
  std::string family = "\xF0\x9F\x91\xA8\xE2\x80\x8D\xF0\x9F\x91\xA9\xE2\x80\x8D\xF0\x9F\x91\xA7";
  assert(grapheme_count(family) == 1);
  assert(grapheme_count(family + "!") == 2);
  // thumbs up + skin tone modifier
  assert(grapheme_count("\xF0\x9F\x91\x8D\xF0\x9F\x8F\xBD") == 1);

  std::string s = "a\xC3\xA9z";
  assert(grapheme_byte_offset(s, 0) == 0);
  assert(grapheme_byte_offset(s, 1) == 1);
  assert(grapheme_byte_offset(s, 2) == 3);
  assert(grapheme_byte_offset(s, 3) == 4);
  assert(grapheme_byte_offset(s, 99) == 4);
  assert(grapheme_index_at_byte(s, 2) == 1);
  assert(grapheme_index_at_byte(s, 3) == 2);
  assert(grapheme_index_at_byte(s, 10) == 3);

  assert(display_width("a") == 1);
  assert(display_width("\xE4\xB8\xAD") == 2);
  assert(display_width("\xF0\x9F\x98\x80") == 2);
  assert(display_width("") == 0);
  return 0;
}
