#include "utf8.hpp"

int utf8_sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 0;
}

char32_t decode_utf8(std::string_view s, size_t pos, size_t& len) {
  len = 1;
  if (pos >= s.size()) { len = 0; return 0; }
  unsigned char c = static_cast<unsigned char>(s[pos]);
  int n = utf8_sequence_length(c);
  if (n == 1) return c;
  if (n == 0 || pos + static_cast<size_t>(n) > s.size()) return 0xFFFD;
  char32_t cp = (n == 2) ? (c & 0x1F) : (n == 3) ? (c & 0x0F) : (c & 0x07);
  for (int i = 1; i < n; ++i) {
    unsigned char cc = static_cast<unsigned char>(s[pos + i]);
    if ((cc & 0xC0) != 0x80) return 0xFFFD;
    cp = (cp << 6) | (cc & 0x3F);
  }
  len = static_cast<size_t>(n);
  return cp;
}

std::string encode_utf8(char32_t cp) {
  std::string out;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return out;
}

bool is_grapheme_extender(char32_t cp) {
  return (cp >= 0x0300 && cp <= 0x036F) ||
         (cp >= 0x1AB0 && cp <= 0x1AFF) ||
         (cp >= 0x1DC0 && cp <= 0x1DFF) ||
         (cp >= 0x20D0 && cp <= 0x20FF) ||
         (cp >= 0xFE00 && cp <= 0xFE0F) ||
         (cp >= 0xFE20 && cp <= 0xFE2F) ||
         (cp >= 0x1F3FB && cp <= 0x1F3FF) ||
         (cp >= 0xE0100 && cp <= 0xE01EF) ||
         cp == 0x200C;
}

static constexpr char32_t kZeroWidthJoiner = 0x200D;

size_t next_grapheme_end(std::string_view s, size_t pos) {
  if (pos >= s.size()) return s.size();
  size_t len = 0;
  decode_utf8(s, pos, len);
  pos += len;
  while (pos < s.size()) {
    size_t l = 0;
    char32_t cp = decode_utf8(s, pos, l);
    if (cp == kZeroWidthJoiner) {
      pos += l;
      if (pos < s.size()) {
        decode_utf8(s, pos, l);
        pos += l;
      }
      continue;
    }
    if (!is_grapheme_extender(cp)) break;
    pos += l;
  }
  return pos;
}

int grapheme_count(std::string_view s) {
  int n = 0;
  size_t pos = 0;
  while (pos < s.size()) { pos = next_grapheme_end(s, pos); ++n; }
  return n;
}

size_t grapheme_byte_offset(std::string_view s, int gcol) {
  size_t pos = 0;
  for (int i = 0; i < gcol && pos < s.size(); ++i) pos = next_grapheme_end(s, pos);
  return pos;
}

int grapheme_index_at_byte(std::string_view s, size_t byte) {
  int idx = 0;
  size_t pos = 0;
  while (pos < s.size()) {
    size_t end = next_grapheme_end(s, pos);
    if (byte < end) return idx;
    pos = end;
    ++idx;
  }
  return idx;
}

static bool is_wide(char32_t cp) {
  return (cp >= 0x1100 && cp <= 0x115F) ||
         (cp >= 0x2E80 && cp <= 0xA4CF && cp != 0x303F) ||
         (cp >= 0xAC00 && cp <= 0xD7A3) ||
         (cp >= 0xF900 && cp <= 0xFAFF) ||
         (cp >= 0xFE30 && cp <= 0xFE4F) ||
         (cp >= 0xFF00 && cp <= 0xFF60) ||
         (cp >= 0xFFE0 && cp <= 0xFFE6) ||
         (cp >= 0x1F300 && cp <= 0x1F64F) ||
         (cp >= 0x1F900 && cp <= 0x1F9FF) ||
         (cp >= 0x20000 && cp <= 0x3FFFD);
}

int display_width(std::string_view grapheme) {
  if (grapheme.empty()) return 0;
  size_t len = 0;
  char32_t cp = decode_utf8(grapheme, 0, len);
  if (cp < 0x20 || cp == 0x7F) return 1;
  return is_wide(cp) ? 2 : 1;
}
