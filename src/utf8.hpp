#pragma once
/*
 * UTF-8 helpers
 *
 * Purpose: decode code points and segment a line into grapheme clusters so
 * cursor columns count user-perceived characters.
 * Cluster rule: a base code point followed by combining marks, variation
 * selectors, emoji modifiers, or ZWJ-joined code points.
 */
#include <cstddef>
#include <string>
#include <string_view>

// Invalid or truncated sequences decode as U+FFFD with len = 1.
char32_t decode_utf8(std::string_view s, size_t pos, size_t& len);
std::string encode_utf8(char32_t cp);

// Expected total length of a sequence from its lead byte; 0 for a continuation byte.
int utf8_sequence_length(unsigned char lead);

bool is_grapheme_extender(char32_t cp);

// Byte index just past the grapheme starting at pos.
size_t next_grapheme_end(std::string_view s, size_t pos);

int grapheme_count(std::string_view s);

// Byte offset of grapheme column gcol; clamps to s.size().
size_t grapheme_byte_offset(std::string_view s, int gcol);

// Grapheme column containing byte offset pos.
int grapheme_index_at_byte(std::string_view s, size_t pos);

// Display columns for a terminal cell grid: wide East Asian / emoji count as 2.
int display_width(std::string_view grapheme);
