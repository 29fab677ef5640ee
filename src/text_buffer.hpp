#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based text storage for one exercise file, plus file I/O.
 * Invariant: always holds at least one line; lines never contain '\n'.
 * Line endings: a text whose first line ends in CRLF is written back with
 * CRLF on every line.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename).
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

class TextBuffer {
public:
  TextBuffer();

  bool empty() const;
  int line_count() const;
  const std::string& line(int r) const;
  void ensure_not_empty();

  void init_from_lines(std::vector<std::string> lines);
  // Splits on '\n'; a final '\n' is remembered rather than stored as an empty line.
  void set_text(std::string_view text);
  std::string text() const;
  bool trailing_newline() const { return trailing_newline_; }
  bool crlf() const { return crlf_; }

  void insert_line(int row, const std::string& s);
  void insert_lines(int row, const std::vector<std::string>& ss);
  void erase_lines(int start_row, int end_row);
  void replace_line(int row, const std::string& s);

  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  std::vector<std::string> lines_;
  bool trailing_newline_ = false;
  bool crlf_ = false;
};
