#include "text_buffer.hpp"
#include "file_reader.hpp"
#include "file_writer.hpp"
#include <algorithm>

TextBuffer::TextBuffer() { ensure_not_empty(); }

bool TextBuffer::empty() const { return lines_.size() == 1 && lines_[0].empty(); }
int TextBuffer::line_count() const { return static_cast<int>(lines_.size()); }

const std::string& TextBuffer::line(int r) const {
  static const std::string kEmpty;
  if (r < 0 || r >= line_count()) return kEmpty;
  return lines_[static_cast<size_t>(r)];
}

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

void TextBuffer::init_from_lines(std::vector<std::string> src) {
  trailing_newline_ = false;
  crlf_ = false;
  if (src.size() > 1 && src.back().empty()) {
    src.pop_back();
    trailing_newline_ = true;
  }
  lines_ = std::move(src);
  ensure_not_empty();
}

void TextBuffer::set_text(std::string_view text) {
  init_from_lines(split_lines(text));
  size_t nl = text.find('\n');
  crlf_ = nl != std::string_view::npos && nl > 0 && text[nl - 1] == '\r';
}

std::string TextBuffer::text() const {
  std::string out;
  size_t total = 0;
  std::string_view eol = crlf_ ? "\r\n" : "\n";
  for (const auto& s : lines_) total += s.size() + eol.size();
  out.reserve(total);
  for (size_t i = 0; i < lines_.size(); ++i) {
    out += lines_[i];
    if (i + 1 < lines_.size() || trailing_newline_) out += eol;
  }
  return out;
}

void TextBuffer::insert_line(int row, const std::string& s) {
  row = std::clamp(row, 0, line_count());
  lines_.insert(lines_.begin() + row, s);
}

void TextBuffer::insert_lines(int row, const std::vector<std::string>& ss) {
  row = std::clamp(row, 0, line_count());
  lines_.insert(lines_.begin() + row, ss.begin(), ss.end());
}

// [start_row, end_row)
void TextBuffer::erase_lines(int start_row, int end_row) {
  start_row = std::clamp(start_row, 0, line_count());
  end_row = std::clamp(end_row, start_row, line_count());
  lines_.erase(lines_.begin() + start_row, lines_.begin() + end_row);
  ensure_not_empty();
}

void TextBuffer::replace_line(int row, const std::string& s) {
  if (row < 0 || row >= line_count()) return;
  lines_[static_cast<size_t>(row)] = s;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  return write_lines_atomic(path, lines_, trailing_newline_, crlf_ ? "\r\n" : "\n", msg);
}
