#pragma once
/*
 * FileReader
 *
 * Purpose: read files; split into lines with CRLF normalized.
 * Usage: mmap_readlines(path, out_lines, msg) for config files we own;
 * read_file_text(path, out, msg) for exercise files others may rewrite.
 * Both return false with msg on failure.
 * Note: a trailing '\n' yields a final empty line, so joining with '\n'
 * reproduces the file byte for byte (CR aside).
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);

bool read_file_text(const std::filesystem::path& path, std::string& out, std::string& msg);

// Same splitting rule as mmap_readlines, on an in-memory string.
std::vector<std::string> split_lines(std::string_view text);

bool file_mtime(const std::filesystem::path& path, std::filesystem::file_time_type& out);
