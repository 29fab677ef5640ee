#pragma once
/*
 * FileWriter
 *
 * Purpose: crash-safe replace of a file's content.
 * Steps: write <path>.tmp → fdatasync → rename over <path>.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

bool write_file_atomic(const std::filesystem::path& path, std::string_view data, std::string& msg);

// Lines joined by eol, streamed through a fixed-size chunk buffer.
bool write_lines_atomic(const std::filesystem::path& path,
                        const std::vector<std::string>& lines,
                        bool trailing_newline,
                        std::string_view eol,
                        std::string& msg);
