#pragma once
#ifndef TESTFORGE_TEXT_FILE_H
#define TESTFORGE_TEXT_FILE_H

#include <filesystem>
#include <string>
#include <vector>
#include "core/line_range.h"

namespace testforge {

// Throws Error when the file cannot be opened or read
std::string read_text_file(const std::filesystem::path& path);

// Replaces the file's content; throws Error on any write failure
void write_text_file(const std::filesystem::path& path, const std::string& content);

// Lines with their terminators kept, so joining them returns the input
std::vector<std::string> split_lines_keep_ends(const std::string& text);

std::string join_lines(const std::vector<std::string>& lines);

// Text of the lines in `range`, terminators included
std::string slice_lines(const std::string& text, const LineRange& range);

}  // namespace testforge

#endif  // TESTFORGE_TEXT_FILE_H
