#pragma once

#include <cstddef>
#include <string>

// Budget for the patch sent to the model, in characters.
constexpr std::size_t MAX_DIFF_CHARS = 30000;
// Characters kept from the end when the budget is exceeded.
constexpr std::size_t TAIL_CHARS = 5000;

extern const std::string DIFF_FILE_HEADER;
extern const std::string TRUNCATION_MARKER;

// Drops every file segment whose path is ignored. Content before the first
// file header is dropped as well; surviving lines are kept verbatim.
std::string filter_diff_by_ignored(const std::string& diff_text);

// Keeps the first (max_chars - tail_chars) and the last tail_chars characters
// around TRUNCATION_MARKER when diff_text is longer than max_chars.
std::string truncate_diff(const std::string& diff_text, std::size_t max_chars = MAX_DIFF_CHARS, std::size_t tail_chars = TAIL_CHARS);
