#pragma once

#include <string>
#include <vector>

std::string trim(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);
std::string to_lower(const std::string& s);
std::vector<std::string> split_whitespace(const std::string& s);

// Invalid UTF-8 sequences become U+FFFD.
std::string sanitize_utf8(const std::string& input);

// Lengths and slices below count code points, not bytes.
std::size_t utf8_length(const std::string& s);
std::string utf8_prefix(const std::string& s, std::size_t count);
std::string utf8_suffix(const std::string& s, std::size_t count);
