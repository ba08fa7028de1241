#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

const std::string REPLACEMENT_CHAR = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte length of a well-formed sequence starting at i, or 0 if malformed.
std::size_t sequence_length(const std::string& s, std::size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    if (c <= 0x7F) return 1;
    if (c >= 0xC2 && c <= 0xDF) len = 2;
    else if (c >= 0xE0 && c <= 0xEF) len = 3;
    else if (c >= 0xF0 && c <= 0xF4) len = 4;
    else return 0;
    if (i + len > s.size()) return 0;
    for (std::size_t k = 1; k < len; ++k) {
        if (!is_continuation(static_cast<unsigned char>(s[i + k]))) return 0;
    }
    unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
    // Overlong forms, surrogates and values past U+10FFFF.
    if (c == 0xE0 && c1 < 0xA0) return 0;
    if (c == 0xED && c1 > 0x9F) return 0;
    if (c == 0xF0 && c1 < 0x90) return 0;
    if (c == 0xF4 && c1 > 0x8F) return 0;
    return len;
}

// Byte offset of the code point with the given index (or s.size()).
std::size_t byte_offset(const std::string& s, std::size_t index) {
    std::size_t pos = 0;
    for (std::size_t n = 0; n < index && pos < s.size(); ++n) {
        ++pos;
        while (pos < s.size() && is_continuation(static_cast<unsigned char>(s[pos]))) ++pos;
    }
    return pos;
}

}

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char ch) { return std::isspace(ch); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char ch) { return std::isspace(ch); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(const std::string& s) {
    std::string lowered = s;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream stream(s);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::string sanitize_utf8(const std::string& input) {
    std::string output;
    output.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        std::size_t len = sequence_length(input, i);
        if (len == 0) {
            output += REPLACEMENT_CHAR;
            ++i;
            continue;
        }
        output.append(input, i, len);
        i += len;
    }
    return output;
}

std::size_t utf8_length(const std::string& s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char ch) { return !is_continuation(static_cast<unsigned char>(ch)); }));
}

std::string utf8_prefix(const std::string& s, std::size_t count) {
    return s.substr(0, byte_offset(s, count));
}

std::string utf8_suffix(const std::string& s, std::size_t count) {
    std::size_t total = utf8_length(s);
    if (count >= total) return s;
    return s.substr(byte_offset(s, total - count));
}
