#include "diff_filter.hpp"
#include "exclusion.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>
#include <vector>

const std::string DIFF_FILE_HEADER = "diff --git ";
const std::string TRUNCATION_MARKER = "\n\n... [diff truncated to save context] ...\n\n";

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

}

std::string filter_diff_by_ignored(const std::string& diff_text) {
    std::vector<std::string> lines = split_lines(diff_text);
    std::string result;
    bool first = true;
    bool skipping = true;
    std::size_t dropped_files = 0;

    for (const auto& line : lines) {
        if (starts_with(line, DIFF_FILE_HEADER)) {
            // "diff --git a/<path> b/<path>"
            std::vector<std::string> parts = split_whitespace(line);
            skipping = false;
            if (parts.size() >= 4) {
                std::string file_path = parts[2];
                if (starts_with(file_path, "a/")) {
                    file_path = file_path.substr(2);
                }
                skipping = should_ignore(file_path);
                if (skipping) {
                    spdlog::debug("Dropping ignored file from diff: {}", file_path);
                    ++dropped_files;
                }
            }
        }
        if (skipping) continue;
        if (!first) result += '\n';
        result += line;
        first = false;
    }

    if (dropped_files > 0) {
        spdlog::debug("Filtered {} ignored file(s) out of the diff", dropped_files);
    }
    return result;
}

std::string truncate_diff(const std::string& diff_text, std::size_t max_chars, std::size_t tail_chars) {
    std::size_t length = utf8_length(diff_text);
    if (length <= max_chars) {
        return diff_text;
    }
    std::size_t head = max_chars > tail_chars ? max_chars - tail_chars : 0;
    spdlog::debug("Truncating diff from {} to {} + {} characters", length, head, tail_chars);
    std::string tail = tail_chars > 0 ? utf8_suffix(diff_text, tail_chars) : std::string();
    return utf8_prefix(diff_text, head) + TRUNCATION_MARKER + tail;
}
