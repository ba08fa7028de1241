#include "exclusion.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <fnmatch.h>

const std::vector<std::string> IGNORED_PATTERNS = {
    "package-lock.json",
    "poetry.lock",
    "Pipfile.lock",
    "yarn.lock",
    "pnpm-lock.yaml",
    "bun.lockb",
    "*.min.js",
    "*.min.css",
    ".bundle",
    "vendor/",
    "node_modules/",
    "__pycache__/",
    ".git/",
    "*.pyc",
    "*.egg-info/",
    ".eggs/",
    "dist/",
    "build/",
};

std::string normalize_path(const std::string& path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    return normalized;
}

bool should_ignore(const std::string& path, const std::vector<std::string>& patterns) {
    std::string normalized = normalize_path(path);
    for (const auto& pattern : patterns) {
        if (pattern.empty()) continue;
        if (pattern.back() == '/') {
            std::string stripped = pattern;
            while (!stripped.empty() && stripped.back() == '/') stripped.pop_back();
            if (normalized.find(stripped) != std::string::npos || starts_with(normalized, pattern)) {
                return true;
            }
        } else if (fnmatch(pattern.c_str(), normalized.c_str(), 0) == 0 ||
                   normalized.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool should_ignore(const std::string& path) {
    return should_ignore(path, IGNORED_PATTERNS);
}
