#pragma once

#include <string>
#include <vector>

// Lock files, build artifacts and vendored code that never reach the model.
extern const std::vector<std::string> IGNORED_PATTERNS;

std::string normalize_path(const std::string& path);

// Rules ending in '/' match as directory fragments anywhere in the path;
// all others match as a glob or as a plain substring.
bool should_ignore(const std::string& path, const std::vector<std::string>& patterns);
bool should_ignore(const std::string& path);
