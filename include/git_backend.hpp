#pragma once

#include "process.hpp"
#include <chrono>
#include <string>
#include <vector>

using GitResult = ProcessResult;

constexpr std::chrono::seconds GIT_TIMEOUT{30};

// Runs one git invocation. Implementations must not throw for ordinary
// failures; they report them through the returned status and exit code.
class GitBackend {
public:
    virtual ~GitBackend() = default;
    virtual GitResult run(const std::vector<std::string>& args, const std::string& cwd) = 0;
};

class ProcessGitBackend : public GitBackend {
public:
    explicit ProcessGitBackend(std::string executable = "git", std::chrono::milliseconds timeout = GIT_TIMEOUT);
    GitResult run(const std::vector<std::string>& args, const std::string& cwd) override;

private:
    std::string executable_;
    std::chrono::milliseconds timeout_;
};
