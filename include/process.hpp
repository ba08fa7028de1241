#pragma once

#include <chrono>
#include <string>
#include <vector>

struct ProcessResult {
    enum class Status {
        Exited,
        TimedOut,
        NotFound,
        SpawnFailed
    };

    Status status = Status::Exited;
    std::string out;
    std::string err;
    int exit_code = -1;
};

// Runs argv[0] (looked up in PATH) in cwd, or in the current directory when
// cwd is empty. The child is killed once timeout elapses.
ProcessResult run_process(const std::vector<std::string>& argv, const std::string& cwd, std::chrono::milliseconds timeout);
