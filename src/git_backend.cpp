#include "git_backend.hpp"
#include "text_utils.hpp"
#include <utility>

ProcessGitBackend::ProcessGitBackend(std::string executable, std::chrono::milliseconds timeout)
    : executable_(std::move(executable)), timeout_(timeout) {}

GitResult ProcessGitBackend::run(const std::vector<std::string>& args, const std::string& cwd) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(executable_);
    argv.insert(argv.end(), args.begin(), args.end());

    GitResult result = run_process(argv, cwd, timeout_);
    result.out = trim(sanitize_utf8(result.out));
    result.err = trim(sanitize_utf8(result.err));
    return result;
}
