#include "git_utils.hpp"
#include "diff_filter.hpp"
#include "exclusion.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace {

std::vector<std::string> diff_args(const DiffScope& scope) {
    switch (scope.kind) {
        case DiffScope::Kind::Revision:
            // Patch only, no commit header.
            return {"show", scope.ref, "--format=", "--no-color", "--"};
        case DiffScope::Kind::Staged:
            return {"diff", "--no-color", "--cached"};
        case DiffScope::Kind::WorkingTree:
            break;
    }
    return {"diff", "--no-color"};
}

std::vector<std::string> numstat_args(const DiffScope& scope) {
    switch (scope.kind) {
        case DiffScope::Kind::Revision:
            return {"show", scope.ref, "--numstat", "--format="};
        case DiffScope::Kind::Staged:
            return {"diff", "--numstat", "--cached"};
        case DiffScope::Kind::WorkingTree:
            break;
    }
    return {"diff", "--numstat"};
}

void throw_if_unavailable(const GitResult& result) {
    switch (result.status) {
        case GitResult::Status::TimedOut:
            throw GitError("Git command timed out.", -1);
        case GitResult::Status::NotFound:
            throw GitError("Git not found. Install Git.", 127);
        case GitResult::Status::SpawnFailed:
            throw GitError(result.err.empty() ? "Failed to run git" : result.err, result.exit_code);
        case GitResult::Status::Exited:
            break;
    }
}

bool parse_count(const std::string& field, long& value) {
    if (field == "-") {
        value = 0;
        return true;
    }
    if (field.empty()) return false;
    std::size_t consumed = 0;
    try {
        value = std::stol(field, &consumed);
    } catch (const std::exception&) {
        return false;
    }
    return consumed == field.size() && value >= 0;
}

}

GitError::GitError(const std::string& message, int exit_code)
    : std::runtime_error(message), exit_code_(exit_code) {}

DiffScope DiffScope::working_tree() {
    return DiffScope{};
}

DiffScope DiffScope::staged() {
    DiffScope scope;
    scope.kind = Kind::Staged;
    return scope;
}

DiffScope DiffScope::revision(const std::string& ref) {
    DiffScope scope;
    scope.kind = Kind::Revision;
    scope.ref = ref;
    return scope;
}

DiffScope DiffScope::from_options(bool staged, const std::optional<std::string>& ref) {
    if (ref && !ref->empty()) return revision(*ref);
    if (staged) return DiffScope::staged();
    return working_tree();
}

GitUtils::GitUtils(GitBackend& backend) : backend_(backend) {}

bool GitUtils::is_git_repo(const std::string& cwd) {
    GitResult result = backend_.run({"rev-parse", "--is-inside-work-tree"}, cwd);
    throw_if_unavailable(result);
    return result.exit_code == 0 && result.out.find("true") != std::string::npos;
}

std::string GitUtils::get_diff(const DiffScope& scope, const std::string& cwd) {
    if (!is_git_repo(cwd)) {
        spdlog::debug("'{}' is not inside a git work tree", cwd);
        return "";
    }

    GitResult result = backend_.run(diff_args(scope), cwd);
    throw_if_unavailable(result);
    if (result.exit_code != 0) {
        std::string message = !result.err.empty() ? result.err : (!result.out.empty() ? result.out : "Unknown git error");
        throw GitError(message, result.exit_code);
    }
    spdlog::debug("git returned {} bytes of diff", result.out.size());
    return filter_diff_by_ignored(result.out);
}

std::string GitUtils::get_diff_for_llm(const DiffScope& scope, const std::string& cwd) {
    return truncate_diff(get_diff(scope, cwd));
}

DiffSelection GitUtils::get_diff_with_fallback(const DiffScope& scope, const std::string& cwd, bool auto_last_commit) {
    DiffSelection selection;
    selection.diff = get_diff_for_llm(scope, cwd);
    if (!trim(selection.diff).empty() || !auto_last_commit || scope.kind != DiffScope::Kind::WorkingTree) {
        return selection;
    }

    spdlog::debug("Working tree is clean, trying the last commit");
    try {
        std::string last_commit = get_diff_for_llm(DiffScope::revision("HEAD"), cwd);
        if (!trim(last_commit).empty()) {
            selection.diff = last_commit;
            selection.analyzing_last_commit = true;
        }
    } catch (const GitError& e) {
        spdlog::debug("Last commit is not available: {}", e.what());
    }
    return selection;
}

std::vector<FileStat> GitUtils::get_diff_numstat(const DiffScope& scope, const std::string& cwd) {
    GitResult result = backend_.run(numstat_args(scope), cwd);
    if (result.status != GitResult::Status::Exited || result.exit_code != 0) {
        spdlog::debug("numstat unavailable (exit {}): {}", result.exit_code, result.err);
        return {};
    }
    return parse_numstat(result.out);
}

std::vector<FileStat> GitUtils::parse_numstat(const std::string& output) {
    std::vector<FileStat> stats;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (trim(line).empty()) continue;

        // "<added>\t<deleted>\t<path>", "-" for binary files
        std::size_t first_tab = line.find('\t');
        if (first_tab == std::string::npos) continue;
        std::size_t second_tab = line.find('\t', first_tab + 1);
        if (second_tab == std::string::npos) continue;

        FileStat stat;
        stat.path = normalize_path(trim(line.substr(second_tab + 1)));
        if (should_ignore(stat.path)) continue;
        if (!parse_count(line.substr(0, first_tab), stat.added) ||
            !parse_count(line.substr(first_tab + 1, second_tab - first_tab - 1), stat.deleted)) {
            spdlog::debug("Skipping malformed numstat record: {}", line);
            continue;
        }
        stats.push_back(stat);
    }
    return stats;
}
