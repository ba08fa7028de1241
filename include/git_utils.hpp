#pragma once

#include "git_backend.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class GitError : public std::runtime_error {
public:
    GitError(const std::string& message, int exit_code = -1);
    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct DiffScope {
    enum class Kind {
        WorkingTree,
        Staged,
        Revision
    };

    Kind kind = Kind::WorkingTree;
    std::string ref;

    static DiffScope working_tree();
    static DiffScope staged();
    static DiffScope revision(const std::string& ref);
    // An explicit ref wins over --staged.
    static DiffScope from_options(bool staged, const std::optional<std::string>& ref);

    bool operator==(const DiffScope& other) const { return kind == other.kind && ref == other.ref; }
};

struct FileStat {
    std::string path;
    long added = 0;
    long deleted = 0;

    bool operator==(const FileStat& other) const {
        return path == other.path && added == other.added && deleted == other.deleted;
    }
};

struct DiffSelection {
    std::string diff;
    // True when the working tree was clean and HEAD was used instead.
    bool analyzing_last_commit = false;
};

class GitUtils {
public:
    explicit GitUtils(GitBackend& backend);

    bool is_git_repo(const std::string& cwd);

    // Filtered patch for the scope; empty outside a repository.
    // Throws GitError when git fails, is missing or times out.
    std::string get_diff(const DiffScope& scope, const std::string& cwd);

    // get_diff() bounded to MAX_DIFF_CHARS.
    std::string get_diff_for_llm(const DiffScope& scope, const std::string& cwd);

    // get_diff_for_llm(), retrying against HEAD when a working tree scope
    // yields nothing and auto_last_commit is set. Errors from the retry are
    // ignored.
    DiffSelection get_diff_with_fallback(const DiffScope& scope, const std::string& cwd, bool auto_last_commit = true);

    // Per-file added/deleted counts for the scope. Never throws.
    std::vector<FileStat> get_diff_numstat(const DiffScope& scope, const std::string& cwd);

    static std::vector<FileStat> parse_numstat(const std::string& output);

private:
    GitBackend& backend_;
};
