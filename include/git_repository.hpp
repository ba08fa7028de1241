#pragma once

#include <optional>
#include <string>

struct CommitInfo {
    std::string hash;       // abbreviated to 12 characters
    std::string hash_full;
    std::string author;
    std::string email;
    std::string date;       // "YYYY-MM-DD HH:MM:SS +HHMM"
    std::string subject;
    std::string body;
};

// Read-only access to repository metadata through libgit2.
class GitRepository {
public:
    GitRepository();
    ~GitRepository();

    GitRepository(const GitRepository&) = delete;
    GitRepository& operator=(const GitRepository&) = delete;

    // Work tree root containing dir, or "" when dir is not in a repository.
    std::string get_repo_root(const std::string& dir) const;

    std::optional<CommitInfo> get_commit_info(const std::string& ref, const std::string& dir) const;
};
