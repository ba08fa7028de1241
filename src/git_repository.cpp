#include "git_repository.hpp"
#include "text_utils.hpp"
#include <git2.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace {

std::string format_signature_time(const git_time& when) {
    std::time_t local = static_cast<std::time_t>(when.time) + static_cast<std::time_t>(when.offset) * 60;
    std::tm tm{};
    gmtime_r(&local, &tm);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);
    int offset = std::abs(when.offset);
    char zone[8];
    std::snprintf(zone, sizeof(zone), "%c%02d%02d", when.offset < 0 ? '-' : '+', offset / 60, offset % 60);
    return std::string(date) + " " + zone;
}

void log_git_error(const std::string& what) {
    const git_error* err = git_error_last();
    spdlog::debug("{}: {}", what, (err && err->message) ? err->message : "unknown libgit2 error");
}

}

GitRepository::GitRepository() {
    git_libgit2_init();
}

GitRepository::~GitRepository() {
    git_libgit2_shutdown();
}

std::string GitRepository::get_repo_root(const std::string& dir) const {
    git_repository* repo = nullptr;
    int error = git_repository_open_ext(&repo, dir.empty() ? "." : dir.c_str(), 0, nullptr);
    if (error != 0) {
        return "";
    }
    const char* workdir = git_repository_workdir(repo);
    std::string result = workdir ? workdir : "";
    git_repository_free(repo);
    return result;
}

std::optional<CommitInfo> GitRepository::get_commit_info(const std::string& ref, const std::string& dir) const {
    git_repository* repo = nullptr;
    if (git_repository_open_ext(&repo, dir.empty() ? "." : dir.c_str(), 0, nullptr) != 0) {
        log_git_error("Failed to open repository");
        return std::nullopt;
    }

    git_object* object = nullptr;
    if (git_revparse_single(&object, repo, ref.c_str()) != 0) {
        log_git_error("Failed to resolve " + ref);
        git_repository_free(repo);
        return std::nullopt;
    }

    git_object* peeled = nullptr;
    int error = git_object_peel(&peeled, object, GIT_OBJECT_COMMIT);
    git_object_free(object);
    if (error != 0) {
        log_git_error(ref + " is not a commit");
        git_repository_free(repo);
        return std::nullopt;
    }

    git_commit* commit = reinterpret_cast<git_commit*>(peeled);
    CommitInfo info;
    char hash_str[GIT_OID_HEXSZ + 1];
    git_oid_tostr(hash_str, sizeof(hash_str), git_commit_id(commit));
    info.hash_full = hash_str;
    info.hash = info.hash_full.substr(0, 12);

    const git_signature* author = git_commit_author(commit);
    if (author) {
        info.author = author->name ? author->name : "";
        info.email = author->email ? author->email : "";
        info.date = format_signature_time(author->when);
    }
    const char* summary = git_commit_summary(commit);
    info.subject = summary ? summary : "";
    const char* body = git_commit_body(commit);
    info.body = body ? trim(body) : "";

    git_commit_free(commit);
    git_repository_free(repo);
    return info;
}
