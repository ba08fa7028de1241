#include <gtest/gtest.h>
#include "diff_filter.hpp"
#include "git_utils.hpp"
#include "test_utils.hpp"

using test_utils::FakeGitBackend;
using test_utils::failedResult;
using test_utils::okResult;
using test_utils::statusResult;

namespace {

const std::vector<std::string> REV_PARSE = {"rev-parse", "--is-inside-work-tree"};
const std::vector<std::string> WORKING_DIFF = {"diff", "--no-color"};
const std::vector<std::string> STAGED_DIFF = {"diff", "--no-color", "--cached"};
const std::vector<std::string> HEAD_SHOW = {"show", "HEAD", "--format=", "--no-color", "--"};

const std::string SAMPLE_DIFF =
    "diff --git a/main.cpp b/main.cpp\n"
    "--- a/main.cpp\n"
    "+++ b/main.cpp\n"
    "@@ -1 +1 @@\n"
    "-int x = 1;\n"
    "+int x = 2;";

const std::string HEAD_DIFF =
    "diff --git a/README.md b/README.md\n"
    "--- a/README.md\n"
    "+++ b/README.md\n"
    "@@ -1 +1 @@\n"
    "-old\n"
    "+new";

}

class GitUtilsTest : public ::testing::Test {
protected:
    FakeGitBackend backend;
    GitUtils git{backend};
};

TEST(DiffScopeTest, FromOptions) {
    EXPECT_EQ(DiffScope::from_options(false, std::nullopt), DiffScope::working_tree());
    EXPECT_EQ(DiffScope::from_options(true, std::nullopt), DiffScope::staged());
    EXPECT_EQ(DiffScope::from_options(false, std::string("HEAD~1")), DiffScope::revision("HEAD~1"));
    // An explicit ref wins over --staged.
    EXPECT_EQ(DiffScope::from_options(true, std::string("v1.0")), DiffScope::revision("v1.0"));
    EXPECT_EQ(DiffScope::from_options(true, std::string("")), DiffScope::staged());
}

TEST_F(GitUtilsTest, OutsideRepositoryGivesEmptyDiff) {
    backend.respond(REV_PARSE, failedResult(128, "fatal: not a git repository"));

    EXPECT_EQ(git.get_diff(DiffScope::working_tree(), "/tmp"), "");
    ASSERT_EQ(backend.calls.size(), 1u);
    EXPECT_EQ(backend.cwds[0], "/tmp");
}

TEST_F(GitUtilsTest, RevParseWithoutTrueIsNotRepository) {
    backend.respond(REV_PARSE, okResult("false"));
    EXPECT_FALSE(git.is_git_repo("/repo"));
    EXPECT_EQ(git.get_diff(DiffScope::staged(), "/repo"), "");
}

TEST_F(GitUtilsTest, ArgumentsPerScope) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, okResult(SAMPLE_DIFF));
    backend.respond(STAGED_DIFF, okResult(SAMPLE_DIFF));
    backend.respond({"show", "abc123", "--format=", "--no-color", "--"}, okResult(SAMPLE_DIFF));

    EXPECT_EQ(git.get_diff(DiffScope::working_tree(), "/repo"), SAMPLE_DIFF);
    EXPECT_EQ(git.get_diff(DiffScope::staged(), "/repo"), SAMPLE_DIFF);
    EXPECT_EQ(git.get_diff(DiffScope::revision("abc123"), "/repo"), SAMPLE_DIFF);

    ASSERT_EQ(backend.calls.size(), 6u);
    EXPECT_EQ(backend.calls[1], WORKING_DIFF);
    EXPECT_EQ(backend.calls[3], STAGED_DIFF);
    EXPECT_EQ(backend.calls[5], (std::vector<std::string>{"show", "abc123", "--format=", "--no-color", "--"}));
}

TEST_F(GitUtilsTest, IgnoredFilesAreFiltered) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, okResult("diff --git a/yarn.lock b/yarn.lock\n+lock\n" + SAMPLE_DIFF));

    EXPECT_EQ(git.get_diff(DiffScope::working_tree(), "/repo"), SAMPLE_DIFF);
}

TEST_F(GitUtilsTest, FailureUsesStderr) {
    backend.inRepository();
    backend.respond(HEAD_SHOW, failedResult(128, "fatal: bad revision 'HEAD'", "ignored"));

    try {
        git.get_diff(DiffScope::revision("HEAD"), "/repo");
        FAIL() << "Expected GitError";
    } catch (const GitError& e) {
        EXPECT_STREQ(e.what(), "fatal: bad revision 'HEAD'");
        EXPECT_EQ(e.exit_code(), 128);
    }
}

TEST_F(GitUtilsTest, FailureFallsBackToStdoutThenGenericMessage) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, failedResult(2, "", "usage: git diff"));
    backend.respond(STAGED_DIFF, failedResult(3, ""));

    try {
        git.get_diff(DiffScope::working_tree(), "/repo");
        FAIL() << "Expected GitError";
    } catch (const GitError& e) {
        EXPECT_STREQ(e.what(), "usage: git diff");
        EXPECT_EQ(e.exit_code(), 2);
    }
    try {
        git.get_diff(DiffScope::staged(), "/repo");
        FAIL() << "Expected GitError";
    } catch (const GitError& e) {
        EXPECT_STREQ(e.what(), "Unknown git error");
        EXPECT_EQ(e.exit_code(), 3);
    }
}

TEST_F(GitUtilsTest, MissingGitExecutable) {
    backend.respond(REV_PARSE, statusResult(GitResult::Status::NotFound));

    try {
        git.get_diff(DiffScope::working_tree(), "/repo");
        FAIL() << "Expected GitError";
    } catch (const GitError& e) {
        EXPECT_STREQ(e.what(), "Git not found. Install Git.");
        EXPECT_EQ(e.exit_code(), 127);
    }
}

TEST_F(GitUtilsTest, TimedOutCommand) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, statusResult(GitResult::Status::TimedOut));

    try {
        git.get_diff(DiffScope::working_tree(), "/repo");
        FAIL() << "Expected GitError";
    } catch (const GitError& e) {
        EXPECT_STREQ(e.what(), "Git command timed out.");
        EXPECT_EQ(e.exit_code(), -1);
    }
}

TEST_F(GitUtilsTest, DiffForModelIsTruncated) {
    std::string big = "diff --git a/big.txt b/big.txt\n" + std::string(MAX_DIFF_CHARS + 100, '+');
    backend.inRepository();
    backend.respond(WORKING_DIFF, okResult(big));

    std::string result = git.get_diff_for_llm(DiffScope::working_tree(), "/repo");
    EXPECT_EQ(result, truncate_diff(big));
    EXPECT_NE(result.find(TRUNCATION_MARKER), std::string::npos);
}

TEST_F(GitUtilsTest, CleanWorkingTreeFallsBackToHead) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, okResult(""));
    backend.respond(HEAD_SHOW, okResult(HEAD_DIFF));

    DiffSelection selection = git.get_diff_with_fallback(DiffScope::working_tree(), "/repo");
    EXPECT_TRUE(selection.analyzing_last_commit);
    EXPECT_EQ(selection.diff, git.get_diff_for_llm(DiffScope::revision("HEAD"), "/repo"));
}

TEST_F(GitUtilsTest, WhitespaceOnlyDiffCountsAsEmpty) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, okResult("\n  \n"));
    backend.respond(HEAD_SHOW, okResult(HEAD_DIFF));

    DiffSelection selection = git.get_diff_with_fallback(DiffScope::working_tree(), "/repo");
    EXPECT_TRUE(selection.analyzing_last_commit);
    EXPECT_EQ(selection.diff, HEAD_DIFF);
}

TEST_F(GitUtilsTest, FallbackCanBeDisabled) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, okResult(""));
    backend.respond(HEAD_SHOW, okResult(HEAD_DIFF));

    DiffSelection selection = git.get_diff_with_fallback(DiffScope::working_tree(), "/repo", false);
    EXPECT_FALSE(selection.analyzing_last_commit);
    EXPECT_EQ(selection.diff, "");
}

TEST_F(GitUtilsTest, FallbackErrorsAreSwallowed) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, okResult(""));
    backend.respond(HEAD_SHOW, failedResult(128, "fatal: ambiguous argument 'HEAD'"));

    DiffSelection selection;
    EXPECT_NO_THROW(selection = git.get_diff_with_fallback(DiffScope::working_tree(), "/repo"));
    EXPECT_FALSE(selection.analyzing_last_commit);
    EXPECT_EQ(selection.diff, "");
}

TEST_F(GitUtilsTest, EmptyHeadKeepsOriginalSelection) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, okResult(""));
    backend.respond(HEAD_SHOW, okResult(""));

    DiffSelection selection = git.get_diff_with_fallback(DiffScope::working_tree(), "/repo");
    EXPECT_FALSE(selection.analyzing_last_commit);
    EXPECT_EQ(selection.diff, "");
}

TEST_F(GitUtilsTest, NoFallbackForStagedOrRevision) {
    backend.inRepository();
    backend.respond(STAGED_DIFF, okResult(""));
    backend.respond({"show", "v2", "--format=", "--no-color", "--"}, okResult(""));
    backend.respond(HEAD_SHOW, okResult(HEAD_DIFF));

    DiffSelection staged = git.get_diff_with_fallback(DiffScope::staged(), "/repo");
    DiffSelection revision = git.get_diff_with_fallback(DiffScope::revision("v2"), "/repo");

    EXPECT_FALSE(staged.analyzing_last_commit);
    EXPECT_EQ(staged.diff, "");
    EXPECT_FALSE(revision.analyzing_last_commit);
    EXPECT_EQ(revision.diff, "");
    for (const auto& call : backend.calls) {
        EXPECT_NE(call, HEAD_SHOW);
    }
}

TEST_F(GitUtilsTest, NonEmptyWorkingTreeDoesNotFallBack) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, okResult(SAMPLE_DIFF));

    DiffSelection selection = git.get_diff_with_fallback(DiffScope::working_tree(), "/repo");
    EXPECT_FALSE(selection.analyzing_last_commit);
    EXPECT_EQ(selection.diff, SAMPLE_DIFF);
}

TEST_F(GitUtilsTest, ErrorsFromPrimaryScopePropagate) {
    backend.inRepository();
    backend.respond(WORKING_DIFF, failedResult(129, "error: unknown option"));

    EXPECT_THROW(git.get_diff_with_fallback(DiffScope::working_tree(), "/repo"), GitError);
}

TEST(ParseNumstatTest, CountsAndBinaryFiles) {
    std::vector<FileStat> stats = GitUtils::parse_numstat("10\t2\tsrc/main.cpp\n-\t-\tassets/logo.png\n0\t7\tREADME.md\n");

    ASSERT_EQ(stats.size(), 3u);
    EXPECT_EQ(stats[0], (FileStat{"src/main.cpp", 10, 2}));
    EXPECT_EQ(stats[1], (FileStat{"assets/logo.png", 0, 0}));
    EXPECT_EQ(stats[2], (FileStat{"README.md", 0, 7}));
}

TEST(ParseNumstatTest, ShortRecordsAreDropped) {
    std::vector<FileStat> stats = GitUtils::parse_numstat("5\tsrc/a.cpp\n\n3\t1\tsrc/b.cpp");

    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].path, "src/b.cpp");
}

TEST(ParseNumstatTest, MalformedCountsAreSkipped) {
    std::vector<FileStat> stats = GitUtils::parse_numstat("x\t1\ta.cpp\n1\t-4\tb.cpp\n2\t2\tc.cpp\n");

    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0], (FileStat{"c.cpp", 2, 2}));
}

TEST(ParseNumstatTest, IgnoredPathsAreOmitted) {
    std::vector<FileStat> stats = GitUtils::parse_numstat("100\t50\tpackage-lock.json\n1\t1\tnode_modules/x/index.js\n4\t0\tapp.py\n");

    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].path, "app.py");
}

TEST(ParseNumstatTest, PathsAreNormalized) {
    std::vector<FileStat> stats = GitUtils::parse_numstat("1\t0\tsrc\\win\\file.cpp\n");

    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].path, "src/win/file.cpp");
}

TEST_F(GitUtilsTest, NumstatArgumentsPerScope) {
    backend.respond({"diff", "--numstat"}, okResult("1\t1\ta.cpp"));
    backend.respond({"diff", "--numstat", "--cached"}, okResult("2\t2\tb.cpp"));
    backend.respond({"show", "HEAD", "--numstat", "--format="}, okResult("3\t3\tc.cpp"));

    EXPECT_EQ(git.get_diff_numstat(DiffScope::working_tree(), "/repo"), (std::vector<FileStat>{{"a.cpp", 1, 1}}));
    EXPECT_EQ(git.get_diff_numstat(DiffScope::staged(), "/repo"), (std::vector<FileStat>{{"b.cpp", 2, 2}}));
    EXPECT_EQ(git.get_diff_numstat(DiffScope::revision("HEAD"), "/repo"), (std::vector<FileStat>{{"c.cpp", 3, 3}}));
}

TEST_F(GitUtilsTest, NumstatFailureGivesEmptyList) {
    backend.respond({"diff", "--numstat"}, failedResult(128, "fatal: not a git repository"));
    backend.respond({"diff", "--numstat", "--cached"}, statusResult(GitResult::Status::TimedOut));

    EXPECT_TRUE(git.get_diff_numstat(DiffScope::working_tree(), "/repo").empty());
    EXPECT_TRUE(git.get_diff_numstat(DiffScope::staged(), "/repo").empty());
}
