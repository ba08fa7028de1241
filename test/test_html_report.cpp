#include <gtest/gtest.h>
#include "html_report.hpp"
#include "test_utils.hpp"

using test_utils::FakeGitBackend;
using test_utils::okResult;

TEST(HtmlEscapeTest, SpecialCharacters) {
    EXPECT_EQ(html_escape("<a href=\"x\">Tom & Jerry's</a>"),
              "&lt;a href=&quot;x&quot;&gt;Tom &amp; Jerry&#x27;s&lt;/a&gt;");
    EXPECT_EQ(html_escape("plain"), "plain");
}

TEST(MarkdownTest, HeadingsAndLists) {
    std::string html = markdown_to_html("## Summary\n- one\n- **two**\n\n1. first\n2. `second`");

    EXPECT_EQ(html,
        "<h2>Summary</h2>\n"
        "<ul>\n<li>one</li>\n<li><strong>two</strong></li>\n</ul>\n"
        "<ol>\n<li>first</li>\n<li><code>second</code></li>\n</ol>\n");
}

TEST(MarkdownTest, ParagraphLinesAreJoinedWithBreaks) {
    EXPECT_EQ(markdown_to_html("first line\nsecond *line*\n\nnext"),
              "<p>first line<br />\nsecond <em>line</em></p>\n<p>next</p>\n");
}

TEST(MarkdownTest, FencedCodeIsEscaped) {
    EXPECT_EQ(markdown_to_html("```cpp\nif (a < b) {}\n```"),
              "<pre><code>if (a &lt; b) {}\n</code></pre>\n");
    // An unterminated fence still renders.
    EXPECT_EQ(markdown_to_html("```\nx"), "<pre><code>x\n</code></pre>\n");
}

TEST(MarkdownTest, LinksAndRawHtml) {
    EXPECT_EQ(markdown_to_html("See [docs](https://example.com/a?b=1&c=2)"),
              "<p>See <a href=\"https://example.com/a?b=1&amp;c=2\">docs</a></p>\n");
    EXPECT_EQ(markdown_to_html("<script>alert(1)</script>"),
              "<p>&lt;script&gt;alert(1)&lt;/script&gt;</p>\n");
}

TEST(MarkdownTest, HashWithoutSpaceIsText) {
    EXPECT_EQ(markdown_to_html("#hashtag"), "<p>#hashtag</p>\n");
}

TEST(ReportHelpersTest, ScopeLabels) {
    EXPECT_EQ(scope_label(DiffScope::working_tree()), "Working tree changes");
    EXPECT_EQ(scope_label(DiffScope::staged()), "Staged changes");
    EXPECT_EQ(scope_label(DiffScope::revision("HEAD~2")), "Commit HEAD~2");
}

TEST(ReportHelpersTest, FileExtensions) {
    EXPECT_EQ(file_extension("src/main.cpp"), ".cpp");
    EXPECT_EQ(file_extension("archive.tar.gz"), ".gz");
    EXPECT_EQ(file_extension("Makefile"), "(no ext)");
    EXPECT_EQ(file_extension("config/.gitignore"), "(no ext)");
    EXPECT_EQ(file_extension("weird."), "(no ext)");
    EXPECT_EQ(file_extension("dir.d/README"), "(no ext)");
}

TEST(ReportHelpersTest, ExtensionCountsAreSortedAndLimited) {
    std::vector<FileStat> stats = {
        {"a.py", 1, 0}, {"b.cpp", 1, 0}, {"c.cpp", 1, 0}, {"d.md", 1, 0}, {"e.py", 1, 0}, {"f.cpp", 1, 0}
    };

    auto counts = count_extensions(stats);
    ASSERT_EQ(counts.size(), 3u);
    EXPECT_EQ(counts[0], (std::pair<std::string, int>{".cpp", 3}));
    EXPECT_EQ(counts[1], (std::pair<std::string, int>{".py", 2}));
    EXPECT_EQ(counts[2], (std::pair<std::string, int>{".md", 1}));

    EXPECT_EQ(count_extensions(stats, 2).size(), 2u);
    EXPECT_TRUE(count_extensions({}).empty());
}

namespace {

ReportData sampleData() {
    ReportData data;
    data.scope_label = "Commit HEAD";
    data.repo_name = "widgets";
    data.analysis_html = "<p>Looks fine</p>\n";
    data.file_stats = {{"src/main.cpp", 12, 3}, {"docs/guide.md", 4, 0}};
    data.ext_counts = count_extensions(data.file_stats);
    data.total_added = 16;
    data.total_deleted = 3;
    data.diff = "diff --git a/src/main.cpp b/src/main.cpp\n+if (a < b) {}\n+// </script>";
    data.model = "llama3";
    data.lang = "en";
    data.theme = "light";
    data.version = "1.2.3";
    data.generated_at = "2024-01-01 00:00 UTC";
    return data;
}

}

TEST(RenderReportTest, ContainsSectionsAndStats) {
    std::string html = render_report(sampleData(), CHART_JS_STUB);

    EXPECT_NE(html.find("<body class=\"theme-light\">"), std::string::npos);
    EXPECT_NE(html.find("Commit HEAD · widgets"), std::string::npos);
    EXPECT_NE(html.find("<span class=\"n\">2</span><span class=\"l\">Files</span>"), std::string::npos);
    EXPECT_NE(html.find("+16"), std::string::npos);
    EXPECT_NE(html.find("<span class=\"n\">13</span><span class=\"l\">Net</span>"), std::string::npos);
    EXPECT_NE(html.find("<p>Looks fine</p>"), std::string::npos);
    EXPECT_NE(html.find("docs/guide.md"), std::string::npos);
    EXPECT_NE(html.find("By extension"), std::string::npos);
    EXPECT_NE(html.find(CHART_JS_STUB), std::string::npos);
    EXPECT_NE(html.find("Generated by Smart Diff · 1.2.3"), std::string::npos);
    // No commit metadata was given.
    EXPECT_EQ(html.find("<h2>Commit</h2>"), std::string::npos);
}

TEST(RenderReportTest, DiffIsEscaped) {
    std::string html = render_report(sampleData(), CHART_JS_STUB);

    EXPECT_NE(html.find("+if (a &lt; b) {}"), std::string::npos);
    EXPECT_NE(html.find("+// &lt;/script&gt;"), std::string::npos);
}

TEST(RenderReportTest, ChartDataIsEmbedded) {
    std::string html = render_report(sampleData(), CHART_JS_STUB);

    EXPECT_NE(html.find("<script type=\"application/json\" id=\"report-data\">"), std::string::npos);
    EXPECT_NE(html.find("\"path\":\"src/main.cpp\""), std::string::npos);
    EXPECT_NE(html.find("\"total_added\":16"), std::string::npos);
    EXPECT_NE(html.find("\"ext_labels\":[\".cpp\",\".md\"]"), std::string::npos);
}

TEST(RenderReportTest, InlineScriptCannotCloseElement) {
    std::string html = render_report(sampleData(), "var s = '</script><b>';");

    EXPECT_NE(html.find("var s = '<\\/script><b>';"), std::string::npos);
    EXPECT_EQ(html.find("'</script>"), std::string::npos);
}

TEST(RenderReportTest, ClosingTagInAnyCaseIsEscaped) {
    ReportData data = sampleData();
    data.file_stats.push_back({"x</SCRIPT><img src=x onerror=alert(1)>/y.js", 1, 0});
    data.ext_counts = count_extensions(data.file_stats);

    std::string html = render_report(data, "var s = '</Script>';");
    EXPECT_EQ(html.find("</SCRIPT>"), std::string::npos);
    EXPECT_EQ(html.find("</Script>"), std::string::npos);
    EXPECT_NE(html.find("x<\\/SCRIPT>"), std::string::npos);
    EXPECT_NE(html.find("var s = '<\\/Script>';"), std::string::npos);
    // The path is still shown, escaped, in the file table.
    EXPECT_NE(html.find("x&lt;/SCRIPT&gt;&lt;img"), std::string::npos);
}

TEST(RenderReportTest, CommitSection) {
    ReportData data = sampleData();
    CommitInfo info;
    info.hash = "0123456789ab";
    info.author = "Ann <ann@example.com>";
    info.date = "2024-03-05 10:20:30 +0300";
    info.subject = "Add entry point";
    info.body = "Details & more";
    data.commit_info = info;

    std::string html = render_report(data, CHART_JS_STUB);
    EXPECT_NE(html.find("<h2>Commit</h2>"), std::string::npos);
    EXPECT_NE(html.find("0123456789ab"), std::string::npos);
    EXPECT_NE(html.find("Ann &lt;ann@example.com&gt;"), std::string::npos);
    EXPECT_NE(html.find("Details &amp; more"), std::string::npos);
}

TEST(RenderReportTest, NoFilesMeansNoCharts) {
    ReportData data = sampleData();
    data.file_stats.clear();
    data.ext_counts.clear();
    data.total_added = 0;
    data.total_deleted = 0;

    std::string html = render_report(data, CHART_JS_STUB);
    EXPECT_EQ(html.find("<canvas"), std::string::npos);
    EXPECT_NE(html.find("<h2>Diff</h2>"), std::string::npos);
}

TEST(BuildReportDataTest, WorkingTreeOutsideRepository) {
    auto dir = test_utils::createTempDir();
    FakeGitBackend backend;
    backend.respond({"diff", "--numstat"}, okResult("3\t1\tsrc/a.cpp\n-\t-\timg.png\n5\t5\tyarn.lock"));
    GitUtils git(backend);
    GitRepository repo;

    ReportRequest request;
    request.diff = "diff --git a/src/a.cpp b/src/a.cpp";
    request.analysis_md = "## Summary";
    request.scope = DiffScope::working_tree();
    request.model = "llama3";
    request.theme = "neon";
    request.cwd = dir.string();

    ReportData data = build_report_data(request, git, repo);
    EXPECT_EQ(data.scope_label, "Working tree changes");
    EXPECT_FALSE(data.commit_info.has_value());
    ASSERT_EQ(data.file_stats.size(), 2u);
    EXPECT_EQ(data.total_added, 3);
    EXPECT_EQ(data.total_deleted, 1);
    EXPECT_EQ(data.analysis_html, "<h2>Summary</h2>\n");
    EXPECT_EQ(data.theme, "dark");
    EXPECT_EQ(data.model, "llama3");
    EXPECT_FALSE(data.version.empty());
    EXPECT_FALSE(data.generated_at.empty());
    ASSERT_EQ(backend.calls.size(), 1u);
    EXPECT_EQ(backend.cwds[0], dir.string());

    test_utils::removeDir(dir);
}

TEST(BuildReportDataTest, RevisionCarriesCommitMetadata) {
    if (!test_utils::gitAvailable()) {
        GTEST_SKIP() << "git is not installed";
    }
    auto dir = test_utils::createTempDir() / "widgets";
    std::filesystem::create_directories(dir);
    test_utils::initGitRepo(dir);
    test_utils::createFile(dir, "a.txt", "a\n");
    test_utils::git(dir, {"add", "."});
    test_utils::git(dir, {"commit", "-q", "-m", "Initial import"});

    ProcessGitBackend backend;
    GitUtils git(backend);
    GitRepository repo;
    ReportRequest request;
    request.scope = DiffScope::revision("HEAD");
    request.cwd = dir.string();

    ReportData data = build_report_data(request, git, repo);
    ASSERT_TRUE(data.commit_info.has_value());
    EXPECT_EQ(data.commit_info->subject, "Initial import");
    EXPECT_EQ(data.repo_name, "widgets");
    ASSERT_EQ(data.file_stats.size(), 1u);
    EXPECT_EQ(data.file_stats[0], (FileStat{"a.txt", 1, 0}));

    test_utils::removeDir(dir.parent_path());
}

TEST(WriteReportTest, WritesOneSelfContainedFile) {
    auto dir = test_utils::createTempDir();
    ReportData data = sampleData();

    std::filesystem::path written = write_report(dir / "reports" / "report.html", data, CHART_JS_STUB, false);
    EXPECT_TRUE(written.is_absolute());
    ASSERT_TRUE(std::filesystem::exists(written));

    std::string html = test_utils::readFile(written);
    EXPECT_EQ(html.rfind("<!DOCTYPE html>", 0), 0u);
    EXPECT_NE(html.find("id=\"report-data\""), std::string::npos);
    EXPECT_NE(html.find(CHART_JS_STUB), std::string::npos);
    EXPECT_EQ(html.find("<script src="), std::string::npos);

    test_utils::removeDir(dir);
}
