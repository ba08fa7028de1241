#pragma once

#include "git_repository.hpp"
#include "git_utils.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ReportRequest {
    std::string diff;
    std::string analysis_md;
    DiffScope scope;
    std::string model;
    std::string lang = "auto";
    std::string theme = "dark";
    std::string cwd;
};

struct ReportData {
    std::string scope_label;
    std::string repo_name;
    std::optional<CommitInfo> commit_info;
    std::string analysis_html;
    std::vector<FileStat> file_stats;
    std::vector<std::pair<std::string, int>> ext_counts;
    std::string diff;
    std::string model;
    std::string lang;
    std::string theme;
    std::string version;
    std::string generated_at;
    long total_added = 0;
    long total_deleted = 0;
};

constexpr std::size_t MAX_EXTENSIONS = 12;
extern const std::string CHART_JS_URL;
extern const std::string CHART_JS_STUB;

std::string html_escape(const std::string& text);
std::string markdown_to_html(const std::string& markdown_text);

std::string scope_label(const DiffScope& scope);
// Extension of the last path component, "(no ext)" when there is none.
std::string file_extension(const std::string& path);
// Most common extensions first; ties keep first-seen order.
std::vector<std::pair<std::string, int>> count_extensions(const std::vector<FileStat>& stats, std::size_t limit = MAX_EXTENSIONS);

ReportData build_report_data(const ReportRequest& request, GitUtils& git, const GitRepository& repo);
std::string render_report(const ReportData& data, const std::string& chart_js);

// Chart.js bundle for inlining, or CHART_JS_STUB when it cannot be fetched.
std::string fetch_chart_js();
void open_in_browser(const std::filesystem::path& path);

// Renders data with chart_js inlined and writes one self-contained file.
std::filesystem::path write_report(const std::filesystem::path& report_path, const ReportData& data,
                                   const std::string& chart_js, bool auto_open);
