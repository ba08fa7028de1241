#include "html_report.hpp"
#include "curl_request.hpp"
#include "process.hpp"
#include "text_utils.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#ifndef SMARTDIFF_VERSION
#define SMARTDIFF_VERSION "dev"
#endif

const std::string CHART_JS_URL = "https://cdn.jsdelivr.net/npm/chart.js@4.4.1/dist/chart.umd.min.js";
const std::string CHART_JS_STUB = "/* Chart.js load failed */ window.Chart = undefined;";

namespace {

const std::vector<std::string> EXT_COLORS = {
    "rgba(99, 102, 241, 0.8)",
    "rgba(16, 185, 129, 0.8)",
    "rgba(244, 63, 94, 0.8)",
    "rgba(234, 179, 8, 0.8)",
    "rgba(168, 85, 247, 0.8)",
    "rgba(6, 182, 212, 0.8)",
    "rgba(249, 115, 22, 0.8)",
    "rgba(132, 204, 22, 0.8)",
    "rgba(236, 72, 153, 0.8)",
    "rgba(20, 184, 166, 0.8)",
    "rgba(99, 102, 241, 0.6)",
    "rgba(244, 63, 94, 0.6)",
};

const char* REPORT_CSS = R"CSS(
* { box-sizing: border-box; }
body.theme-light { --bg: #f8fafc; --fg: #1e293b; --card: #ffffff; --border: #e2e8f0; --muted: #64748b; --row: #f1f5f9; --code-bg: #e2e8f0; --code-fg: #701a75; }
body.theme-dark { --bg: #0b1120; --fg: #e2e8f0; --card: #111827; --border: #1f2937; --muted: #94a3b8; --row: #1f2937; --code-bg: #1f2937; --code-fg: #f0abfc; }
body { margin: 0; font-family: system-ui, -apple-system, Segoe UI, sans-serif; background: var(--bg); color: var(--fg); line-height: 1.5; }
.report-wrap { max-width: 64rem; margin: 0 auto; padding: 2rem 1rem; }
.gradient-head { background: linear-gradient(135deg, #6366f1 0%, #8b5cf6 50%, #a855f7 100%); border-radius: 1rem; padding: 2rem; margin-bottom: 2rem; color: #fff; }
.gradient-head h1 { margin: 0; font-size: 1.875rem; }
.gradient-head .sub { margin-top: 0.5rem; font-size: 1.125rem; opacity: 0.9; }
.gradient-head .meta { margin-top: 1rem; font-size: 0.875rem; opacity: 0.8; }
.stats-row { display: grid; grid-template-columns: repeat(4, 1fr); gap: 0.75rem; margin-top: 1rem; }
.stat-box { background: rgba(255,255,255,0.15); border-radius: 0.5rem; padding: 0.75rem; text-align: center; }
.stat-box .n { font-size: 1.25rem; font-weight: 700; display: block; }
.stat-box .l { font-size: 0.7rem; text-transform: uppercase; letter-spacing: 0.05em; }
.stat-box.add .n { color: #6ee7b7; }
.stat-box.del .n { color: #fda4af; }
.section { margin-bottom: 2rem; }
.section h2 { font-size: 1.25rem; margin: 0 0 0.75rem 0; }
.card { background: var(--card); border: 1px solid var(--border); border-radius: 0.75rem; padding: 1.5rem; }
.grid-2-1 { display: grid; gap: 1.5rem; grid-template-columns: 2fr 1fr; }
table { width: 100%; font-size: 0.875rem; border-collapse: collapse; }
th, td { padding: 0.6rem 1rem; text-align: left; border-bottom: 1px solid var(--row); }
th { font-weight: 600; color: var(--muted); font-size: 0.8rem; }
.label { color: var(--muted); width: 5rem; }
.text-right { text-align: right; }
.add-num { color: #059669; }
.del-num { color: #e11d48; }
.font-mono { font-family: ui-monospace, monospace; }
.prose a { color: #6366f1; }
.prose pre { background: #1e1e2e; color: #cdd6f4; padding: 1rem; border-radius: 0.5rem; overflow-x: auto; font-size: 0.8rem; }
.prose code { background: var(--code-bg); color: var(--code-fg); padding: 0.15rem 0.35rem; border-radius: 0.25rem; font-size: 0.85em; }
.prose pre code { background: none; color: inherit; padding: 0; }
.diff-block { background: #0f172a; color: #cbd5e1; padding: 1rem; border-radius: 0.75rem; overflow: auto; max-height: 24rem; font-size: 0.85rem; font-family: ui-monospace, monospace; white-space: pre; margin: 0; }
.chart-wrap { position: relative; min-height: 220px; }
.footer { text-align: center; color: var(--muted); font-size: 0.875rem; padding-top: 2rem; }
@keyframes sd-fade { from { opacity: 0; transform: translateY(8px); } to { opacity: 1; transform: translateY(0); } }
.section { animation: sd-fade 0.5s ease-out both; }
@media (max-width: 900px) { .grid-2-1 { grid-template-columns: 1fr; } .stats-row { grid-template-columns: repeat(2, 1fr); } }
)CSS";

const char* CHART_SCRIPT = R"JS(
(function(){
  if (typeof Chart === 'undefined') return;
  var data = JSON.parse(document.getElementById('report-data').textContent);
  var files = data.files;
  var labels = files.map(function(f){ return f.path.split('/').pop() || f.path; });
  var opts = { responsive: true, maintainAspectRatio: false, animation: { duration: 1000 } };
  function make(id, config) {
    var el = document.getElementById(id);
    if (el) new Chart(el, config);
  }
  make('chartFiles', { type: 'bar', data: { labels: labels, datasets: [
    { label: 'Added', data: files.map(function(f){ return f.added; }), backgroundColor: 'rgba(16, 185, 129, 0.7)' },
    { label: 'Deleted', data: files.map(function(f){ return f.deleted; }), backgroundColor: 'rgba(244, 63, 94, 0.7)' }
  ]}, options: Object.assign({}, opts, { indexAxis: 'y', scales: { x: { stacked: true }, y: { stacked: true } } }) });
  make('chartLines', { type: 'doughnut', data: { labels: ['Lines added', 'Lines deleted'], datasets: [
    { data: [data.total_added, data.total_deleted], backgroundColor: ['rgba(16, 185, 129, 0.8)', 'rgba(244, 63, 94, 0.8)'], borderWidth: 0 }
  ]}, options: Object.assign({}, opts, { plugins: { legend: { position: 'bottom' } } }) });
  make('chartExt', { type: 'doughnut', data: { labels: data.ext_labels, datasets: [
    { data: data.ext_data, backgroundColor: data.ext_colors, borderWidth: 0 }
  ]}, options: Object.assign({}, opts, { plugins: { legend: { position: 'right' } } }) });
  var top = files.slice(0, 10);
  make('chartNet', { type: 'bar', data: { labels: top.map(function(f){ return f.path.split('/').pop() || f.path; }), datasets: [
    { label: 'Net', data: top.map(function(f){ return f.added - f.deleted; }),
      backgroundColor: top.map(function(f){ return f.added >= f.deleted ? 'rgba(16, 185, 129, 0.7)' : 'rgba(244, 63, 94, 0.7)'; }) }
  ]}, options: Object.assign({}, opts, { indexAxis: 'y', plugins: { legend: { display: false } } }) });
})();
)JS";

std::string current_utc_time() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M UTC");
    return ss.str();
}

// Keeps "</script>" in any letter case inside inline scripts from closing
// the element.
std::string escape_script(const std::string& source) {
    static const std::string CLOSING_TAG = "</script";
    std::string escaped;
    escaped.reserve(source.size());
    std::size_t i = 0;
    while (i < source.size()) {
        if (source[i] == '<' && to_lower(source.substr(i, CLOSING_TAG.size())) == CLOSING_TAG) {
            escaped += "<\\/";
            i += 2;
            continue;
        }
        escaped += source[i];
        ++i;
    }
    return escaped;
}

std::string render_inline(const std::string& text) {
    std::string html;
    std::size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '`') {
            std::size_t close = text.find('`', i + 1);
            if (close != std::string::npos) {
                html += "<code>" + html_escape(text.substr(i + 1, close - i - 1)) + "</code>";
                i = close + 1;
                continue;
            }
        }
        if ((c == '*' || c == '_') && i + 1 < text.size() && text[i + 1] == c) {
            std::string marker(2, c);
            std::size_t close = text.find(marker, i + 2);
            if (close != std::string::npos && close > i + 2) {
                html += "<strong>" + render_inline(text.substr(i + 2, close - i - 2)) + "</strong>";
                i = close + 2;
                continue;
            }
        }
        if (c == '*' && i + 1 < text.size() && text[i + 1] != ' ') {
            std::size_t close = text.find('*', i + 1);
            if (close != std::string::npos && close > i + 1) {
                html += "<em>" + render_inline(text.substr(i + 1, close - i - 1)) + "</em>";
                i = close + 1;
                continue;
            }
        }
        if (c == '[') {
            std::size_t label_end = text.find(']', i + 1);
            if (label_end != std::string::npos && label_end + 1 < text.size() && text[label_end + 1] == '(') {
                std::size_t url_end = text.find(')', label_end + 2);
                if (url_end != std::string::npos) {
                    std::string label = text.substr(i + 1, label_end - i - 1);
                    std::string url = text.substr(label_end + 2, url_end - label_end - 2);
                    html += "<a href=\"" + html_escape(url) + "\">" + render_inline(label) + "</a>";
                    i = url_end + 1;
                    continue;
                }
            }
        }
        html += html_escape(std::string(1, c));
        ++i;
    }
    return html;
}

bool is_bullet(const std::string& line, std::string& item) {
    std::string stripped = trim(line);
    if (stripped.size() >= 2 && (stripped[0] == '-' || stripped[0] == '*' || stripped[0] == '+') && stripped[1] == ' ') {
        item = trim(stripped.substr(2));
        return true;
    }
    return false;
}

bool is_numbered(const std::string& line, std::string& item) {
    std::string stripped = trim(line);
    std::size_t digits = 0;
    while (digits < stripped.size() && std::isdigit(static_cast<unsigned char>(stripped[digits]))) ++digits;
    if (digits == 0 || digits + 1 >= stripped.size()) return false;
    if ((stripped[digits] != '.' && stripped[digits] != ')') || stripped[digits + 1] != ' ') return false;
    item = trim(stripped.substr(digits + 2));
    return true;
}

}

std::string html_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#x27;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

std::string markdown_to_html(const std::string& markdown_text) {
    std::ostringstream html;
    std::istringstream stream(markdown_text);
    std::string line;
    std::vector<std::string> paragraph;
    std::string open_list;  // "", "ul" or "ol"
    bool in_code = false;
    std::string code;

    auto flush_paragraph = [&]() {
        if (paragraph.empty()) return;
        html << "<p>";
        for (std::size_t i = 0; i < paragraph.size(); ++i) {
            if (i > 0) html << "<br />\n";
            html << render_inline(paragraph[i]);
        }
        html << "</p>\n";
        paragraph.clear();
    };
    auto close_list = [&]() {
        if (open_list.empty()) return;
        html << "</" << open_list << ">\n";
        open_list.clear();
    };
    auto open_list_of = [&](const std::string& kind) {
        if (open_list == kind) return;
        close_list();
        html << "<" << kind << ">\n";
        open_list = kind;
    };

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (in_code) {
            if (starts_with(trim(line), "```")) {
                html << "<pre><code>" << html_escape(code) << "</code></pre>\n";
                code.clear();
                in_code = false;
            } else {
                code += line + "\n";
            }
            continue;
        }

        std::string stripped = trim(line);
        std::string item;
        if (starts_with(stripped, "```")) {
            flush_paragraph();
            close_list();
            in_code = true;
        } else if (stripped.empty()) {
            flush_paragraph();
            close_list();
        } else if (stripped[0] == '#') {
            std::size_t level = stripped.find_first_not_of('#');
            if (level != std::string::npos && level <= 6 && stripped[level] == ' ') {
                flush_paragraph();
                close_list();
                html << "<h" << level << ">" << render_inline(trim(stripped.substr(level))) << "</h" << level << ">\n";
            } else {
                close_list();
                paragraph.push_back(stripped);
            }
        } else if (is_bullet(line, item)) {
            flush_paragraph();
            open_list_of("ul");
            html << "<li>" << render_inline(item) << "</li>\n";
        } else if (is_numbered(line, item)) {
            flush_paragraph();
            open_list_of("ol");
            html << "<li>" << render_inline(item) << "</li>\n";
        } else {
            close_list();
            paragraph.push_back(stripped);
        }
    }
    if (in_code) {
        html << "<pre><code>" << html_escape(code) << "</code></pre>\n";
    }
    flush_paragraph();
    close_list();
    return html.str();
}

std::string scope_label(const DiffScope& scope) {
    switch (scope.kind) {
        case DiffScope::Kind::Revision:
            return "Commit " + scope.ref;
        case DiffScope::Kind::Staged:
            return "Staged changes";
        case DiffScope::Kind::WorkingTree:
            break;
    }
    return "Working tree changes";
}

std::string file_extension(const std::string& path) {
    std::size_t slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    std::size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
        return "(no ext)";
    }
    return name.substr(dot);
}

std::vector<std::pair<std::string, int>> count_extensions(const std::vector<FileStat>& stats, std::size_t limit) {
    std::vector<std::pair<std::string, int>> counts;
    for (const auto& stat : stats) {
        std::string ext = file_extension(stat.path);
        auto it = std::find_if(counts.begin(), counts.end(), [&](const auto& entry) { return entry.first == ext; });
        if (it == counts.end()) {
            counts.emplace_back(ext, 1);
        } else {
            ++it->second;
        }
    }
    std::stable_sort(counts.begin(), counts.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    if (counts.size() > limit) {
        counts.resize(limit);
    }
    return counts;
}

ReportData build_report_data(const ReportRequest& request, GitUtils& git, const GitRepository& repo) {
    ReportData data;
    if (request.scope.kind == DiffScope::Kind::Revision) {
        data.commit_info = repo.get_commit_info(request.scope.ref, request.cwd);
    } else if (request.scope.kind == DiffScope::Kind::Staged) {
        data.commit_info = repo.get_commit_info("HEAD", request.cwd);
    }

    std::string root = repo.get_repo_root(request.cwd);
    if (!root.empty()) {
        data.repo_name = std::filesystem::path(root).parent_path().filename().string();
    }

    data.scope_label = scope_label(request.scope);
    data.file_stats = git.get_diff_numstat(request.scope, request.cwd);
    for (const auto& stat : data.file_stats) {
        data.total_added += stat.added;
        data.total_deleted += stat.deleted;
    }
    data.ext_counts = count_extensions(data.file_stats);
    data.analysis_html = markdown_to_html(request.analysis_md);
    data.diff = request.diff;
    data.model = request.model;
    data.lang = request.lang;
    data.theme = request.theme == "light" ? "light" : "dark";
    data.version = SMARTDIFF_VERSION;
    data.generated_at = current_utc_time();
    return data;
}

std::string render_report(const ReportData& data, const std::string& chart_js) {
    nlohmann::json chart_data = {
        {"files", nlohmann::json::array()},
        {"total_added", data.total_added},
        {"total_deleted", data.total_deleted},
        {"ext_labels", nlohmann::json::array()},
        {"ext_data", nlohmann::json::array()},
        {"ext_colors", nlohmann::json::array()}
    };
    for (const auto& stat : data.file_stats) {
        chart_data["files"].push_back({{"path", stat.path}, {"added", stat.added}, {"deleted", stat.deleted}});
    }
    for (std::size_t i = 0; i < data.ext_counts.size(); ++i) {
        chart_data["ext_labels"].push_back(data.ext_counts[i].first);
        chart_data["ext_data"].push_back(data.ext_counts[i].second);
        chart_data["ext_colors"].push_back(EXT_COLORS[i % EXT_COLORS.size()]);
    }
    std::string chart_json = escape_script(chart_data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    std::string html_lang = data.lang == "ru" ? "ru" : "en";

    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html lang=\"" << html_lang << "\">\n<head>\n"
         << "  <meta charset=\"UTF-8\" />\n"
         << "  <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\" />\n"
         << "  <title>Smart Diff Report — " << html_escape(data.scope_label) << "</title>\n"
         << "  <style>" << REPORT_CSS << "</style>\n"
         << "</head>\n<body class=\"theme-" << data.theme << "\">\n<div class=\"report-wrap\">\n";

    html << "<header class=\"gradient-head\">\n  <h1>Smart Diff Report</h1>\n"
         << "  <p class=\"sub\">" << html_escape(data.scope_label);
    if (!data.repo_name.empty()) {
        html << " · " << html_escape(data.repo_name);
    }
    html << "</p>\n"
         << "  <p class=\"meta\">Model: <strong>" << html_escape(data.model) << "</strong> · " << data.generated_at << "</p>\n"
         << "  <div class=\"stats-row\">\n"
         << "    <div class=\"stat-box\"><span class=\"n\">" << data.file_stats.size() << "</span><span class=\"l\">Files</span></div>\n"
         << "    <div class=\"stat-box add\"><span class=\"n\">+" << data.total_added << "</span><span class=\"l\">Added</span></div>\n"
         << "    <div class=\"stat-box del\"><span class=\"n\">−" << data.total_deleted << "</span><span class=\"l\">Deleted</span></div>\n"
         << "    <div class=\"stat-box\"><span class=\"n\">" << (data.total_added - data.total_deleted) << "</span><span class=\"l\">Net</span></div>\n"
         << "  </div>\n</header>\n";

    if (data.commit_info) {
        const CommitInfo& info = *data.commit_info;
        html << "<section class=\"section\">\n  <h2>Commit</h2>\n  <div class=\"card\">\n    <table>\n"
             << "      <tr><td class=\"label\">Hash</td><td><code class=\"font-mono\">" << html_escape(info.hash) << "</code></td></tr>\n"
             << "      <tr><td class=\"label\">Author</td><td>" << html_escape(info.author) << "</td></tr>\n"
             << "      <tr><td class=\"label\">Date</td><td>" << html_escape(info.date) << "</td></tr>\n"
             << "      <tr><td class=\"label\">Subject</td><td>" << html_escape(info.subject) << "</td></tr>\n"
             << "    </table>\n";
        if (!info.body.empty()) {
            html << "    <pre style=\"white-space:pre-wrap;margin-top:1rem;\">" << html_escape(info.body) << "</pre>\n";
        }
        html << "  </div>\n</section>\n";
    }

    html << "<section class=\"section\">\n  <h2>Analysis</h2>\n  <div class=\"card prose\">\n"
         << data.analysis_html << "  </div>\n</section>\n";

    if (!data.file_stats.empty()) {
        html << "<section class=\"section\">\n  <h2>Changed files</h2>\n  <div class=\"grid-2-1\">\n"
             << "    <div class=\"card\"><table>\n"
             << "      <thead><tr><th>File</th><th class=\"text-right add-num\">+</th><th class=\"text-right del-num\">−</th></tr></thead>\n"
             << "      <tbody>\n";
        for (const auto& stat : data.file_stats) {
            html << "        <tr><td class=\"font-mono\" title=\"" << html_escape(stat.path) << "\">" << html_escape(stat.path)
                 << "</td><td class=\"text-right add-num\">" << stat.added
                 << "</td><td class=\"text-right del-num\">" << stat.deleted << "</td></tr>\n";
        }
        html << "      </tbody>\n    </table></div>\n"
             << "    <div class=\"card chart-wrap\"><canvas id=\"chartLines\"></canvas></div>\n"
             << "  </div>\n"
             << "  <div class=\"card chart-wrap\" style=\"margin-top:1rem;\"><canvas id=\"chartFiles\"></canvas></div>\n"
             << "</section>\n";
        if (!data.ext_counts.empty()) {
            html << "<section class=\"section\">\n  <h2>By extension</h2>\n"
                 << "  <div class=\"card chart-wrap\"><canvas id=\"chartExt\"></canvas></div>\n</section>\n";
        }
        html << "<section class=\"section\">\n  <h2>Net change per file (top 10)</h2>\n"
             << "  <div class=\"card chart-wrap\"><canvas id=\"chartNet\"></canvas></div>\n</section>\n";
    }

    html << "<section class=\"section\">\n  <h2>Diff</h2>\n"
         << "  <div class=\"card\"><pre class=\"diff-block\">" << html_escape(data.diff) << "</pre></div>\n</section>\n";

    html << "<footer class=\"footer\">Generated by Smart Diff · " << html_escape(data.version) << " · " << data.generated_at << "</footer>\n"
         << "</div>\n"
         << "<script type=\"application/json\" id=\"report-data\">" << chart_json << "</script>\n"
         << "<script>" << escape_script(chart_js) << "</script>\n"
         << "<script>" << CHART_SCRIPT << "</script>\n"
         << "</body>\n</html>\n";
    return html.str();
}

std::string fetch_chart_js() {
    try {
        CurlRequest request;
        request.set_url(CHART_JS_URL);
        request.set_get_method();
        request.set_timeout(15);
        request.set_user_agent("Mozilla/5.0 (compatible; SmartDiff/1.0)");
        CURLcode res = request.perform();
        if (res != CURLE_OK) {
            spdlog::debug("Failed to fetch {}: {}", CHART_JS_URL, curl_easy_strerror(res));
            return CHART_JS_STUB;
        }
        if (request.response_code() != 200 || request.body().empty()) {
            spdlog::debug("Failed to fetch {}: HTTP {}", CHART_JS_URL, request.response_code());
            return CHART_JS_STUB;
        }
        return sanitize_utf8(request.body());
    } catch (const std::runtime_error& e) {
        spdlog::debug("Failed to fetch {}: {}", CHART_JS_URL, e.what());
        return CHART_JS_STUB;
    }
}

void open_in_browser(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return;
#ifdef __APPLE__
    const std::string opener = "open";
#else
    const std::string opener = "xdg-open";
#endif
    ProcessResult result = run_process({opener, path.string()}, "", std::chrono::seconds(2));
    if (result.status != ProcessResult::Status::Exited || result.exit_code != 0) {
        spdlog::debug("Could not open {} with {}: {}", path.string(), opener, result.err);
    }
}

std::filesystem::path write_report(const std::filesystem::path& report_path, const ReportData& data, const std::string& chart_js, bool auto_open) {
    std::filesystem::path path = std::filesystem::absolute(report_path).lexically_normal();
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::string html = render_report(data, chart_js);
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write report to " + path.string());
    }
    file << html;
    file.close();
    if (!file) {
        throw std::runtime_error("Failed to write report to " + path.string());
    }
    if (auto_open) {
        open_in_browser(path);
    }
    return path;
}
