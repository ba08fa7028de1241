#include "app.hpp"
#include "diff_filter.hpp"
#include "html_report.hpp"
#include "messages.hpp"
#include "spinner.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace {

const std::vector<std::string> SUBCOMMANDS = {"run", "config"};
const std::vector<std::string> TOP_LEVEL_FLAGS = {"--help", "-h", "--version", "-V"};

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

int run_commit_message(const std::string& diff, const std::string& model, const std::string& lang,
                       const RunOptions& options, AppContext& context) {
    Output& output = context.output;
    output.print_info(translate(Msg::CommitMsgGenerating, output.locale(), {{"model", model}}));

    std::string message;
    try {
        Spinner spinner(translate(Msg::ProgressCommitMsg, output.locale()), output.out(), context.show_progress);
        message = context.llm.generate_commit_message(diff, model, lang);
    } catch (const std::exception& e) {
        report_llm_error(output, e, model);
        return 1;
    }

    if (options.output_file) {
        std::ofstream file(*options.output_file, std::ios::binary);
        if (!file || !(file << message)) {
            output.print_error("Cannot write " + *options.output_file);
            return 1;
        }
        output.print_info(translate(Msg::CommitWritten, output.locale(), {{"path", *options.output_file}}));
    } else {
        output.print_commit_message(message);
    }
    return 0;
}

int run_analysis(const std::string& diff, const std::string& model, const std::string& lang, const std::string& cwd,
                 bool analyzing_last, const RunOptions& options, const Config& config, AppContext& context) {
    Output& output = context.output;
    output.print_info(translate(Msg::ModelLabel, output.locale(), {{"model", model}}));

    std::string analysis;
    try {
        Spinner spinner(translate(Msg::ProgressAnalyzing, output.locale()), output.out(), context.show_progress);
        analysis = context.llm.analyze_diff(diff, model, lang);
    } catch (const std::exception& e) {
        report_llm_error(output, e, model);
        return 1;
    }
    output.print_analysis(analysis, translate(Msg::AnalysisTitle, output.locale()));

    if (!options.html_output) {
        return 0;
    }

    ReportRequest request;
    request.diff = diff;
    request.analysis_md = analysis;
    if (options.ref) {
        request.scope = DiffScope::revision(*options.ref);
    } else if (analyzing_last) {
        request.scope = DiffScope::revision("HEAD");
    } else {
        request.scope = DiffScope::from_options(options.staged, std::nullopt);
    }
    request.model = model;
    request.lang = lang;
    request.theme = config.report_theme;
    request.cwd = cwd;

    try {
        ReportData data = build_report_data(request, context.git, context.repo);
        std::filesystem::path written = write_report(*options.html_output, data, fetch_chart_js(), config.report_auto_open);
        output.print_html_report_written(written);
    } catch (const std::exception& e) {
        output.print_error(e.what());
        return 1;
    }
    return 0;
}

}

std::vector<std::string> default_to_run(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (starts_with(arg, "-") || arg.find('=') != std::string::npos) continue;
        if (contains(SUBCOMMANDS, arg)) return args;
        break;
    }
    if (!args.empty() && contains(TOP_LEVEL_FLAGS, args.front())) {
        return args;
    }
    std::vector<std::string> with_run = {"run"};
    with_run.insert(with_run.end(), args.begin(), args.end());
    return with_run;
}

std::string resolve_model(const RunOptions& options, const Config& config) {
    if (options.model && !options.model->empty()) return *options.model;
    if (config.model && !config.model->empty()) return *config.model;
    return DEFAULT_MODEL;
}

std::string resolve_lang(const RunOptions& options, const Config& config) {
    if (options.lang && !options.lang->empty()) return *options.lang;
    if (!config.lang.empty()) return config.lang;
    return "auto";
}

void report_llm_error(Output& output, const std::exception& e, const std::string& model) {
    std::string message = trim(e.what());
    LlmErrorKind kind = classify_llm_error(message);
    if (const auto* llm_error = dynamic_cast<const LlmError*>(&e)) {
        kind = llm_error->kind();
    }
    spdlog::debug("Model request failed: {}", message);

    switch (kind) {
        case LlmErrorKind::Connection:
            output.print_error(translate(Msg::OllamaConnect, output.locale()));
            break;
        case LlmErrorKind::ModelNotFound:
            output.print_error(translate(Msg::OllamaModelNotFound, output.locale(), {{"model", model}}));
            break;
        case LlmErrorKind::Other:
            output.print_error(message + "\n" + translate(Msg::OllamaHint, output.locale(), {{"model", model}}));
            break;
    }
}

int run_command(const RunOptions& options, const Config& config, AppContext& context) {
    Output& output = context.output;
    std::string cwd = options.cwd ? *options.cwd : std::filesystem::current_path().string();
    std::string model = resolve_model(options, config);
    std::string lang = resolve_lang(options, config);

    DiffScope scope = DiffScope::from_options(options.staged, options.ref);
    DiffSelection selection;
    try {
        selection = context.git.get_diff_with_fallback(scope, cwd);
    } catch (const GitError& e) {
        output.print_error(e.what());
        return 1;
    }

    if (trim(selection.diff).empty()) {
        output.print_error(translate(Msg::NoChanges, output.locale()));
        return 1;
    }
    if (selection.analyzing_last_commit) {
        output.print_info(translate(Msg::AnalyzingLast, output.locale()));
    }

    if (options.commit_msg) {
        return run_commit_message(selection.diff, model, lang, options, context);
    }
    return run_analysis(selection.diff, model, lang, cwd, selection.analyzing_last_commit, options, config, context);
}

int config_set_command(const std::string& config_path, const std::string& key, const std::string& value, Output& output) {
    set_config_value(config_path, key, value);
    const std::string& locale = output.locale();
    if (key == "model") {
        output.print_line(translate(Msg::ConfigModelSet, locale, {{"model", value}}));
    } else if (key == "lang") {
        output.print_line(translate(Msg::ConfigLangSet, locale, {{"lang", value}}));
    } else if (key == "report_theme") {
        output.print_line(translate(Msg::ConfigThemeSet, locale, {{"theme", value}}));
    } else {
        output.print_line(translate(Msg::ConfigAutoOpenSet, locale, {{"value", parse_bool_value(value) ? "true" : "false"}}));
    }
    return 0;
}

int config_show_command(const std::string& config_path, Output& output) {
    Config config = Config::load_from_file(config_path);
    const std::string& locale = output.locale();
    output.print_line(translate(Msg::ConfigShow, locale, {{"model", config.model.value_or(DEFAULT_MODEL)}, {"lang", config.lang}}));
    output.print_line("report_theme = " + config.report_theme);
    output.print_line(std::string("report_auto_open = ") + (config.report_auto_open ? "true" : "false"));
    output.print_line(translate(Msg::ConfigPath, locale, {{"path", config_path}}));
    return 0;
}
