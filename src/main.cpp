#include <CLI/CLI.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <string>
#include <vector>
#include "app.hpp"
#include "config.hpp"
#include "git_backend.hpp"
#include "git_repository.hpp"
#include "git_utils.hpp"
#include "llm_backend.hpp"
#include "messages.hpp"
#include "output.hpp"

#ifndef SMARTDIFF_VERSION
#define SMARTDIFF_VERSION "dev"
#endif

namespace {

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

}

int main(int argc, char** argv) {
    CLI::App app{"smart-diff - Analyze git changes with a local LLM (Ollama)"};
    app.set_version_flag("-V,--version", std::string("smart-diff ") + SMARTDIFF_VERSION);
    app.require_subcommand(1);

    RunOptions options;
    bool verbose = false;
    auto* run = app.add_subcommand("run", "Analyze diff or generate commit message");
    run->add_flag("-s,--staged", options.staged, "Analyze only staged changes");
    run->add_option("-r,--ref", options.ref, "Analyze this commit (e.g. HEAD, HEAD~1)");
    run->add_option("-m,--model", options.model, "Ollama model (overrides config, default " + DEFAULT_MODEL + ")");
    run->add_option("-l,--lang", options.lang, "Output and LLM response language (overrides config)")
        ->check(CLI::IsMember(VALID_LANGS));
    run->add_flag("--commit-msg", options.commit_msg, "Generate only a commit message (one line)");
    run->add_option("--cwd", options.cwd, "Repository directory (default: current)")
        ->check(CLI::ExistingDirectory);
    run->add_option("-o,--output-file", options.output_file, "Write commit message to file (for prepare-commit-msg hook)");
    run->add_option("--html", options.html_output, "Write HTML report to this file (e.g. report.html)");
    run->add_flag("-v,--verbose", verbose, "Print diagnostic logging to stderr");

    std::string config_key;
    std::string config_value;
    auto* config_cmd = app.add_subcommand("config", "Set or show default model, language and report options");
    config_cmd->require_subcommand(1);
    auto* config_set = config_cmd->add_subcommand("set", "Set a default, e.g. config set report_theme light");
    config_set->add_option("key", config_key, "Config key")->required()->check(CLI::IsMember(CONFIG_KEYS));
    config_set->add_option("value", config_value, "New value")->required();
    auto* config_show = config_cmd->add_subcommand("show", "Show current config");

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    args = default_to_run(args);
    std::vector<char*> parse_argv = {argv[0]};
    for (auto& arg : args) {
        parse_argv.push_back(arg.data());
    }

    try {
        app.parse(static_cast<int>(parse_argv.size()), parse_argv.data());
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    spdlog::set_default_logger(spdlog::stderr_color_mt("smart-diff"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

    CurlGlobal curl_global;
    bool interactive = stdout_is_terminal();

    try {
        std::string config_path = get_config_path();
        Config config = Config::load_from_file(config_path);

        if (config_cmd->parsed()) {
            Output output(std::cout, std::cerr, FALLBACK_LOCALE, terminal_width(), interactive);
            if (config_set->parsed()) {
                try {
                    return config_set_command(config_path, config_key, config_value, output);
                } catch (const std::invalid_argument& e) {
                    return app.exit(CLI::ValidationError("value", e.what()));
                }
            }
            if (config_show->parsed()) {
                return config_show_command(config_path, output);
            }
            return 1;
        }

        Output output(std::cout, std::cerr, ui_locale(resolve_lang(options, config)), terminal_width(), interactive);
        try {
            ProcessGitBackend backend;
            GitUtils git(backend);
            GitRepository repo;
            OllamaBackend llm(get_ollama_host());
            AppContext context{git, repo, llm, output, interactive};
            return run_command(options, config, context);
        } catch (const std::exception& e) {
            output.print_error(e.what());
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << translate(Msg::ErrorPrefix, FALLBACK_LOCALE) << " " << e.what() << std::endl;
        return 1;
    }
}
