#pragma once

#include "config.hpp"
#include "git_repository.hpp"
#include "git_utils.hpp"
#include "llm_backend.hpp"
#include "output.hpp"
#include <exception>
#include <optional>
#include <string>
#include <vector>

struct RunOptions {
    bool staged = false;
    std::optional<std::string> ref;
    std::optional<std::string> model;
    std::optional<std::string> lang;
    bool commit_msg = false;
    std::optional<std::string> cwd;
    std::optional<std::string> output_file;
    std::optional<std::string> html_output;
};

struct AppContext {
    GitUtils& git;
    const GitRepository& repo;
    LLMBackend& llm;
    Output& output;
    bool show_progress = false;
};

// Inserts "run" when no subcommand is given, so "smart-diff -m x" analyzes.
std::vector<std::string> default_to_run(const std::vector<std::string>& args);

std::string resolve_model(const RunOptions& options, const Config& config);
std::string resolve_lang(const RunOptions& options, const Config& config);

// Prints the localized hint for a failed model request.
void report_llm_error(Output& output, const std::exception& e, const std::string& model);

// The "run" action. Returns the process exit code.
int run_command(const RunOptions& options, const Config& config, AppContext& context);

int config_set_command(const std::string& config_path, const std::string& key, const std::string& value, Output& output);
int config_show_command(const std::string& config_path, Output& output);
