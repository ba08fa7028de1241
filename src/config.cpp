#include "config.hpp"
#include "text_utils.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

const std::string DEFAULT_MODEL = "llama3";
const std::string DEFAULT_OLLAMA_HOST = "http://localhost:11434";
const std::vector<std::string> VALID_LANGS = {"en", "ru", "auto"};
const std::vector<std::string> VALID_THEMES = {"dark", "light"};
const std::vector<std::string> CONFIG_KEYS = {"model", "lang", "report_theme", "report_auto_open"};

namespace {

bool is_one_of(const std::string& value, const std::vector<std::string>& allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

std::string join(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) joined += ", ";
        joined += value;
    }
    return joined;
}

}

Config Config::load_from_file(const std::string& path) {
    Config config;
    std::ifstream file(path);
    if (!file) return config;

    nlohmann::json j;
    try {
        std::stringstream buffer;
        buffer << file.rdbuf();
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring malformed config {}: {}", path, e.what());
        return config;
    }
    if (!j.is_object()) {
        spdlog::warn("Ignoring config {}: expected a JSON object", path);
        return config;
    }

    if (j.contains("model") && j["model"].is_string() && !j["model"].get<std::string>().empty()) {
        config.model = j["model"].get<std::string>();
    }
    if (j.contains("lang") && j["lang"].is_string() && is_one_of(j["lang"].get<std::string>(), VALID_LANGS)) {
        config.lang = j["lang"].get<std::string>();
    }
    if (j.contains("report_theme") && j["report_theme"].is_string() && is_one_of(j["report_theme"].get<std::string>(), VALID_THEMES)) {
        config.report_theme = j["report_theme"].get<std::string>();
    }
    if (j.contains("report_auto_open") && j["report_auto_open"].is_boolean()) {
        config.report_auto_open = j["report_auto_open"].get<bool>();
    }
    return config;
}

void Config::save_to_file(const std::string& path) const {
    nlohmann::json j = {
        {"model", model ? nlohmann::json(*model) : nlohmann::json(nullptr)},
        {"lang", lang},
        {"report_theme", report_theme},
        {"report_auto_open", report_auto_open}
    };

    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write config file " + path);
    }
    file << j.dump(2) << "\n";
}

std::string get_config_path() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    std::string config_dir;
    if (xdg_config && strlen(xdg_config) > 0) {
        config_dir = xdg_config;
    } else {
        const char* home = std::getenv("HOME");
        if (!home || strlen(home) == 0) {
            throw std::runtime_error("HOME environment variable not set");
        }
        config_dir = std::string(home) + "/.config";
    }
    return config_dir + "/smart-diff/config.json";
}

std::string get_ollama_host() {
    const char* env_host = std::getenv("OLLAMA_HOST");
    if (!env_host || strlen(env_host) == 0) {
        return DEFAULT_OLLAMA_HOST;
    }
    std::string host = trim(env_host);
    while (!host.empty() && host.back() == '/') host.pop_back();
    if (host.find("://") == std::string::npos) {
        host = "http://" + host;
    }
    return host;
}

bool parse_bool_value(const std::string& value) {
    std::string lowered = to_lower(trim(value));
    return lowered == "1" || lowered == "true" || lowered == "yes";
}

void set_config_value(const std::string& path, const std::string& key, const std::string& value) {
    Config config = Config::load_from_file(path);
    if (key == "model") {
        config.model = value;
    } else if (key == "lang") {
        if (!is_one_of(value, VALID_LANGS)) {
            throw std::invalid_argument("lang must be one of: " + join(VALID_LANGS));
        }
        config.lang = value;
    } else if (key == "report_theme") {
        if (!is_one_of(value, VALID_THEMES)) {
            throw std::invalid_argument("report_theme must be: " + join(VALID_THEMES));
        }
        config.report_theme = value;
    } else if (key == "report_auto_open") {
        config.report_auto_open = parse_bool_value(value);
    } else {
        throw std::invalid_argument("Unknown config key: " + key);
    }
    config.save_to_file(path);
}
