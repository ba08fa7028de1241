#pragma once

#include <optional>
#include <string>
#include <vector>

extern const std::string DEFAULT_MODEL;
extern const std::string DEFAULT_OLLAMA_HOST;
extern const std::vector<std::string> VALID_LANGS;
extern const std::vector<std::string> VALID_THEMES;
extern const std::vector<std::string> CONFIG_KEYS;

struct Config {
    std::optional<std::string> model;
    std::string lang = "auto";
    std::string report_theme = "dark";
    bool report_auto_open = true;

    // Missing or unreadable files give the defaults.
    static Config load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;
};

std::string get_config_path();
std::string get_ollama_host();

bool parse_bool_value(const std::string& value);

// Validates and stores one key. Throws std::invalid_argument for an unknown
// key or a value outside the allowed set.
void set_config_value(const std::string& path, const std::string& key, const std::string& value);
