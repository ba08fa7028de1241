#include "llm_backend.hpp"
#include "curl_request.hpp"
#include "default_prompt.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>

namespace {

const std::string EMPTY_ANALYSIS = "No changes to analyze (or diff empty after filtering).";
const std::string FALLBACK_COMMIT_MSG = "Update";

std::string fenced_diff(const std::string& diff) {
    return "```diff\n" + diff + "\n```";
}

}

LlmError::LlmError(const std::string& message, LlmErrorKind kind)
    : std::runtime_error(message), kind_(kind) {}

LlmErrorKind classify_llm_error(const std::string& message) {
    std::string lowered = to_lower(message);
    if (lowered.find("connect") != std::string::npos) {
        return LlmErrorKind::Connection;
    }
    if (lowered.find("404") != std::string::npos || lowered.find("not found") != std::string::npos) {
        return LlmErrorKind::ModelNotFound;
    }
    return LlmErrorKind::Other;
}

std::vector<ChatMessage> build_analysis_messages(const std::string& diff, const std::string& lang) {
    return {
        {"system", get_system_prompt(lang)},
        {"user", fenced_diff(diff)}
    };
}

std::vector<ChatMessage> build_commit_msg_messages(const std::string& diff, const std::string& lang) {
    return {
        {"user", fenced_diff(diff) + "\n\n" + get_commit_msg_prompt(lang)}
    };
}

std::string clean_commit_message(const std::string& msg) {
    std::string cleaned = trim(msg);
    if (cleaned.empty()) {
        return FALLBACK_COMMIT_MSG;
    }
    for (char quote : {'"', '\'', '`'}) {
        if (cleaned.size() > 2 && cleaned.front() == quote && cleaned.back() == quote) {
            cleaned = cleaned.substr(1, cleaned.size() - 2);
        }
    }
    return utf8_prefix(cleaned, COMMIT_MSG_MAX_CHARS);
}

OllamaBackend::OllamaBackend(const std::string& host) : host(host) {}

std::string OllamaBackend::analyze_diff(const std::string& diff, const std::string& model, const std::string& lang) {
    if (trim(diff).empty()) {
        return EMPTY_ANALYSIS;
    }
    return chat(model, build_analysis_messages(diff, lang), ANALYSIS_TEMPERATURE);
}

std::string OllamaBackend::generate_commit_message(const std::string& diff, const std::string& model, const std::string& lang) {
    if (trim(diff).empty()) {
        return FALLBACK_COMMIT_MSG;
    }
    return clean_commit_message(chat(model, build_commit_msg_messages(diff, lang), COMMIT_MSG_TEMPERATURE));
}

nlohmann::json OllamaBackend::build_chat_payload(const std::string& model, const std::vector<ChatMessage>& messages, double temperature) {
    nlohmann::json messages_json = nlohmann::json::array();
    for (const auto& message : messages) {
        messages_json.push_back({
            {"role", message.role},
            {"content", message.content}
        });
    }
    return {
        {"model", model},
        {"messages", messages_json},
        {"stream", false},
        {"options", {{"temperature", temperature}}}
    };
}

std::string OllamaBackend::parse_chat_response(const std::string& response) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(response);
    } catch (const nlohmann::json::exception& e) {
        throw LlmError("Invalid response from Ollama: " + std::string(e.what()), LlmErrorKind::Other);
    }
    if (j.contains("error")) {
        std::string error_msg = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
        throw LlmError(error_msg, classify_llm_error(error_msg));
    }
    if (j.contains("message") && j["message"].is_object() && j["message"].contains("content") && j["message"]["content"].is_string()) {
        return j["message"]["content"].get<std::string>();
    }
    throw LlmError("Unexpected response format from Ollama", LlmErrorKind::Other);
}

std::string OllamaBackend::chat(const std::string& model, const std::vector<ChatMessage>& messages, double temperature) {
    std::string url = host + "/api/chat";
    std::string payload = build_chat_payload(model, messages, temperature)
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    CurlRequest request;
    request.set_url(url);
    request.add_header("Content-Type: application/json");
    request.set_postfields(payload);
    spdlog::debug("POST {} ({} bytes, model {})", url, payload.size(), model);

    CURLcode res = request.perform();
    if (res != CURLE_OK) {
        std::string error_msg = curl_easy_strerror(res);
        spdlog::debug("Request to {} failed: {}", url, error_msg);
        LlmErrorKind kind = (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST)
            ? LlmErrorKind::Connection
            : classify_llm_error(error_msg);
        throw LlmError("Ollama request to " + host + " failed: " + error_msg, kind);
    }

    long status = request.response_code();
    spdlog::debug("Ollama answered HTTP {} ({} bytes)", status, request.body().size());
    if (status == 404) {
        throw LlmError("Model '" + model + "' not found (HTTP 404)", LlmErrorKind::ModelNotFound);
    }
    if (status != 200) {
        std::string detail = request.body();
        try {
            nlohmann::json j = nlohmann::json::parse(detail);
            if (j.contains("error") && j["error"].is_string()) {
                detail = j["error"].get<std::string>();
            }
        } catch (const nlohmann::json::exception&) {
            // Keep the raw body.
        }
        throw LlmError("Ollama returned HTTP " + std::to_string(status) + ": " + detail, classify_llm_error(detail));
    }
    return parse_chat_response(request.body());
}
