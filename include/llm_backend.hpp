#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class LlmErrorKind {
    Connection,
    ModelNotFound,
    Other
};

class LlmError : public std::runtime_error {
public:
    LlmError(const std::string& message, LlmErrorKind kind);
    LlmErrorKind kind() const { return kind_; }

private:
    LlmErrorKind kind_;
};

// Connection problems mention "connect"; missing models "404" or "not found".
LlmErrorKind classify_llm_error(const std::string& message);

struct ChatMessage {
    std::string role;
    std::string content;
};

constexpr double ANALYSIS_TEMPERATURE = 0.3;
constexpr double COMMIT_MSG_TEMPERATURE = 0.2;
constexpr std::size_t COMMIT_MSG_MAX_CHARS = 72;

class LLMBackend {
public:
    virtual ~LLMBackend() = default;
    // Markdown with a summary, key changes and risks.
    virtual std::string analyze_diff(const std::string& diff, const std::string& model, const std::string& lang) = 0;
    // One line, at most COMMIT_MSG_MAX_CHARS characters.
    virtual std::string generate_commit_message(const std::string& diff, const std::string& model, const std::string& lang) = 0;
};

class OllamaBackend : public LLMBackend {
public:
    explicit OllamaBackend(const std::string& host);

    std::string analyze_diff(const std::string& diff, const std::string& model, const std::string& lang) override;
    std::string generate_commit_message(const std::string& diff, const std::string& model, const std::string& lang) override;

    static nlohmann::json build_chat_payload(const std::string& model, const std::vector<ChatMessage>& messages, double temperature);
    // Content of the assistant message. Throws LlmError on an error body.
    static std::string parse_chat_response(const std::string& response);

private:
    std::string host;
    std::string chat(const std::string& model, const std::vector<ChatMessage>& messages, double temperature);
};

std::vector<ChatMessage> build_analysis_messages(const std::string& diff, const std::string& lang);
std::vector<ChatMessage> build_commit_msg_messages(const std::string& diff, const std::string& lang);

// Trims, strips one pair of surrounding quotes or backticks and caps the
// length. Empty input becomes "Update".
std::string clean_commit_message(const std::string& msg);
