#pragma once
#include <string>
#include <vector>

namespace mahilo::services::llm {

// LLM configuration
struct LLMConfig {
    std::string api_key;                                    // Anthropic API key
    std::string model = "claude-3-haiku-20240307";
    std::string api_host = "api.anthropic.com";
    std::string api_version = "2023-06-01";
    int timeout_ms = 5000;
    int max_tokens = 256;
};

// Chat message
struct ChatMessage {
    std::string role;    // "user" or "assistant"
    std::string content;
};

// LLM response
struct LLMResponse {
    bool success = false;
    std::string content;
    std::string error;
    int tokens_used = 0;
};

// Anything that can turn a prompt into a completion
class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    virtual bool is_configured() const = 0;
    virtual LLMResponse complete(const std::string& prompt) = 0;
};

// Anthropic Messages API client over cpp-httplib
class LLMClient final : public LLMProvider {
public:
    explicit LLMClient(const LLMConfig& config);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    // Check if configured (has API key)
    bool is_configured() const override;

    // Single-turn completion
    LLMResponse complete(const std::string& prompt) override;

    // Chat completion with history
    LLMResponse chat(const std::vector<ChatMessage>& messages);

    const LLMConfig& config() const { return config_; }

    // Build request JSON for the Messages API
    std::string build_request_json(const std::vector<ChatMessage>& messages) const;

    // Parse response JSON
    static LLMResponse parse_response(const std::string& response_body);

private:
    LLMConfig config_;

    // Make HTTP request
    LLMResponse make_request(const std::string& request_body);
};

} // namespace mahilo::services::llm
