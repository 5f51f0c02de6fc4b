#include "services/llm/client.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

using json = nlohmann::json;

namespace mahilo::services::llm {

LLMClient::LLMClient(const LLMConfig& config)
    : config_(config) {
    if (config_.api_key.empty()) {
        spdlog::warn("No Anthropic API key configured; LLM policies will not be evaluated");
    } else {
        spdlog::info("LLM client initialized (model={})", config_.model);
    }
}

LLMClient::~LLMClient() = default;

bool LLMClient::is_configured() const {
    return !config_.api_key.empty();
}

LLMResponse LLMClient::complete(const std::string& prompt) {
    std::vector<ChatMessage> messages = {
        {"user", prompt}
    };
    return chat(messages);
}

LLMResponse LLMClient::chat(const std::vector<ChatMessage>& messages) {
    if (!is_configured()) {
        LLMResponse response;
        response.success = false;
        response.error = "API key not configured";
        return response;
    }

    return make_request(build_request_json(messages));
}

std::string LLMClient::build_request_json(const std::vector<ChatMessage>& messages) const {
    json request;
    request["model"] = config_.model;
    request["max_tokens"] = config_.max_tokens;

    json items = json::array();
    for (const auto& msg : messages) {
        json item;
        item["role"] = (msg.role == "assistant") ? "assistant" : "user";
        item["content"] = msg.content;
        items.push_back(item);
    }
    request["messages"] = items;

    return request.dump();
}

LLMResponse LLMClient::parse_response(const std::string& response_body) {
    LLMResponse response;

    json j = json::parse(response_body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        response.error = "JSON parse error: response is not an object";
        spdlog::error("Failed to parse Anthropic response");
        spdlog::debug("Response body: {}", response_body);
        return response;
    }

    if (j.contains("error") && j["error"].is_object()) {
        response.error = j["error"].value("message", "unknown API error");
        return response;
    }

    // First content block carries the text
    if (j.contains("content") && j["content"].is_array() && !j["content"].empty()) {
        const auto& block = j["content"][0];
        if (block.is_object() && block.contains("text") && block["text"].is_string()) {
            response.content = block["text"].get<std::string>();
            response.success = true;
        }
    }

    if (j.contains("usage") && j["usage"].is_object()) {
        const auto& usage = j["usage"];
        response.tokens_used = usage.value("input_tokens", 0) + usage.value("output_tokens", 0);
    }

    if (!response.success) {
        response.error = "No content in response";
    }

    return response;
}

LLMResponse LLMClient::make_request(const std::string& request_body) {
    LLMResponse response;

    try {
        httplib::Client cli("https://" + config_.api_host);
        auto timeout = std::chrono::milliseconds(config_.timeout_ms);
        cli.set_connection_timeout(timeout);
        cli.set_read_timeout(timeout);
        cli.set_write_timeout(timeout);

        httplib::Headers headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", config_.api_version}
        };

        spdlog::debug("Calling Anthropic API: {}", config_.model);

        auto result = cli.Post("/v1/messages", headers, request_body, "application/json");

        if (!result) {
            response.error = "HTTP request failed: " + httplib::to_string(result.error());
            spdlog::error("Anthropic API request failed: {}", response.error);
            return response;
        }

        spdlog::debug("Anthropic API response: {} ({}B)", result->status, result->body.size());

        if (result->status != 200) {
            response.error = "HTTP " + std::to_string(result->status);

            json j = json::parse(result->body, nullptr, false);
            if (!j.is_discarded() && j.contains("error") && j["error"].is_object() &&
                j["error"].contains("message") && j["error"]["message"].is_string()) {
                response.error += ": " + j["error"]["message"].get<std::string>();
            }

            spdlog::error("Anthropic API error: {}", response.error);
            return response;
        }

        return parse_response(result->body);

    } catch (const std::exception& e) {
        response.error = std::string("Exception: ") + e.what();
        spdlog::error("Anthropic API exception: {}", e.what());
    }

    return response;
}

} // namespace mahilo::services::llm
