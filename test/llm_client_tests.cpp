#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include "services/llm/client.hpp"

using json = nlohmann::json;
using namespace mahilo::services::llm;

TEST_CASE("unconfigured client never calls out", "[llm]") {
    LLMClient client(LLMConfig{});
    REQUIRE_FALSE(client.is_configured());

    auto response = client.complete("hello");
    REQUIRE_FALSE(response.success);
    REQUIRE(response.error == "API key not configured");
}

TEST_CASE("request body follows the Messages API", "[llm]") {
    LLMConfig config;
    config.api_key = "sk-test";
    config.model = "claude-3-haiku-20240307";
    config.max_tokens = 64;
    LLMClient client(config);

    json body = json::parse(client.build_request_json({{"user", "hi"}, {"assistant", "hello"}}));
    REQUIRE(body["model"] == "claude-3-haiku-20240307");
    REQUIRE(body["max_tokens"] == 64);
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0]["role"] == "user");
    REQUIRE(body["messages"][1]["role"] == "assistant");
    REQUIRE(body["messages"][0]["content"] == "hi");
}

TEST_CASE("response parsing", "[llm]") {
    SECTION("first text block and usage") {
        auto response = LLMClient::parse_response(R"({
            "content": [{"type": "text", "text": "PASS\nfine"}],
            "usage": {"input_tokens": 10, "output_tokens": 5}
        })");
        REQUIRE(response.success);
        REQUIRE(response.content == "PASS\nfine");
        REQUIRE(response.tokens_used == 15);
    }

    SECTION("API error object") {
        auto response = LLMClient::parse_response(R"({"error": {"message": "overloaded"}})");
        REQUIRE_FALSE(response.success);
        REQUIRE(response.error == "overloaded");
    }

    SECTION("no content") {
        auto response = LLMClient::parse_response(R"({"content": []})");
        REQUIRE_FALSE(response.success);
        REQUIRE(response.error == "No content in response");
    }

    SECTION("not JSON") {
        REQUIRE_FALSE(LLMClient::parse_response("<html>").success);
    }
}
