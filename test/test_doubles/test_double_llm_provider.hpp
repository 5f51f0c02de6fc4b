#pragma once
#include <string>
#include <vector>
#include "services/llm/client.hpp"

namespace mahilo::test {

// Returns a canned completion and keeps the prompts it was asked
class TestDoubleLLMProvider final : public services::llm::LLMProvider {
public:
    bool is_configured() const override { return true; }

    services::llm::LLMResponse complete(const std::string& prompt) override {
        prompts.push_back(prompt);
        return response;
    }

    void answer(const std::string& content) {
        response = {};
        response.success = true;
        response.content = content;
    }

    void fail(const std::string& error) {
        response = {};
        response.success = false;
        response.error = error;
    }

    services::llm::LLMResponse response;
    std::vector<std::string> prompts;
};

} // namespace mahilo::test
