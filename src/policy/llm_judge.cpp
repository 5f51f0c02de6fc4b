#include "policy/llm_judge.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace mahilo::policy {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

std::string build_evaluation_prompt(const std::string& policy_text,
                                    const std::string& message,
                                    const std::string& recipient,
                                    const std::optional<std::string>& context) {
    std::string prompt = "You are evaluating if a message complies with a policy.\n\n";
    prompt += "POLICY: " + policy_text + "\n\n";
    prompt += "MESSAGE TO: " + recipient + "\n";
    prompt += "MESSAGE CONTENT: " + message;
    if (context && !context->empty()) {
        prompt += "\nMESSAGE CONTEXT: " + *context;
    }
    prompt += "\n\nDoes this message comply with the policy?\n"
              "Answer with PASS or FAIL on the first line, followed by brief reasoning on the next line.\n"
              "Do not include any other text before PASS or FAIL.";
    return prompt;
}

std::optional<Judgement> parse_evaluation_response(const std::string& response) {
    std::vector<std::string> lines;
    std::istringstream in(trim(response));
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    if (lines.empty()) {
        return std::nullopt;
    }

    const std::string verdict = to_upper(trim(lines[0]));
    Judgement judgement;
    if (starts_with(verdict, "PASS")) {
        judgement.passed = true;
    } else if (starts_with(verdict, "FAIL")) {
        judgement.passed = false;
    } else {
        return std::nullopt;
    }

    std::string rest;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        if (i > 1) {
            rest += "\n";
        }
        rest += lines[i];
    }
    judgement.reasoning = trim(rest);
    if (judgement.reasoning.empty()) {
        judgement.reasoning = "No reasoning provided";
    }
    return judgement;
}

Judgement DisabledPolicyJudge::evaluate(const std::string&, const std::string&,
                                        const std::string&, const std::optional<std::string>&) {
    return Judgement{true, "LLM evaluation not configured", ""};
}

LlmPolicyJudge::LlmPolicyJudge(services::llm::LLMProvider& provider, bool fail_open)
    : provider_(provider), fail_open_(fail_open) {}

Judgement LlmPolicyJudge::evaluate(const std::string& policy_text,
                                   const std::string& message,
                                   const std::string& recipient,
                                   const std::optional<std::string>& context) {
    auto response = provider_.complete(build_evaluation_prompt(policy_text, message, recipient, context));

    if (!response.success) {
        spdlog::error("LLM policy evaluation failed: {}", response.error);
        if (fail_open_) {
            return Judgement{true, "LLM evaluation failed, defaulting to PASS", response.error};
        }
        return Judgement{false, "LLM evaluation failed: " + response.error, response.error};
    }

    auto judgement = parse_evaluation_response(response.content);
    if (!judgement) {
        spdlog::warn("LLM response did not start with PASS/FAIL ({})",
                     fail_open_ ? "defaulting to PASS" : "treating as FAIL");
        return Judgement{fail_open_, "Unclear response: " + response.content, ""};
    }
    return *judgement;
}

} // namespace mahilo::policy
