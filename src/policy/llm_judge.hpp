#pragma once
#include <optional>
#include <string>
#include "services/llm/client.hpp"

namespace mahilo::policy {

struct Judgement {
    bool passed = true;
    std::string reasoning;
    std::string error;      // underlying failure, kept for logs
};

// Evaluates one LLM-type policy against a message
class PolicyJudge {
public:
    virtual ~PolicyJudge() = default;

    virtual Judgement evaluate(const std::string& policy_text,
                               const std::string& message,
                               const std::string& recipient,
                               const std::optional<std::string>& context) = 0;
};

// Used when no LLM is configured. Always passes.
class DisabledPolicyJudge final : public PolicyJudge {
public:
    Judgement evaluate(const std::string& policy_text,
                       const std::string& message,
                       const std::string& recipient,
                       const std::optional<std::string>& context) override;
};

// Asks an LLM for a PASS/FAIL verdict. With fail_open, call failures and
// answers that start with neither word resolve to PASS; otherwise to FAIL.
class LlmPolicyJudge final : public PolicyJudge {
public:
    LlmPolicyJudge(services::llm::LLMProvider& provider, bool fail_open);

    Judgement evaluate(const std::string& policy_text,
                       const std::string& message,
                       const std::string& recipient,
                       const std::optional<std::string>& context) override;

private:
    services::llm::LLMProvider& provider_;
    bool fail_open_;
};

std::string build_evaluation_prompt(const std::string& policy_text,
                                    const std::string& message,
                                    const std::string& recipient,
                                    const std::optional<std::string>& context);

// nullopt when the first line is neither PASS nor FAIL
std::optional<Judgement> parse_evaluation_response(const std::string& response);

} // namespace mahilo::policy
