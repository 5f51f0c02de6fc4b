/**
 * Heuristic policy rules.
 *
 * Policy content is a JSON object; each recognized key becomes one rule
 * of a closed variant set. Rules evaluate in a fixed order regardless of
 * key order in the document:
 *
 *   maxLength, minLength, blockedPatterns, requiredPatterns,
 *   requireContext, blockedRecipients, trustedRecipients
 */
#pragma once
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>
#include "core/types.hpp"

namespace mahilo::policy {

struct MaxLength {
    double limit = 0;
};

struct MinLength {
    double limit = 0;
};

// Patterns compile case-insensitive
struct BlockedPatterns {
    std::vector<std::string> sources;
    std::vector<std::regex> patterns;
};

struct RequiredPatterns {
    std::vector<std::string> sources;
    std::vector<std::regex> patterns;
};

struct RequireContext {};

struct BlockedRecipients {
    std::vector<std::string> usernames;
};

struct TrustedRecipients {
    std::vector<std::string> usernames;
};

using Rule = std::variant<MaxLength, MinLength, BlockedPatterns, RequiredPatterns,
                          RequireContext, BlockedRecipients, TrustedRecipients>;

struct RuleSet {
    std::vector<Rule> rules;   // already in evaluation order
};

struct RuleParse {
    bool success = false;
    RuleSet rule_set;
    std::string error;
};

RuleParse parse_rules(const std::string& content);

// What a rule set is checked against
struct RuleInput {
    std::string message;
    bool has_context = false;
    std::optional<std::string> recipient_username;   // unset for group sends
};

struct Violation {
    bool context_missing = false;   // set when requireContext fired
    std::string reason;
};

// First violated rule, or nullopt when every rule passes
std::optional<Violation> evaluate_rules(const RuleSet& rule_set, const RuleInput& input);

// Write-time check of policy content
struct ContentCheck {
    bool valid = false;
    std::string error;
};

ContentCheck validate_policy_content(core::PolicyType type, const std::string& content);
ContentCheck validate_policy_content(const std::string& type, const std::string& content);

// Length in code points of UTF-8 text
std::size_t text_length(const std::string& text);

} // namespace mahilo::policy
