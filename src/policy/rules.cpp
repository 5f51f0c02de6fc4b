#include "policy/rules.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <type_traits>

using json = nlohmann::json;

namespace mahilo::policy {

namespace {

std::string format_number(double value) {
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream out;
    out << value;
    return out.str();
}

bool compile_patterns(const json& array, std::vector<std::string>& sources,
                      std::vector<std::regex>& patterns, std::string& error) {
    for (const auto& item : array) {
        if (!item.is_string()) {
            error = "Invalid regex pattern: " + item.dump();
            return false;
        }
        const std::string source = item.get<std::string>();
        try {
            patterns.emplace_back(source, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error&) {
            error = "Invalid regex pattern: " + source;
            return false;
        }
        sources.push_back(source);
    }
    return true;
}

bool read_usernames(const json& array, std::vector<std::string>& out) {
    for (const auto& item : array) {
        if (!item.is_string()) {
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

const char* kKnownKeys[] = {
    "maxLength", "minLength", "blockedPatterns", "requiredPatterns",
    "requireContext", "blockedRecipients", "trustedRecipients"
};

} // namespace

std::size_t text_length(const std::string& text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xc0) != 0x80) {
            ++count;
        }
    }
    return count;
}

RuleParse parse_rules(const std::string& content) {
    RuleParse out;

    json doc = json::parse(content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        out.error = "Policy content must be valid JSON";
        return out;
    }

    for (const auto& item : doc.items()) {
        if (std::find(std::begin(kKnownKeys), std::end(kKnownKeys), item.key()) == std::end(kKnownKeys)) {
            out.error = "Unknown rule: " + item.key();
            return out;
        }
    }

    auto& rules = out.rule_set.rules;

    if (doc.contains("maxLength")) {
        if (!doc["maxLength"].is_number()) {
            out.error = "maxLength must be a number";
            return out;
        }
        rules.push_back(MaxLength{doc["maxLength"].get<double>()});
    }

    if (doc.contains("minLength")) {
        if (!doc["minLength"].is_number()) {
            out.error = "minLength must be a number";
            return out;
        }
        rules.push_back(MinLength{doc["minLength"].get<double>()});
    }

    if (doc.contains("blockedPatterns")) {
        if (!doc["blockedPatterns"].is_array()) {
            out.error = "blockedPatterns must be an array";
            return out;
        }
        BlockedPatterns rule;
        if (!compile_patterns(doc["blockedPatterns"], rule.sources, rule.patterns, out.error)) {
            return out;
        }
        rules.push_back(std::move(rule));
    }

    if (doc.contains("requiredPatterns")) {
        if (!doc["requiredPatterns"].is_array()) {
            out.error = "requiredPatterns must be an array";
            return out;
        }
        RequiredPatterns rule;
        if (!compile_patterns(doc["requiredPatterns"], rule.sources, rule.patterns, out.error)) {
            return out;
        }
        rules.push_back(std::move(rule));
    }

    if (doc.contains("requireContext")) {
        if (!doc["requireContext"].is_boolean()) {
            out.error = "requireContext must be a boolean";
            return out;
        }
        if (doc["requireContext"].get<bool>()) {
            rules.push_back(RequireContext{});
        }
    }

    if (doc.contains("blockedRecipients")) {
        BlockedRecipients rule;
        if (!doc["blockedRecipients"].is_array() || !read_usernames(doc["blockedRecipients"], rule.usernames)) {
            out.error = "blockedRecipients must be an array";
            return out;
        }
        rules.push_back(std::move(rule));
    }

    if (doc.contains("trustedRecipients")) {
        TrustedRecipients rule;
        if (!doc["trustedRecipients"].is_array() || !read_usernames(doc["trustedRecipients"], rule.usernames)) {
            out.error = "trustedRecipients must be an array";
            return out;
        }
        rules.push_back(std::move(rule));
    }

    out.success = true;
    return out;
}

std::optional<Violation> evaluate_rules(const RuleSet& rule_set, const RuleInput& input) {
    const double length = static_cast<double>(text_length(input.message));

    for (const auto& rule : rule_set.rules) {
        std::optional<Violation> violation;

        std::visit([&](const auto& r) {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, MaxLength>) {
                if (length > r.limit) {
                    violation = Violation{false, "Message exceeds maximum length of " + format_number(r.limit)};
                }
            } else if constexpr (std::is_same_v<T, MinLength>) {
                if (length < r.limit) {
                    violation = Violation{false, "Message is shorter than minimum length of " + format_number(r.limit)};
                }
            } else if constexpr (std::is_same_v<T, BlockedPatterns>) {
                for (const auto& pattern : r.patterns) {
                    if (std::regex_search(input.message, pattern)) {
                        violation = Violation{false, "Message contains blocked pattern"};
                        return;
                    }
                }
            } else if constexpr (std::is_same_v<T, RequiredPatterns>) {
                for (const auto& pattern : r.patterns) {
                    if (!std::regex_search(input.message, pattern)) {
                        violation = Violation{false, "Message missing required pattern"};
                        return;
                    }
                }
            } else if constexpr (std::is_same_v<T, RequireContext>) {
                if (!input.has_context) {
                    violation = Violation{true, "Context is required for this message"};
                }
            } else if constexpr (std::is_same_v<T, BlockedRecipients>) {
                if (input.recipient_username && contains(r.usernames, *input.recipient_username)) {
                    violation = Violation{false, "Recipient is blocked by policy"};
                }
            } else if constexpr (std::is_same_v<T, TrustedRecipients>) {
                if (input.recipient_username && !contains(r.usernames, *input.recipient_username)) {
                    violation = Violation{false, "Recipient not in trusted list"};
                }
            }
        }, rule);

        if (violation) {
            return violation;
        }
    }

    return std::nullopt;
}

ContentCheck validate_policy_content(core::PolicyType type, const std::string& content) {
    if (type == core::PolicyType::HEURISTIC) {
        RuleParse parsed = parse_rules(content);
        if (!parsed.success) {
            return {false, parsed.error};
        }
        return {true, ""};
    }

    bool blank = std::all_of(content.begin(), content.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        return {false, "LLM policy must have a non-empty prompt"};
    }
    return {true, ""};
}

ContentCheck validate_policy_content(const std::string& type, const std::string& content) {
    auto parsed = core::parse_policy_type(type);
    if (!parsed) {
        return {false, "Unknown policy type: " + type};
    }
    return validate_policy_content(*parsed, content);
}

} // namespace mahilo::policy
