#include "policy/evaluator.hpp"
#include "policy/rules.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mahilo::policy {

using core::Policy;
using core::PolicyScope;
using core::PolicyType;

namespace {

bool has_context(const std::optional<std::string>& context) {
    return context && !context->empty();
}

} // namespace

void sort_for_evaluation(std::vector<Policy>& policies) {
    std::stable_sort(policies.begin(), policies.end(), [](const Policy& a, const Policy& b) {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        return a.created_at < b.created_at;
    });
}

PolicyEvaluator::PolicyEvaluator(store::PolicyStore& policies,
                                 store::RelationshipOracle& oracle,
                                 PolicyJudge& judge)
    : policies_(policies), oracle_(oracle), judge_(judge) {}

std::vector<Policy> PolicyEvaluator::direct_policies(const std::string& sender_id,
                                                     const std::string& recipient_id) {
    std::vector<Policy> out = policies_.enabled_policies(sender_id, PolicyScope::GLOBAL, {});

    auto user_scoped = policies_.enabled_policies(sender_id, PolicyScope::USER, {recipient_id});
    out.insert(out.end(), user_scoped.begin(), user_scoped.end());

    auto roles = oracle_.roles_for(sender_id, recipient_id);
    if (!roles.empty()) {
        auto role_scoped = policies_.enabled_policies(sender_id, PolicyScope::ROLE, roles);
        out.insert(out.end(), role_scoped.begin(), role_scoped.end());
    }

    sort_for_evaluation(out);
    return out;
}

std::vector<Policy> PolicyEvaluator::group_policies(const std::string& sender_id,
                                                    const std::string& group_id) {
    std::vector<Policy> out = policies_.enabled_policies(sender_id, PolicyScope::GLOBAL, {});
    sort_for_evaluation(out);

    // Group policies may be owned by any member
    auto group_scoped = policies_.enabled_policies(std::nullopt, PolicyScope::GROUP, {group_id});
    sort_for_evaluation(group_scoped);

    out.insert(out.end(), group_scoped.begin(), group_scoped.end());
    return out;
}

PolicyDecision PolicyEvaluator::evaluate_direct(const std::string& sender_id,
                                                const std::string& recipient_id,
                                                const std::string& message,
                                                const std::optional<std::string>& context) {
    auto applicable = direct_policies(sender_id, recipient_id);
    if (applicable.empty()) {
        return {};
    }

    std::optional<std::string> recipient_username;
    if (auto recipient = oracle_.find_user(recipient_id)) {
        recipient_username = recipient->username;
    }

    RuleInput input{message, has_context(context), recipient_username};

    for (const auto& policy : applicable) {
        if (policy.policy_type == PolicyType::HEURISTIC) {
            RuleParse parsed = parse_rules(policy.content);
            if (!parsed.success) {
                spdlog::warn("Skipping policy {}: {}", policy.id, parsed.error);
                continue;
            }
            if (auto violation = evaluate_rules(parsed.rule_set, input)) {
                return {false, violation->reason, policy.id};
            }
        } else {
            auto judgement = judge_.evaluate(policy.content, message,
                                             recipient_username.value_or("unknown"), context);
            if (!judgement.passed) {
                std::string reason = judgement.reasoning.empty()
                    ? "Message blocked by LLM policy" : judgement.reasoning;
                return {false, reason, policy.id};
            }
        }
    }

    return {};
}

PolicyDecision PolicyEvaluator::evaluate_group(const std::string& sender_id,
                                               const std::string& group_id,
                                               const std::string& message,
                                               const std::optional<std::string>& context) {
    auto applicable = group_policies(sender_id, group_id);
    if (applicable.empty()) {
        return {};
    }

    std::string group_name = group_id;
    if (auto group = oracle_.find_group(group_id)) {
        group_name = group->name;
    }

    RuleInput input{message, has_context(context), std::nullopt};

    for (const auto& policy : applicable) {
        if (policy.policy_type == PolicyType::HEURISTIC) {
            RuleParse parsed = parse_rules(policy.content);
            if (!parsed.success) {
                spdlog::warn("Skipping group policy {}: {}", policy.id, parsed.error);
                continue;
            }
            if (auto violation = evaluate_rules(parsed.rule_set, input)) {
                if (violation->context_missing) {
                    return {false, "Context is required for messages to group '" + group_name + "'", policy.id};
                }
                return {false, violation->reason + " (group policy)", policy.id};
            }
        } else {
            auto judgement = judge_.evaluate(policy.content, message, group_name, context);
            if (!judgement.passed) {
                std::string reason = judgement.reasoning.empty()
                    ? "Message blocked by LLM policy" : judgement.reasoning;
                return {false, reason + " (group policy)", policy.id};
            }
        }
    }

    return {};
}

} // namespace mahilo::policy
