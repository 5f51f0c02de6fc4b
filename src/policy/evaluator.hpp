#pragma once
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "policy/llm_judge.hpp"
#include "store/store.hpp"

namespace mahilo::policy {

struct PolicyDecision {
    bool allowed = true;
    std::string reason;         // set when blocked
    std::string policy_id;      // policy that blocked
};

// Gates message content against the sender's policies (and, for group
// sends, the group's). First violation wins.
class PolicyEvaluator {
public:
    PolicyEvaluator(store::PolicyStore& policies,
                    store::RelationshipOracle& oracle,
                    PolicyJudge& judge);

    // Non-copyable
    PolicyEvaluator(const PolicyEvaluator&) = delete;
    PolicyEvaluator& operator=(const PolicyEvaluator&) = delete;

    PolicyDecision evaluate_direct(const std::string& sender_id,
                                   const std::string& recipient_id,
                                   const std::string& message,
                                   const std::optional<std::string>& context);

    PolicyDecision evaluate_group(const std::string& sender_id,
                                  const std::string& group_id,
                                  const std::string& message,
                                  const std::optional<std::string>& context);

    // Applicable policies for a direct send, in evaluation order
    std::vector<core::Policy> direct_policies(const std::string& sender_id,
                                              const std::string& recipient_id);

    // Sender globals first, then the group's policies
    std::vector<core::Policy> group_policies(const std::string& sender_id,
                                             const std::string& group_id);

private:
    store::PolicyStore& policies_;
    store::RelationshipOracle& oracle_;
    PolicyJudge& judge_;
};

// Priority descending, ties by creation time then fetch order
void sort_for_evaluation(std::vector<core::Policy>& policies);

} // namespace mahilo::policy
