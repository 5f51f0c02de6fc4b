#include "core/types.hpp"

namespace mahilo::core {

const char* to_string(MessageStatus status) {
    switch (status) {
        case MessageStatus::PENDING:   return "pending";
        case MessageStatus::DELIVERED: return "delivered";
        case MessageStatus::FAILED:    return "failed";
        case MessageStatus::REJECTED:  return "rejected";
    }
    return "unknown";
}

const char* to_string(RecipientType type) {
    return type == RecipientType::GROUP ? "group" : "user";
}

const char* to_string(PolicyScope scope) {
    switch (scope) {
        case PolicyScope::GLOBAL: return "global";
        case PolicyScope::USER:   return "user";
        case PolicyScope::ROLE:   return "role";
        case PolicyScope::GROUP:  return "group";
    }
    return "unknown";
}

const char* to_string(PolicyType type) {
    return type == PolicyType::LLM ? "llm" : "heuristic";
}

std::optional<MessageStatus> parse_message_status(const std::string& text) {
    if (text == "pending") return MessageStatus::PENDING;
    if (text == "delivered") return MessageStatus::DELIVERED;
    if (text == "failed") return MessageStatus::FAILED;
    if (text == "rejected") return MessageStatus::REJECTED;
    return std::nullopt;
}

std::optional<RecipientType> parse_recipient_type(const std::string& text) {
    if (text == "user") return RecipientType::USER;
    if (text == "group") return RecipientType::GROUP;
    return std::nullopt;
}

std::optional<PolicyScope> parse_policy_scope(const std::string& text) {
    if (text == "global") return PolicyScope::GLOBAL;
    if (text == "user") return PolicyScope::USER;
    if (text == "role") return PolicyScope::ROLE;
    if (text == "group") return PolicyScope::GROUP;
    return std::nullopt;
}

std::optional<PolicyType> parse_policy_type(const std::string& text) {
    if (text == "heuristic") return PolicyType::HEURISTIC;
    if (text == "llm") return PolicyType::LLM;
    return std::nullopt;
}

DeliveryCounts count_deliveries(const std::vector<MessageDelivery>& deliveries) {
    DeliveryCounts counts;
    counts.recipients = static_cast<int>(deliveries.size());
    for (const auto& d : deliveries) {
        switch (d.status) {
            case MessageStatus::DELIVERED: ++counts.delivered; break;
            case MessageStatus::PENDING:   ++counts.pending; break;
            case MessageStatus::FAILED:
            case MessageStatus::REJECTED:  ++counts.failed; break;
        }
    }
    return counts;
}

MessageStatus aggregate_status(const DeliveryCounts& counts) {
    if (counts.pending > 0) {
        return MessageStatus::PENDING;
    }
    if (counts.recipients > 0 && counts.failed == counts.recipients) {
        return MessageStatus::FAILED;
    }
    return MessageStatus::DELIVERED;
}

} // namespace mahilo::core
