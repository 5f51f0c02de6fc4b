#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "util/clock.hpp"

namespace mahilo::core {

using util::TimePoint;

enum class MessageStatus {
    PENDING,
    DELIVERED,
    FAILED,
    REJECTED    // policy-rejected, kept for audit only
};

enum class RecipientType {
    USER,
    GROUP
};

enum class PolicyScope {
    GLOBAL,
    USER,
    ROLE,
    GROUP
};

enum class PolicyType {
    HEURISTIC,
    LLM
};

enum class FriendshipStatus {
    NONE,
    PENDING,
    ACCEPTED,
    BLOCKED
};

const char* to_string(MessageStatus status);
const char* to_string(RecipientType type);
const char* to_string(PolicyScope scope);
const char* to_string(PolicyType type);

std::optional<MessageStatus> parse_message_status(const std::string& text);
std::optional<RecipientType> parse_recipient_type(const std::string& text);
std::optional<PolicyScope> parse_policy_scope(const std::string& text);
std::optional<PolicyType> parse_policy_type(const std::string& text);

inline bool is_terminal(MessageStatus status) {
    return status != MessageStatus::PENDING;
}

// Payload type marking end-to-end ciphertext the registry must not inspect
inline constexpr const char* kCiphertextPayloadType = "application/mahilo+ciphertext";

struct User {
    std::string id;
    std::string username;
};

struct Message {
    std::string id;
    std::optional<std::string> correlation_id;
    std::string sender_user_id;
    std::string sender_agent;
    RecipientType recipient_type = RecipientType::USER;
    std::string recipient_id;
    std::optional<std::string> recipient_connection_id;
    std::string payload;
    std::string payload_type = "text/plain";
    std::optional<std::string> encryption;         // opaque JSON text
    std::optional<std::string> sender_signature;   // opaque JSON text
    std::optional<std::string> context;
    MessageStatus status = MessageStatus::PENDING;
    std::optional<std::string> rejection_reason;
    int retry_count = 0;
    std::optional<std::string> idempotency_key;
    TimePoint created_at;
    std::optional<TimePoint> delivered_at;
};

struct MessageDelivery {
    std::string id;
    std::string message_id;
    std::string recipient_user_id;
    std::optional<std::string> recipient_connection_id;
    MessageStatus status = MessageStatus::PENDING;
    int retry_count = 0;
    std::optional<std::string> error_message;
    TimePoint created_at;
    std::optional<TimePoint> delivered_at;
};

struct AgentConnection {
    std::string id;
    std::string user_id;
    std::string framework;
    std::string label;
    std::string description;
    std::vector<std::string> capabilities;
    std::string public_key;
    std::string public_key_alg;
    int routing_priority = 0;
    std::string callback_url;
    std::string callback_secret;
    std::string status = "active";
    std::optional<TimePoint> last_seen;
    TimePoint created_at;

    bool is_active() const { return status == "active"; }
};

struct Policy {
    std::string id;
    std::string user_id;
    PolicyScope scope = PolicyScope::GLOBAL;
    std::optional<std::string> target_id;   // user id, role name or group id
    PolicyType policy_type = PolicyType::HEURISTIC;
    std::string content;
    int priority = 0;
    bool enabled = true;
    TimePoint created_at;
};

struct Group {
    std::string id;
    std::string name;
};

// Ledger row a delivery attempt updates: the message itself for a direct
// send, or one fan-out row of a group message.
enum class TargetKind {
    MESSAGE,
    DELIVERY
};

struct DeliveryTarget {
    TargetKind kind = TargetKind::MESSAGE;
    std::string id;            // message id or delivery id
    std::string message_id;    // parent message (== id for MESSAGE)

    static DeliveryTarget for_message(const std::string& message_id) {
        return DeliveryTarget{TargetKind::MESSAGE, message_id, message_id};
    }

    static DeliveryTarget for_delivery(const std::string& delivery_id, const std::string& message_id) {
        return DeliveryTarget{TargetKind::DELIVERY, delivery_id, message_id};
    }

    std::string key() const {
        return (kind == TargetKind::MESSAGE ? "message:" : "delivery:") + id;
    }
};

// Counts derived from a group message's delivery rows
struct DeliveryCounts {
    int recipients = 0;
    int delivered = 0;
    int pending = 0;
    int failed = 0;
};

DeliveryCounts count_deliveries(const std::vector<MessageDelivery>& deliveries);

// Parent status of a fan-out: pending while any row is pending, failed
// when every row failed, delivered otherwise (including no rows)
MessageStatus aggregate_status(const DeliveryCounts& counts);

} // namespace mahilo::core
