/**
 * Send orchestration.
 *
 * Direct send:
 *   relationship -> idempotency -> payload size -> policy (trusted mode,
 *   plaintext only) -> connection resolution -> persist pending ->
 *   first delivery attempt (synchronous)
 *
 * Group send repeats resolution and delivery per member, one delivery row
 * per target connection, and reports aggregate counts. Anything after a
 * failed first attempt belongs to the retry scheduler.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "delivery/dispatcher.hpp"
#include "policy/evaluator.hpp"
#include "router/idempotency_guard.hpp"
#include "store/store.hpp"
#include "util/clock.hpp"

namespace mahilo::router {

enum class SendError {
    NONE,
    RELATIONSHIP_DENIED,
    RECIPIENT_NOT_FOUND,
    GROUP_NOT_FOUND,
    CONNECTION_NOT_FOUND,
    NO_CONNECTIONS,
    PAYLOAD_TOO_LARGE,
    POLICY_REJECTED,
    INVALID_REQUEST,
    STORAGE_ERROR
};

// Stable wire name (NOT_FRIENDS, PAYLOAD_TOO_LARGE, ...)
const char* error_code_name(SendError code);

struct RoutingHints {
    std::vector<std::string> labels;
    std::vector<std::string> tags;
};

struct SendRequest {
    std::string recipient;                              // username or group id
    core::RecipientType recipient_type = core::RecipientType::USER;
    std::optional<std::string> recipient_connection_id;
    RoutingHints routing_hints;
    std::optional<std::string> sender_agent;            // defaults to the first hint label
    std::string message;
    std::optional<std::string> context;
    std::string payload_type = "text/plain";
    std::optional<std::string> encryption;              // JSON object text
    std::optional<std::string> sender_signature;        // JSON object text
    std::optional<std::string> correlation_id;
    std::optional<std::string> idempotency_key;
};

struct SendResult {
    bool success = false;
    SendError code = SendError::NONE;
    std::string error;

    std::string message_id;
    core::MessageStatus status = core::MessageStatus::PENDING;
    bool deduplicated = false;
    std::optional<std::string> rejection_reason;
    std::optional<core::DeliveryCounts> counts;         // group sends only
};

struct GroupStatus {
    std::string message_id;
    core::MessageStatus status = core::MessageStatus::PENDING;
    core::DeliveryCounts counts;
};

struct HistoryRequest {
    std::string user_id;
    std::optional<std::string> direction;   // "sent", "received", anything else = both
    std::optional<std::string> since;       // unix seconds, unix millis or ISO-8601
    std::optional<int> limit;
};

struct HistoryEntry {
    std::string id;
    std::optional<std::string> correlation_id;
    std::string sender;                     // username
    std::string sender_agent;
    std::string recipient;                  // username, or group name
    core::RecipientType recipient_type = core::RecipientType::USER;
    std::string message;
    std::optional<std::string> context;
    core::MessageStatus status = core::MessageStatus::PENDING;
    core::TimePoint created_at;
    std::optional<core::TimePoint> delivered_at;
};

struct HistoryResult {
    bool success = false;
    SendError code = SendError::NONE;
    std::string error;
    std::vector<HistoryEntry> messages;
};

struct RouterOptions {
    bool trusted_mode = false;
    std::size_t max_payload_size = 32768;
};

class MessageRouter {
public:
    MessageRouter(store::MessageLedger& ledger,
                  store::ConnectionRegistry& connections,
                  store::RelationshipOracle& oracle,
                  policy::PolicyEvaluator& evaluator,
                  delivery::DeliveryDispatcher& dispatcher,
                  util::Clock& clock,
                  RouterOptions options);

    // Non-copyable
    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

    // Dispatches on request.recipient_type
    SendResult send(const std::string& sender_id, const SendRequest& request);

    SendResult send_direct(const std::string& sender_id, const SendRequest& request);
    SendResult send_group(const std::string& sender_id, const SendRequest& request);

    // Aggregate counts of a group message; nullopt for unknown or direct messages
    std::optional<GroupStatus> group_status(const std::string& message_id);

    HistoryResult history(const HistoryRequest& request);

    const RouterOptions& options() const { return options_; }

private:
    std::optional<SendResult> check_common(const SendRequest& request) const;
    std::optional<SendResult> deduplicate(const std::string& sender_id, const SendRequest& request);

    core::Message build_message(const std::string& sender_id,
                                const SendRequest& request,
                                const std::string& recipient_id) const;

    SendResult persist_rejection(core::Message message, const std::string& reason);

    std::optional<core::AgentConnection> pick_connection(const std::vector<core::AgentConnection>& candidates,
                                                         const RoutingHints& hints) const;

    std::string build_body(const core::Message& message,
                           const std::string& sender_username,
                           const std::string& connection_id,
                           const std::optional<std::string>& delivery_id,
                           const std::optional<core::Group>& group) const;

    store::MessageLedger& ledger_;
    store::ConnectionRegistry& connections_;
    store::RelationshipOracle& oracle_;
    policy::PolicyEvaluator& evaluator_;
    delivery::DeliveryDispatcher& dispatcher_;
    util::Clock& clock_;
    RouterOptions options_;
    IdempotencyGuard guard_;
};

// UTF-8 byte ceiling on the message payload
std::optional<std::string> check_payload_size(const std::string& payload, std::size_t max_bytes);

// Unix seconds (< 10^12), unix millis or ISO-8601; nullopt when unparsable
std::optional<core::TimePoint> parse_since(const std::string& text);

} // namespace mahilo::router
