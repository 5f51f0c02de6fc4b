#include "router/message_router.hpp"
#include "util/ids.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace mahilo::router {

using core::AgentConnection;
using core::DeliveryTarget;
using core::Message;
using core::MessageStatus;
using core::RecipientType;

namespace {

constexpr int kDefaultHistoryLimit = 50;
constexpr int kMaxHistoryLimit = 100;

SendResult failure(SendError code, std::string error) {
    SendResult result;
    result.success = false;
    result.code = code;
    result.error = std::move(error);
    return result;
}

bool is_json_object(const std::optional<std::string>& text) {
    if (!text) {
        return true;
    }
    json parsed = json::parse(*text, nullptr, false);
    return !parsed.is_discarded() && parsed.is_object();
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

const char* error_code_name(SendError code) {
    switch (code) {
        case SendError::NONE:                 return "OK";
        case SendError::RELATIONSHIP_DENIED:  return "NOT_FRIENDS";
        case SendError::RECIPIENT_NOT_FOUND:  return "USER_NOT_FOUND";
        case SendError::GROUP_NOT_FOUND:      return "GROUP_NOT_FOUND";
        case SendError::CONNECTION_NOT_FOUND: return "CONNECTION_NOT_FOUND";
        case SendError::NO_CONNECTIONS:       return "NO_CONNECTIONS";
        case SendError::PAYLOAD_TOO_LARGE:    return "PAYLOAD_TOO_LARGE";
        case SendError::POLICY_REJECTED:      return "POLICY_REJECTED";
        case SendError::INVALID_REQUEST:      return "INVALID_REQUEST";
        case SendError::STORAGE_ERROR:        return "STORAGE_ERROR";
    }
    return "UNKNOWN";
}

std::optional<std::string> check_payload_size(const std::string& payload, std::size_t max_bytes) {
    if (payload.size() > max_bytes) {
        return "Payload exceeds maximum size of " + std::to_string(max_bytes) + " bytes";
    }
    return std::nullopt;
}

std::optional<core::TimePoint> parse_since(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    bool digits = std::all_of(text.begin(), text.end(),
                              [](unsigned char c) { return std::isdigit(c); });
    if (digits) {
        if (text.size() > 18) {
            return std::nullopt;
        }
        int64_t value = std::stoll(text);
        if (value < 1000000000000LL) {
            value *= 1000;
        }
        return util::from_unix_millis(value);
    }

    return util::parse_iso8601(text);
}

MessageRouter::MessageRouter(store::MessageLedger& ledger,
                             store::ConnectionRegistry& connections,
                             store::RelationshipOracle& oracle,
                             policy::PolicyEvaluator& evaluator,
                             delivery::DeliveryDispatcher& dispatcher,
                             util::Clock& clock,
                             RouterOptions options)
    : ledger_(ledger)
    , connections_(connections)
    , oracle_(oracle)
    , evaluator_(evaluator)
    , dispatcher_(dispatcher)
    , clock_(clock)
    , options_(options)
    , guard_(ledger) {}

SendResult MessageRouter::send(const std::string& sender_id, const SendRequest& request) {
    if (request.recipient_type == RecipientType::GROUP) {
        return send_group(sender_id, request);
    }
    return send_direct(sender_id, request);
}

// ============================================================================
// Shared steps
// ============================================================================

std::optional<SendResult> MessageRouter::check_common(const SendRequest& request) const {
    if (request.recipient.empty()) {
        return failure(SendError::INVALID_REQUEST, "Recipient is required");
    }
    if (request.message.empty()) {
        return failure(SendError::INVALID_REQUEST, "Message is required");
    }
    if (!is_json_object(request.encryption)) {
        return failure(SendError::INVALID_REQUEST, "encryption must be a JSON object");
    }
    if (!is_json_object(request.sender_signature)) {
        return failure(SendError::INVALID_REQUEST, "sender_signature must be a JSON object");
    }
    return std::nullopt;
}

std::optional<SendResult> MessageRouter::deduplicate(const std::string& sender_id,
                                                     const SendRequest& request) {
    auto prior = guard_.find_prior(sender_id, request.idempotency_key);
    if (!prior) {
        return std::nullopt;
    }

    SendResult result;
    result.success = true;
    result.message_id = prior->id;
    result.status = prior->status;
    result.deduplicated = true;
    result.rejection_reason = prior->rejection_reason;
    return result;
}

Message MessageRouter::build_message(const std::string& sender_id,
                                     const SendRequest& request,
                                     const std::string& recipient_id) const {
    Message message;
    message.id = util::generate_id();
    message.correlation_id = request.correlation_id;
    message.sender_user_id = sender_id;
    if (request.sender_agent && !request.sender_agent->empty()) {
        message.sender_agent = *request.sender_agent;
    } else if (!request.routing_hints.labels.empty() && !request.routing_hints.labels[0].empty()) {
        message.sender_agent = request.routing_hints.labels[0];
    } else {
        message.sender_agent = "agent";
    }
    message.recipient_type = request.recipient_type;
    message.recipient_id = recipient_id;
    message.payload = request.message;
    message.payload_type = request.payload_type.empty() ? "text/plain" : request.payload_type;
    message.encryption = request.encryption;
    message.sender_signature = request.sender_signature;
    message.context = request.context;
    message.status = MessageStatus::PENDING;
    if (request.idempotency_key && !request.idempotency_key->empty()) {
        message.idempotency_key = request.idempotency_key;
    }
    message.created_at = clock_.now();
    return message;
}

SendResult MessageRouter::persist_rejection(Message message, const std::string& reason) {
    message.status = MessageStatus::REJECTED;
    message.rejection_reason = reason;

    auto claimed = guard_.claim(message);
    if (!claimed.result) {
        spdlog::error("Failed to record rejected message: {}", claimed.result.message);
        return failure(SendError::STORAGE_ERROR, "Failed to record message");
    }

    SendResult result = failure(SendError::POLICY_REJECTED, reason);
    result.message_id = claimed.message.id;
    result.status = claimed.message.status;
    result.rejection_reason = claimed.message.rejection_reason;
    result.deduplicated = !claimed.inserted;

    spdlog::info("Message {} from {} rejected by policy: {}",
                 claimed.message.id, message.sender_user_id, reason);
    return result;
}

std::optional<AgentConnection> MessageRouter::pick_connection(const std::vector<AgentConnection>& candidates,
                                                              const RoutingHints& hints) const {
    if (candidates.empty()) {
        return std::nullopt;
    }

    if (!hints.labels.empty()) {
        for (const auto& c : candidates) {
            if (contains(hints.labels, c.label)) {
                return c;
            }
        }
    }

    if (!hints.tags.empty()) {
        for (const auto& c : candidates) {
            bool match = std::any_of(hints.tags.begin(), hints.tags.end(),
                                     [&](const std::string& tag) { return contains(c.capabilities, tag); });
            if (match) {
                return c;
            }
        }
    }

    return candidates.front();
}

std::string MessageRouter::build_body(const Message& message,
                                      const std::string& sender_username,
                                      const std::string& connection_id,
                                      const std::optional<std::string>& delivery_id,
                                      const std::optional<core::Group>& group) const {
    ordered_json body;
    body["message_id"] = message.id;
    if (delivery_id) {
        body["delivery_id"] = *delivery_id;
    }
    if (message.correlation_id) {
        body["correlation_id"] = *message.correlation_id;
    }
    body["recipient_connection_id"] = connection_id;
    body["sender"] = sender_username;
    body["sender_agent"] = message.sender_agent;
    body["message"] = message.payload;
    body["payload_type"] = message.payload_type;
    if (message.encryption) {
        body["encryption"] = ordered_json::parse(*message.encryption);
    }
    if (message.sender_signature) {
        body["sender_signature"] = ordered_json::parse(*message.sender_signature);
    }
    if (message.context) {
        body["context"] = *message.context;
    }
    if (group) {
        body["group_id"] = group->id;
        body["group_name"] = group->name;
    }
    body["timestamp"] = util::to_iso8601(clock_.now());
    return body.dump();
}

// ============================================================================
// Direct send
// ============================================================================

SendResult MessageRouter::send_direct(const std::string& sender_id, const SendRequest& request) {
    if (auto invalid = check_common(request)) {
        return *invalid;
    }

    auto recipient = oracle_.find_user_by_username(request.recipient);
    if (!recipient) {
        return failure(SendError::RECIPIENT_NOT_FOUND, "Recipient user not found");
    }

    if (oracle_.friendship(sender_id, recipient->id) != core::FriendshipStatus::ACCEPTED) {
        return failure(SendError::RELATIONSHIP_DENIED, "Not friends with recipient");
    }

    if (auto duplicate = deduplicate(sender_id, request)) {
        return *duplicate;
    }

    if (auto too_large = check_payload_size(request.message, options_.max_payload_size)) {
        return failure(SendError::PAYLOAD_TOO_LARGE, *too_large);
    }

    Message message = build_message(sender_id, request, recipient->id);

    if (options_.trusted_mode && message.payload_type != core::kCiphertextPayloadType) {
        auto decision = evaluator_.evaluate_direct(sender_id, recipient->id, request.message, request.context);
        if (!decision.allowed) {
            return persist_rejection(message, decision.reason);
        }
    }

    std::optional<AgentConnection> connection;
    if (request.recipient_connection_id) {
        connection = connections_.find_connection(*request.recipient_connection_id);
        if (!connection || connection->user_id != recipient->id || !connection->is_active()) {
            return failure(SendError::CONNECTION_NOT_FOUND, "Recipient connection not found or inactive");
        }
    } else {
        connection = pick_connection(connections_.active_connections_for(recipient->id), request.routing_hints);
        if (!connection) {
            return failure(SendError::NO_CONNECTIONS, "Recipient has no active connections");
        }
    }
    message.recipient_connection_id = connection->id;

    auto claimed = guard_.claim(message);
    if (!claimed.result) {
        spdlog::error("Failed to persist message: {}", claimed.result.message);
        return failure(SendError::STORAGE_ERROR, "Failed to persist message");
    }
    if (!claimed.inserted) {
        SendResult result;
        result.success = true;
        result.message_id = claimed.message.id;
        result.status = claimed.message.status;
        result.deduplicated = true;
        return result;
    }

    std::string sender_username = sender_id;
    if (auto sender = oracle_.find_user(sender_id)) {
        sender_username = sender->username;
    }

    delivery::DeliveryEnvelope envelope;
    envelope.target = DeliveryTarget::for_message(message.id);
    envelope.body = build_body(message, sender_username, connection->id, std::nullopt, std::nullopt);

    auto delivered = dispatcher_.deliver(*connection, envelope);

    SendResult result;
    result.success = true;
    result.message_id = message.id;
    result.status = delivered.status;
    return result;
}

// ============================================================================
// Group send
// ============================================================================

SendResult MessageRouter::send_group(const std::string& sender_id, const SendRequest& request) {
    if (auto invalid = check_common(request)) {
        return *invalid;
    }

    auto group = oracle_.find_group(request.recipient);
    if (!group) {
        return failure(SendError::GROUP_NOT_FOUND, "Group not found");
    }

    if (!oracle_.is_active_member(group->id, sender_id)) {
        return failure(SendError::RELATIONSHIP_DENIED, "Not a member of this group");
    }

    if (auto duplicate = deduplicate(sender_id, request)) {
        return *duplicate;
    }

    if (auto too_large = check_payload_size(request.message, options_.max_payload_size)) {
        return failure(SendError::PAYLOAD_TOO_LARGE, *too_large);
    }

    Message message = build_message(sender_id, request, group->id);

    if (options_.trusted_mode && message.payload_type != core::kCiphertextPayloadType) {
        auto decision = evaluator_.evaluate_group(sender_id, group->id, request.message, request.context);
        if (!decision.allowed) {
            return persist_rejection(message, decision.reason);
        }
    }

    auto claimed = guard_.claim(message);
    if (!claimed.result) {
        spdlog::error("Failed to persist group message: {}", claimed.result.message);
        return failure(SendError::STORAGE_ERROR, "Failed to persist message");
    }
    if (!claimed.inserted) {
        SendResult result;
        result.success = true;
        result.message_id = claimed.message.id;
        result.status = claimed.message.status;
        result.deduplicated = true;
        return result;
    }

    std::vector<std::string> members = oracle_.active_members(group->id);
    members.erase(std::remove(members.begin(), members.end(), sender_id), members.end());

    if (members.empty()) {
        ledger_.settle_message(message.id, MessageStatus::DELIVERED, clock_.now());

        SendResult result;
        result.success = true;
        result.message_id = message.id;
        result.status = MessageStatus::DELIVERED;
        result.counts = core::DeliveryCounts{};
        return result;
    }

    std::string sender_username = sender_id;
    if (auto sender = oracle_.find_user(sender_id)) {
        sender_username = sender->username;
    }

    // Every row exists before the first attempt so the parent cannot settle early
    struct PlannedDelivery {
        std::string delivery_id;
        AgentConnection connection;
    };
    std::vector<PlannedDelivery> planned;

    for (const auto& member_id : members) {
        core::MessageDelivery row;
        row.id = util::generate_id();
        row.message_id = message.id;
        row.recipient_user_id = member_id;
        row.created_at = clock_.now();

        auto candidates = connections_.active_connections_for(member_id);
        if (candidates.empty()) {
            row.status = MessageStatus::FAILED;
            row.error_message = "No active connection";
        } else {
            row.recipient_connection_id = candidates.front().id;
        }

        auto inserted = ledger_.insert_delivery(row);
        if (!inserted) {
            spdlog::error("Failed to create delivery row for member {} of message {}: {}",
                          member_id, message.id, inserted.message);
            continue;
        }
        if (!candidates.empty()) {
            planned.push_back({row.id, candidates.front()});
        }
    }

    for (const auto& item : planned) {
        delivery::DeliveryEnvelope envelope;
        envelope.target = DeliveryTarget::for_delivery(item.delivery_id, message.id);
        envelope.body = build_body(message, sender_username, item.connection.id, item.delivery_id, group);
        envelope.group_id = group->id;
        dispatcher_.deliver(item.connection, envelope);
    }

    auto counts = core::count_deliveries(ledger_.deliveries_for(message.id));
    auto status = core::aggregate_status(counts);
    if (status != MessageStatus::PENDING) {
        std::optional<core::TimePoint> delivered_at;
        if (status == MessageStatus::DELIVERED) {
            delivered_at = clock_.now();
        }
        ledger_.settle_message(message.id, status, delivered_at);
    }

    spdlog::info("Group message {} to '{}': recipients={} delivered={} pending={} failed={}",
                 message.id, group->name, counts.recipients, counts.delivered, counts.pending, counts.failed);

    SendResult result;
    result.success = true;
    result.message_id = message.id;
    result.status = status;
    result.counts = counts;
    return result;
}

std::optional<GroupStatus> MessageRouter::group_status(const std::string& message_id) {
    auto message = ledger_.find_message(message_id);
    if (!message || message->recipient_type != RecipientType::GROUP) {
        return std::nullopt;
    }

    GroupStatus status;
    status.message_id = message->id;
    status.status = message->status;
    status.counts = core::count_deliveries(ledger_.deliveries_for(message->id));
    return status;
}

// ============================================================================
// History
// ============================================================================

HistoryResult MessageRouter::history(const HistoryRequest& request) {
    HistoryResult result;

    store::HistoryQuery query;
    query.user_id = request.user_id;
    if (request.direction && *request.direction == "sent") {
        query.direction = store::HistoryDirection::SENT;
    } else if (request.direction && *request.direction == "received") {
        query.direction = store::HistoryDirection::RECEIVED;
    } else {
        query.direction = store::HistoryDirection::BOTH;
    }

    if (request.since && !request.since->empty()) {
        query.since = parse_since(*request.since);
        if (!query.since) {
            result.code = SendError::INVALID_REQUEST;
            result.error = "Invalid since parameter";
            return result;
        }
    }

    query.limit = std::clamp(request.limit.value_or(kDefaultHistoryLimit), 1, kMaxHistoryLimit);

    for (const auto& m : ledger_.list_messages(query)) {
        HistoryEntry entry;
        entry.id = m.id;
        entry.correlation_id = m.correlation_id;
        entry.sender_agent = m.sender_agent;
        entry.recipient_type = m.recipient_type;
        entry.message = m.payload;
        entry.context = m.context;
        entry.status = m.status;
        entry.created_at = m.created_at;
        entry.delivered_at = m.delivered_at;

        auto sender = oracle_.find_user(m.sender_user_id);
        entry.sender = sender ? sender->username : m.sender_user_id;

        if (m.recipient_type == RecipientType::USER) {
            auto recipient = oracle_.find_user(m.recipient_id);
            entry.recipient = recipient ? recipient->username : m.recipient_id;
        } else {
            auto group = oracle_.find_group(m.recipient_id);
            entry.recipient = group ? group->name : m.recipient_id;
        }

        result.messages.push_back(std::move(entry));
    }

    result.success = true;
    return result;
}

} // namespace mahilo::router
