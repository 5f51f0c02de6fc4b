/**
 * Storage seams consumed by the routing core.
 *
 * - MessageLedger: messages and fan-out delivery rows (read/write)
 * - ConnectionRegistry: agent webhook targets
 * - RelationshipOracle: users, friendships, roles, groups (read-only)
 * - PolicyStore: enabled policies (read-only)
 *
 * Backends translate their own failures into store::ErrorCode.
 */
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/types.hpp"

namespace mahilo::store {

enum class ErrorCode {
    OK = 0,
    NOT_FOUND,
    CONSTRAINT_VIOLATION,
    BUSY,
    IO_ERROR,
    INTERNAL_ERROR
};

struct Result {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    static Result ok() { return {}; }
    static Result err(ErrorCode c, std::string msg = {}) { return {c, std::move(msg)}; }

    explicit operator bool() const { return code == ErrorCode::OK; }
};

// Outcome of inserting a message. When the (sender, idempotency_key) pair
// already exists, inserted is false and message holds the existing row.
struct InsertMessageResult {
    Result result;
    bool inserted = false;
    core::Message message;
};

enum class HistoryDirection {
    SENT,
    RECEIVED,
    BOTH
};

struct HistoryQuery {
    std::string user_id;
    HistoryDirection direction = HistoryDirection::BOTH;
    std::optional<core::TimePoint> since;   // exclusive
    int limit = 50;
};

class MessageLedger {
public:
    virtual ~MessageLedger() = default;

    virtual InsertMessageResult insert_message(const core::Message& message) = 0;
    virtual std::optional<core::Message> find_message(const std::string& id) = 0;
    virtual std::optional<core::Message> find_by_idempotency_key(const std::string& sender_id,
                                                                 const std::string& key) = 0;

    virtual Result insert_delivery(const core::MessageDelivery& delivery) = 0;
    virtual std::optional<core::MessageDelivery> find_delivery(const std::string& id) = 0;
    virtual std::vector<core::MessageDelivery> deliveries_for(const std::string& message_id) = 0;

    // Row transitions only apply to rows still pending; they return false
    // when the row is missing or already terminal.
    virtual bool mark_delivered(const core::DeliveryTarget& target, core::TimePoint at) = 0;
    virtual bool mark_failed(const core::DeliveryTarget& target, const std::string& reason) = 0;

    // Atomic read-modify-write on the persisted counter. Returns the new
    // count, or nullopt when the row is missing or no longer pending.
    virtual std::optional<int> increment_retry_count(const core::DeliveryTarget& target) = 0;

    // Settles a pending parent message (group fan-out aggregate).
    virtual bool settle_message(const std::string& message_id, core::MessageStatus status,
                                std::optional<core::TimePoint> delivered_at) = 0;

    // Newest first
    virtual std::vector<core::Message> list_messages(const HistoryQuery& query) = 0;
};

class ConnectionRegistry {
public:
    virtual ~ConnectionRegistry() = default;

    virtual std::optional<core::AgentConnection> find_connection(const std::string& id) = 0;

    // Active connections ordered by routing_priority, highest first
    virtual std::vector<core::AgentConnection> active_connections_for(const std::string& user_id) = 0;

    virtual std::optional<core::AgentConnection> find_by_label(const std::string& user_id,
                                                               const std::string& framework,
                                                               const std::string& label) = 0;
    virtual Result insert_connection(const core::AgentConnection& connection) = 0;
    virtual Result update_connection(const core::AgentConnection& connection) = 0;

    virtual void touch_last_seen(const std::string& connection_id, core::TimePoint at) = 0;
};

class RelationshipOracle {
public:
    virtual ~RelationshipOracle() = default;

    virtual std::optional<core::User> find_user(const std::string& user_id) = 0;
    virtual std::optional<core::User> find_user_by_username(const std::string& username) = 0;

    // Status of the friendship between a and b in either direction
    virtual core::FriendshipStatus friendship(const std::string& a, const std::string& b) = 0;

    // Roles owner_id has assigned to friend_id
    virtual std::vector<std::string> roles_for(const std::string& owner_id,
                                               const std::string& friend_id) = 0;

    virtual std::optional<core::Group> find_group(const std::string& group_id) = 0;
    virtual bool is_active_member(const std::string& group_id, const std::string& user_id) = 0;
    virtual std::vector<std::string> active_members(const std::string& group_id) = 0;
};

class PolicyStore {
public:
    virtual ~PolicyStore() = default;

    // Enabled policies of one scope, in arrival order. owner_id filters by
    // policy owner when set; target_ids filters target_id when non-empty.
    virtual std::vector<core::Policy> enabled_policies(const std::optional<std::string>& owner_id,
                                                       core::PolicyScope scope,
                                                       const std::vector<std::string>& target_ids) = 0;
};

// One backend serving every seam (MemoryStore, SqliteStore)
class Store : public MessageLedger,
              public ConnectionRegistry,
              public RelationshipOracle,
              public PolicyStore {
};

} // namespace mahilo::store
