#include "store/memory_store.hpp"
#include <algorithm>
#include <cctype>

namespace mahilo::store {

using core::AgentConnection;
using core::DeliveryTarget;
using core::FriendshipStatus;
using core::Message;
using core::MessageDelivery;
using core::MessageStatus;
using core::TargetKind;

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ============================================================================
// Seeding
// ============================================================================

void MemoryStore::add_user(const core::User& user) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    core::User stored = user;
    stored.username = to_lower(user.username);
    users_[stored.id] = stored;
}

void MemoryStore::set_friendship(const std::string& requester_id, const std::string& addressee_id,
                                 FriendshipStatus status) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    friendships_.erase({addressee_id, requester_id});
    friendships_[{requester_id, addressee_id}] = status;
}

void MemoryStore::assign_role(const std::string& owner_id, const std::string& friend_id,
                              const std::string& role) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    roles_[{owner_id, friend_id}].push_back(role);
}

void MemoryStore::add_group(const core::Group& group) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    groups_[group.id] = group;
}

void MemoryStore::add_member(const std::string& group_id, const std::string& user_id, bool active) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    memberships_[{group_id, user_id}] = active;
}

void MemoryStore::add_policy(const core::Policy& policy) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    policies_.push_back(policy);
}

bool MemoryStore::remove_connection(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    auto it = std::find_if(connections_.begin(), connections_.end(),
        [&](const AgentConnection& c) { return c.id == connection_id; });
    if (it == connections_.end()) {
        return false;
    }
    connections_.erase(it);
    return true;
}

// ============================================================================
// MessageLedger
// ============================================================================

Message* MemoryStore::message_locked(const std::string& id) {
    for (auto& m : messages_) {
        if (m.id == id) {
            return &m;
        }
    }
    return nullptr;
}

MessageDelivery* MemoryStore::delivery_locked(const std::string& id) {
    for (auto& d : deliveries_) {
        if (d.id == id) {
            return &d;
        }
    }
    return nullptr;
}

InsertMessageResult MemoryStore::insert_message(const Message& message) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    InsertMessageResult out;

    if (message_locked(message.id)) {
        out.result = Result::err(ErrorCode::CONSTRAINT_VIOLATION, "duplicate message id");
        return out;
    }

    if (message.idempotency_key) {
        auto it = idempotency_index_.find({message.sender_user_id, *message.idempotency_key});
        if (it != idempotency_index_.end()) {
            out.inserted = false;
            out.message = *message_locked(it->second);
            return out;
        }
        idempotency_index_[{message.sender_user_id, *message.idempotency_key}] = message.id;
    }

    messages_.push_back(message);
    out.inserted = true;
    out.message = message;
    return out;
}

std::optional<Message> MemoryStore::find_message(const std::string& id) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    if (auto* m = message_locked(id)) {
        return *m;
    }
    return std::nullopt;
}

std::optional<Message> MemoryStore::find_by_idempotency_key(const std::string& sender_id,
                                                            const std::string& key) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    auto it = idempotency_index_.find({sender_id, key});
    if (it == idempotency_index_.end()) {
        return std::nullopt;
    }
    return *message_locked(it->second);
}

Result MemoryStore::insert_delivery(const MessageDelivery& delivery) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    if (delivery_locked(delivery.id)) {
        return Result::err(ErrorCode::CONSTRAINT_VIOLATION, "duplicate delivery id");
    }
    if (delivery.recipient_connection_id) {
        UserPair key{delivery.message_id, *delivery.recipient_connection_id};
        if (delivery_index_.count(key)) {
            return Result::err(ErrorCode::CONSTRAINT_VIOLATION,
                               "delivery already exists for this connection");
        }
        delivery_index_.insert(key);
    }
    deliveries_.push_back(delivery);
    return Result::ok();
}

std::optional<MessageDelivery> MemoryStore::find_delivery(const std::string& id) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    if (auto* d = delivery_locked(id)) {
        return *d;
    }
    return std::nullopt;
}

std::vector<MessageDelivery> MemoryStore::deliveries_for(const std::string& message_id) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    std::vector<MessageDelivery> out;
    for (const auto& d : deliveries_) {
        if (d.message_id == message_id) {
            out.push_back(d);
        }
    }
    return out;
}

bool MemoryStore::mark_delivered(const DeliveryTarget& target, core::TimePoint at) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    if (target.kind == TargetKind::MESSAGE) {
        auto* m = message_locked(target.id);
        if (!m || m->status != MessageStatus::PENDING) {
            return false;
        }
        m->status = MessageStatus::DELIVERED;
        m->delivered_at = at;
        return true;
    }

    auto* d = delivery_locked(target.id);
    if (!d || d->status != MessageStatus::PENDING) {
        return false;
    }
    d->status = MessageStatus::DELIVERED;
    d->delivered_at = at;
    return true;
}

bool MemoryStore::mark_failed(const DeliveryTarget& target, const std::string& reason) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    if (target.kind == TargetKind::MESSAGE) {
        auto* m = message_locked(target.id);
        if (!m || m->status != MessageStatus::PENDING) {
            return false;
        }
        m->status = MessageStatus::FAILED;
        m->rejection_reason = reason;
        return true;
    }

    auto* d = delivery_locked(target.id);
    if (!d || d->status != MessageStatus::PENDING) {
        return false;
    }
    d->status = MessageStatus::FAILED;
    d->error_message = reason;
    return true;
}

std::optional<int> MemoryStore::increment_retry_count(const DeliveryTarget& target) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    if (target.kind == TargetKind::MESSAGE) {
        auto* m = message_locked(target.id);
        if (!m || m->status != MessageStatus::PENDING) {
            return std::nullopt;
        }
        return ++m->retry_count;
    }

    auto* d = delivery_locked(target.id);
    if (!d || d->status != MessageStatus::PENDING) {
        return std::nullopt;
    }
    return ++d->retry_count;
}

bool MemoryStore::settle_message(const std::string& message_id, MessageStatus status,
                                 std::optional<core::TimePoint> delivered_at) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    auto* m = message_locked(message_id);
    if (!m || m->status != MessageStatus::PENDING) {
        return false;
    }
    m->status = status;
    if (delivered_at) {
        m->delivered_at = delivered_at;
    }
    return true;
}

std::vector<Message> MemoryStore::list_messages(const HistoryQuery& query) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    std::vector<Message> out;

    auto matches = [&](const Message& m) {
        bool sent = m.sender_user_id == query.user_id;
        bool received = m.recipient_type == core::RecipientType::USER && m.recipient_id == query.user_id;
        switch (query.direction) {
            case HistoryDirection::SENT:     return sent;
            case HistoryDirection::RECEIVED: return received;
            case HistoryDirection::BOTH:     return sent || received;
        }
        return false;
    };

    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
        if (!matches(*it)) {
            continue;
        }
        if (query.since && it->created_at <= *query.since) {
            continue;
        }
        out.push_back(*it);
    }

    std::stable_sort(out.begin(), out.end(), [](const Message& a, const Message& b) {
        return a.created_at > b.created_at;
    });
    if (static_cast<int>(out.size()) > query.limit) {
        out.resize(static_cast<std::size_t>(query.limit));
    }
    return out;
}

// ============================================================================
// ConnectionRegistry
// ============================================================================

std::optional<AgentConnection> MemoryStore::find_connection(const std::string& id) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    for (const auto& c : connections_) {
        if (c.id == id) {
            return c;
        }
    }
    return std::nullopt;
}

std::vector<AgentConnection> MemoryStore::active_connections_for(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    std::vector<AgentConnection> out;
    for (const auto& c : connections_) {
        if (c.user_id == user_id && c.is_active()) {
            out.push_back(c);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const AgentConnection& a, const AgentConnection& b) {
        return a.routing_priority > b.routing_priority;
    });
    return out;
}

std::optional<AgentConnection> MemoryStore::find_by_label(const std::string& user_id,
                                                          const std::string& framework,
                                                          const std::string& label) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    for (const auto& c : connections_) {
        if (c.user_id == user_id && c.framework == framework && c.label == label) {
            return c;
        }
    }
    return std::nullopt;
}

Result MemoryStore::insert_connection(const AgentConnection& connection) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    for (const auto& c : connections_) {
        if (c.id == connection.id ||
            (c.user_id == connection.user_id && c.framework == connection.framework &&
             c.label == connection.label)) {
            return Result::err(ErrorCode::CONSTRAINT_VIOLATION, "connection already exists");
        }
    }
    connections_.push_back(connection);
    return Result::ok();
}

Result MemoryStore::update_connection(const AgentConnection& connection) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    for (auto& c : connections_) {
        if (c.id == connection.id) {
            c = connection;
            return Result::ok();
        }
    }
    return Result::err(ErrorCode::NOT_FOUND, "connection not found");
}

void MemoryStore::touch_last_seen(const std::string& connection_id, core::TimePoint at) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    for (auto& c : connections_) {
        if (c.id == connection_id) {
            c.last_seen = at;
            return;
        }
    }
}

// ============================================================================
// RelationshipOracle
// ============================================================================

std::optional<core::User> MemoryStore::find_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<core::User> MemoryStore::find_user_by_username(const std::string& username) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    const std::string wanted = to_lower(username);
    for (const auto& [id, user] : users_) {
        if (user.username == wanted) {
            return user;
        }
    }
    return std::nullopt;
}

FriendshipStatus MemoryStore::friendship(const std::string& a, const std::string& b) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    auto it = friendships_.find({a, b});
    if (it != friendships_.end()) {
        return it->second;
    }
    it = friendships_.find({b, a});
    if (it != friendships_.end()) {
        return it->second;
    }
    return FriendshipStatus::NONE;
}

std::vector<std::string> MemoryStore::roles_for(const std::string& owner_id, const std::string& friend_id) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    auto it = roles_.find({owner_id, friend_id});
    if (it == roles_.end()) {
        return {};
    }
    return it->second;
}

std::optional<core::Group> MemoryStore::find_group(const std::string& group_id) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    auto it = groups_.find(group_id);
    if (it == groups_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryStore::is_active_member(const std::string& group_id, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    auto it = memberships_.find({group_id, user_id});
    return it != memberships_.end() && it->second;
}

std::vector<std::string> MemoryStore::active_members(const std::string& group_id) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    std::vector<std::string> out;
    for (const auto& [key, active] : memberships_) {
        if (key.first == group_id && active) {
            out.push_back(key.second);
        }
    }
    return out;
}

// ============================================================================
// PolicyStore
// ============================================================================

std::vector<core::Policy> MemoryStore::enabled_policies(const std::optional<std::string>& owner_id,
                                                        core::PolicyScope scope,
                                                        const std::vector<std::string>& target_ids) {
    std::lock_guard<std::mutex> lock(directory_mutex_);
    std::vector<core::Policy> out;
    for (const auto& p : policies_) {
        if (!p.enabled || p.scope != scope) {
            continue;
        }
        if (owner_id && p.user_id != *owner_id) {
            continue;
        }
        if (!target_ids.empty()) {
            if (!p.target_id ||
                std::find(target_ids.begin(), target_ids.end(), *p.target_id) == target_ids.end()) {
                continue;
            }
        }
        out.push_back(p);
    }
    return out;
}

} // namespace mahilo::store
