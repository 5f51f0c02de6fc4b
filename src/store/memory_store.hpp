#pragma once
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>
#include "store/store.hpp"

namespace mahilo::store {

// Process-local implementation of every storage seam. Used by tests and by
// development deployments that do not need durability.
class MemoryStore final : public Store {
public:
    MemoryStore() = default;

    // Non-copyable
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    // Seeding
    void add_user(const core::User& user);
    void set_friendship(const std::string& requester_id, const std::string& addressee_id,
                        core::FriendshipStatus status);
    void assign_role(const std::string& owner_id, const std::string& friend_id, const std::string& role);
    void add_group(const core::Group& group);
    void add_member(const std::string& group_id, const std::string& user_id, bool active = true);
    void add_policy(const core::Policy& policy);
    bool remove_connection(const std::string& connection_id);

    // MessageLedger
    InsertMessageResult insert_message(const core::Message& message) override;
    std::optional<core::Message> find_message(const std::string& id) override;
    std::optional<core::Message> find_by_idempotency_key(const std::string& sender_id,
                                                         const std::string& key) override;
    Result insert_delivery(const core::MessageDelivery& delivery) override;
    std::optional<core::MessageDelivery> find_delivery(const std::string& id) override;
    std::vector<core::MessageDelivery> deliveries_for(const std::string& message_id) override;
    bool mark_delivered(const core::DeliveryTarget& target, core::TimePoint at) override;
    bool mark_failed(const core::DeliveryTarget& target, const std::string& reason) override;
    std::optional<int> increment_retry_count(const core::DeliveryTarget& target) override;
    bool settle_message(const std::string& message_id, core::MessageStatus status,
                        std::optional<core::TimePoint> delivered_at) override;
    std::vector<core::Message> list_messages(const HistoryQuery& query) override;

    // ConnectionRegistry
    std::optional<core::AgentConnection> find_connection(const std::string& id) override;
    std::vector<core::AgentConnection> active_connections_for(const std::string& user_id) override;
    std::optional<core::AgentConnection> find_by_label(const std::string& user_id,
                                                       const std::string& framework,
                                                       const std::string& label) override;
    Result insert_connection(const core::AgentConnection& connection) override;
    Result update_connection(const core::AgentConnection& connection) override;
    void touch_last_seen(const std::string& connection_id, core::TimePoint at) override;

    // RelationshipOracle
    std::optional<core::User> find_user(const std::string& user_id) override;
    std::optional<core::User> find_user_by_username(const std::string& username) override;
    core::FriendshipStatus friendship(const std::string& a, const std::string& b) override;
    std::vector<std::string> roles_for(const std::string& owner_id, const std::string& friend_id) override;
    std::optional<core::Group> find_group(const std::string& group_id) override;
    bool is_active_member(const std::string& group_id, const std::string& user_id) override;
    std::vector<std::string> active_members(const std::string& group_id) override;

    // PolicyStore
    std::vector<core::Policy> enabled_policies(const std::optional<std::string>& owner_id,
                                               core::PolicyScope scope,
                                               const std::vector<std::string>& target_ids) override;

private:
    using UserPair = std::pair<std::string, std::string>;

    mutable std::mutex ledger_mutex_;
    std::vector<core::Message> messages_;                   // insertion order
    std::map<UserPair, std::string> idempotency_index_;     // (sender, key) -> message id
    std::vector<core::MessageDelivery> deliveries_;
    std::set<UserPair> delivery_index_;                     // (message id, connection id)

    mutable std::mutex directory_mutex_;
    std::unordered_map<std::string, core::User> users_;
    std::map<UserPair, core::FriendshipStatus> friendships_; // (requester, addressee)
    std::map<UserPair, std::vector<std::string>> roles_;     // (owner, friend)
    std::unordered_map<std::string, core::Group> groups_;
    std::map<UserPair, bool> memberships_;                   // (group, user) -> active
    std::vector<core::AgentConnection> connections_;
    std::vector<core::Policy> policies_;

    core::Message* message_locked(const std::string& id);
    core::MessageDelivery* delivery_locked(const std::string& id);
};

} // namespace mahilo::store
