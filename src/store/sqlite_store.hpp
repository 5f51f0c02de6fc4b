#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "store/sqlite_db.hpp"
#include "store/store.hpp"

namespace mahilo::store {

// SQLite-backed implementation of every storage seam. One connection,
// serialized by an internal mutex. Uniqueness of idempotency keys and of
// (message, connection) delivery rows is enforced by the schema.
class SqliteStore final : public Store {
public:
    // Opens (or creates) the database and applies the schema.
    // Throws std::runtime_error when the file cannot be opened.
    explicit SqliteStore(const std::string& path);

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // Seeding
    Result add_user(const core::User& user);
    Result set_friendship(const std::string& requester_id, const std::string& addressee_id,
                          core::FriendshipStatus status);
    Result assign_role(const std::string& owner_id, const std::string& friend_id, const std::string& role);
    Result add_group(const core::Group& group);
    Result add_member(const std::string& group_id, const std::string& user_id, bool active = true);
    Result add_policy(const core::Policy& policy);

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
    void migrate();
    Result translate(int rc) const;
    Result execute(Statement& st);

    std::unique_ptr<SqliteDb> db_;
    std::mutex mutex_;
};

} // namespace mahilo::store
