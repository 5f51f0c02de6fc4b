#include "store/sqlite_store.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace mahilo::store {

using core::AgentConnection;
using core::DeliveryTarget;
using core::FriendshipStatus;
using core::Message;
using core::MessageDelivery;
using core::MessageStatus;
using core::TargetKind;
using util::from_unix_millis;
using util::to_unix_millis;

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS users (
    id TEXT PRIMARY KEY,
    username TEXT NOT NULL UNIQUE
);

CREATE TABLE IF NOT EXISTS friendships (
    requester_id TEXT NOT NULL,
    addressee_id TEXT NOT NULL,
    status TEXT NOT NULL,
    PRIMARY KEY (requester_id, addressee_id)
);

CREATE TABLE IF NOT EXISTS friend_roles (
    owner_id TEXT NOT NULL,
    friend_id TEXT NOT NULL,
    role TEXT NOT NULL,
    PRIMARY KEY (owner_id, friend_id, role)
);

CREATE TABLE IF NOT EXISTS user_groups (
    id TEXT PRIMARY KEY,
    name TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS group_memberships (
    group_id TEXT NOT NULL,
    user_id TEXT NOT NULL,
    status TEXT NOT NULL,
    PRIMARY KEY (group_id, user_id)
);

CREATE TABLE IF NOT EXISTS agent_connections (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    framework TEXT NOT NULL,
    label TEXT NOT NULL,
    description TEXT NOT NULL DEFAULT '',
    capabilities TEXT NOT NULL DEFAULT '[]',
    public_key TEXT NOT NULL DEFAULT '',
    public_key_alg TEXT NOT NULL DEFAULT '',
    routing_priority INTEGER NOT NULL DEFAULT 0,
    callback_url TEXT NOT NULL,
    callback_secret TEXT NOT NULL,
    status TEXT NOT NULL DEFAULT 'active',
    last_seen INTEGER,
    created_at INTEGER NOT NULL,
    UNIQUE (user_id, framework, label)
);

CREATE TABLE IF NOT EXISTS policies (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    scope TEXT NOT NULL,
    target_id TEXT,
    policy_type TEXT NOT NULL,
    content TEXT NOT NULL,
    priority INTEGER NOT NULL DEFAULT 0,
    enabled INTEGER NOT NULL DEFAULT 1,
    created_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS messages (
    id TEXT PRIMARY KEY,
    correlation_id TEXT,
    sender_user_id TEXT NOT NULL,
    sender_agent TEXT NOT NULL,
    recipient_type TEXT NOT NULL,
    recipient_id TEXT NOT NULL,
    recipient_connection_id TEXT,
    payload TEXT NOT NULL,
    payload_type TEXT NOT NULL,
    encryption TEXT,
    sender_signature TEXT,
    context TEXT,
    status TEXT NOT NULL,
    rejection_reason TEXT,
    retry_count INTEGER NOT NULL DEFAULT 0,
    idempotency_key TEXT,
    created_at INTEGER NOT NULL,
    delivered_at INTEGER
);

CREATE UNIQUE INDEX IF NOT EXISTS messages_sender_idempotency
    ON messages (sender_user_id, idempotency_key);
CREATE INDEX IF NOT EXISTS messages_recipient
    ON messages (recipient_type, recipient_id, created_at);

CREATE TABLE IF NOT EXISTS message_deliveries (
    id TEXT PRIMARY KEY,
    message_id TEXT NOT NULL REFERENCES messages(id),
    recipient_user_id TEXT NOT NULL,
    recipient_connection_id TEXT,
    status TEXT NOT NULL,
    retry_count INTEGER NOT NULL DEFAULT 0,
    error_message TEXT,
    created_at INTEGER NOT NULL,
    delivered_at INTEGER,
    UNIQUE (message_id, recipient_connection_id)
);
)SQL";

const char* kMessageColumns =
    "id, correlation_id, sender_user_id, sender_agent, recipient_type, recipient_id, "
    "recipient_connection_id, payload, payload_type, encryption, sender_signature, context, "
    "status, rejection_reason, retry_count, idempotency_key, created_at, delivered_at";

const char* kDeliveryColumns =
    "id, message_id, recipient_user_id, recipient_connection_id, status, retry_count, "
    "error_message, created_at, delivered_at";

const char* kConnectionColumns =
    "id, user_id, framework, label, description, capabilities, public_key, public_key_alg, "
    "routing_priority, callback_url, callback_secret, status, last_seen, created_at";

const char* kPolicyColumns =
    "id, user_id, scope, target_id, policy_type, content, priority, enabled, created_at";

const char* friendship_text(FriendshipStatus status) {
    switch (status) {
        case FriendshipStatus::PENDING:  return "pending";
        case FriendshipStatus::ACCEPTED: return "accepted";
        case FriendshipStatus::BLOCKED:  return "blocked";
        case FriendshipStatus::NONE:     break;
    }
    return "none";
}

FriendshipStatus parse_friendship(const std::string& text) {
    if (text == "pending") return FriendshipStatus::PENDING;
    if (text == "accepted") return FriendshipStatus::ACCEPTED;
    if (text == "blocked") return FriendshipStatus::BLOCKED;
    return FriendshipStatus::NONE;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<core::TimePoint> optional_time(const Statement& st, int col) {
    if (st.is_null(col)) {
        return std::nullopt;
    }
    return from_unix_millis(st.int64(col));
}

void bind_time(Statement& st, int idx, const std::optional<core::TimePoint>& tp) {
    if (tp) {
        st.bind(idx, to_unix_millis(*tp));
    } else {
        st.bind_null(idx);
    }
}

Message read_message(const Statement& st) {
    Message m;
    m.id = st.text(0);
    m.correlation_id = st.optional_text(1);
    m.sender_user_id = st.text(2);
    m.sender_agent = st.text(3);
    m.recipient_type = core::parse_recipient_type(st.text(4)).value_or(core::RecipientType::USER);
    m.recipient_id = st.text(5);
    m.recipient_connection_id = st.optional_text(6);
    m.payload = st.text(7);
    m.payload_type = st.text(8);
    m.encryption = st.optional_text(9);
    m.sender_signature = st.optional_text(10);
    m.context = st.optional_text(11);
    m.status = core::parse_message_status(st.text(12)).value_or(MessageStatus::PENDING);
    m.rejection_reason = st.optional_text(13);
    m.retry_count = st.integer(14);
    m.idempotency_key = st.optional_text(15);
    m.created_at = from_unix_millis(st.int64(16));
    m.delivered_at = optional_time(st, 17);
    return m;
}

MessageDelivery read_delivery(const Statement& st) {
    MessageDelivery d;
    d.id = st.text(0);
    d.message_id = st.text(1);
    d.recipient_user_id = st.text(2);
    d.recipient_connection_id = st.optional_text(3);
    d.status = core::parse_message_status(st.text(4)).value_or(MessageStatus::PENDING);
    d.retry_count = st.integer(5);
    d.error_message = st.optional_text(6);
    d.created_at = from_unix_millis(st.int64(7));
    d.delivered_at = optional_time(st, 8);
    return d;
}

AgentConnection read_connection(const Statement& st) {
    AgentConnection c;
    c.id = st.text(0);
    c.user_id = st.text(1);
    c.framework = st.text(2);
    c.label = st.text(3);
    c.description = st.text(4);
    json caps = json::parse(st.text(5), nullptr, false);
    if (caps.is_array()) {
        for (const auto& cap : caps) {
            if (cap.is_string()) {
                c.capabilities.push_back(cap.get<std::string>());
            }
        }
    }
    c.public_key = st.text(6);
    c.public_key_alg = st.text(7);
    c.routing_priority = st.integer(8);
    c.callback_url = st.text(9);
    c.callback_secret = st.text(10);
    c.status = st.text(11);
    c.last_seen = optional_time(st, 12);
    c.created_at = from_unix_millis(st.int64(13));
    return c;
}

core::Policy read_policy(const Statement& st) {
    core::Policy p;
    p.id = st.text(0);
    p.user_id = st.text(1);
    p.scope = core::parse_policy_scope(st.text(2)).value_or(core::PolicyScope::GLOBAL);
    p.target_id = st.optional_text(3);
    p.policy_type = core::parse_policy_type(st.text(4)).value_or(core::PolicyType::HEURISTIC);
    p.content = st.text(5);
    p.priority = st.integer(6);
    p.enabled = st.integer(7) != 0;
    p.created_at = from_unix_millis(st.int64(8));
    return p;
}

std::optional<Message> select_message(SqliteDb& db, const std::string& where,
                                      const std::vector<std::string>& args) {
    std::string sql = std::string("SELECT ") + kMessageColumns + " FROM messages WHERE " + where + ";";
    Statement st(db, sql.c_str());
    for (std::size_t i = 0; i < args.size(); ++i) {
        st.bind(static_cast<int>(i + 1), args[i]);
    }
    if (st.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return read_message(st);
}

const char* table_for(const DeliveryTarget& target) {
    return target.kind == TargetKind::MESSAGE ? "messages" : "message_deliveries";
}

} // namespace

SqliteStore::SqliteStore(const std::string& path)
    : db_(std::make_unique<SqliteDb>(path)) {
    migrate();
    spdlog::info("SQLite store ready at {}", path);
}

void SqliteStore::migrate() {
    db_->exec(kSchema);
}

Result SqliteStore::translate(int rc) const {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return Result::ok();
    }

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::err(ErrorCode::BUSY, sqlite3_errmsg(db_->handle()));
        case SQLITE_CONSTRAINT:
            return Result::err(ErrorCode::CONSTRAINT_VIOLATION, sqlite3_errmsg(db_->handle()));
        case SQLITE_IOERR:
            return Result::err(ErrorCode::IO_ERROR, sqlite3_errmsg(db_->handle()));
        default:
            return Result::err(ErrorCode::INTERNAL_ERROR, sqlite3_errmsg(db_->handle()));
    }
}

Result SqliteStore::execute(Statement& st) {
    return translate(st.step());
}

// ============================================================================
// Seeding
// ============================================================================

Result SqliteStore::add_user(const core::User& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_, "INSERT INTO users (id, username) VALUES (?, ?);");
    st.bind(1, user.id);
    st.bind(2, to_lower(user.username));
    return execute(st);
}

Result SqliteStore::set_friendship(const std::string& requester_id, const std::string& addressee_id,
                                   FriendshipStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);

    Statement del(*db_, "DELETE FROM friendships WHERE requester_id = ? AND addressee_id = ?;");
    del.bind(1, addressee_id);
    del.bind(2, requester_id);
    Result r = execute(del);
    if (!r) {
        return r;
    }

    Statement st(*db_,
        "INSERT INTO friendships (requester_id, addressee_id, status) VALUES (?, ?, ?) "
        "ON CONFLICT (requester_id, addressee_id) DO UPDATE SET status = excluded.status;");
    st.bind(1, requester_id);
    st.bind(2, addressee_id);
    st.bind(3, std::string(friendship_text(status)));
    r = execute(st);
    if (r) {
        tx.commit();
    }
    return r;
}

Result SqliteStore::assign_role(const std::string& owner_id, const std::string& friend_id,
                                const std::string& role) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_, "INSERT OR IGNORE INTO friend_roles (owner_id, friend_id, role) VALUES (?, ?, ?);");
    st.bind(1, owner_id);
    st.bind(2, friend_id);
    st.bind(3, role);
    return execute(st);
}

Result SqliteStore::add_group(const core::Group& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_, "INSERT INTO user_groups (id, name) VALUES (?, ?);");
    st.bind(1, group.id);
    st.bind(2, group.name);
    return execute(st);
}

Result SqliteStore::add_member(const std::string& group_id, const std::string& user_id, bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_,
        "INSERT INTO group_memberships (group_id, user_id, status) VALUES (?, ?, ?) "
        "ON CONFLICT (group_id, user_id) DO UPDATE SET status = excluded.status;");
    st.bind(1, group_id);
    st.bind(2, user_id);
    st.bind(3, std::string(active ? "active" : "invited"));
    return execute(st);
}

Result SqliteStore::add_policy(const core::Policy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("INSERT INTO policies (") + kPolicyColumns +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    Statement st(*db_, sql.c_str());
    st.bind(1, policy.id);
    st.bind(2, policy.user_id);
    st.bind(3, std::string(core::to_string(policy.scope)));
    st.bind(4, policy.target_id);
    st.bind(5, std::string(core::to_string(policy.policy_type)));
    st.bind(6, policy.content);
    st.bind(7, policy.priority);
    st.bind(8, policy.enabled ? 1 : 0);
    st.bind(9, to_unix_millis(policy.created_at));
    return execute(st);
}

// ============================================================================
// MessageLedger
// ============================================================================

InsertMessageResult SqliteStore::insert_message(const Message& m) {
    std::lock_guard<std::mutex> lock(mutex_);
    InsertMessageResult out;

    std::string sql = std::string("INSERT INTO messages (") + kMessageColumns +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    Statement st(*db_, sql.c_str());
    st.bind(1, m.id);
    st.bind(2, m.correlation_id);
    st.bind(3, m.sender_user_id);
    st.bind(4, m.sender_agent);
    st.bind(5, std::string(core::to_string(m.recipient_type)));
    st.bind(6, m.recipient_id);
    st.bind(7, m.recipient_connection_id);
    st.bind(8, m.payload);
    st.bind(9, m.payload_type);
    st.bind(10, m.encryption);
    st.bind(11, m.sender_signature);
    st.bind(12, m.context);
    st.bind(13, std::string(core::to_string(m.status)));
    st.bind(14, m.rejection_reason);
    st.bind(15, m.retry_count);
    st.bind(16, m.idempotency_key);
    st.bind(17, to_unix_millis(m.created_at));
    bind_time(st, 18, m.delivered_at);

    Result r = execute(st);
    if (r) {
        out.inserted = true;
        out.message = m;
        return out;
    }

    // A concurrent send with the same key won the insert; hand back its row
    if (r.code == ErrorCode::CONSTRAINT_VIOLATION && m.idempotency_key) {
        auto existing = select_message(*db_, "sender_user_id = ? AND idempotency_key = ?",
                                       {m.sender_user_id, *m.idempotency_key});
        if (existing) {
            out.inserted = false;
            out.message = *existing;
            return out;
        }
    }

    out.result = r;
    return out;
}

std::optional<Message> SqliteStore::find_message(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_message(*db_, "id = ?", {id});
}

std::optional<Message> SqliteStore::find_by_idempotency_key(const std::string& sender_id,
                                                            const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_message(*db_, "sender_user_id = ? AND idempotency_key = ?", {sender_id, key});
}

Result SqliteStore::insert_delivery(const MessageDelivery& d) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("INSERT INTO message_deliveries (") + kDeliveryColumns +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    Statement st(*db_, sql.c_str());
    st.bind(1, d.id);
    st.bind(2, d.message_id);
    st.bind(3, d.recipient_user_id);
    st.bind(4, d.recipient_connection_id);
    st.bind(5, std::string(core::to_string(d.status)));
    st.bind(6, d.retry_count);
    st.bind(7, d.error_message);
    st.bind(8, to_unix_millis(d.created_at));
    bind_time(st, 9, d.delivered_at);
    return execute(st);
}

std::optional<MessageDelivery> SqliteStore::find_delivery(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kDeliveryColumns + " FROM message_deliveries WHERE id = ?;";
    Statement st(*db_, sql.c_str());
    st.bind(1, id);
    if (st.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return read_delivery(st);
}

std::vector<MessageDelivery> SqliteStore::deliveries_for(const std::string& message_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kDeliveryColumns +
                      " FROM message_deliveries WHERE message_id = ? ORDER BY rowid;";
    Statement st(*db_, sql.c_str());
    st.bind(1, message_id);

    std::vector<MessageDelivery> out;
    while (st.step() == SQLITE_ROW) {
        out.push_back(read_delivery(st));
    }
    return out;
}

bool SqliteStore::mark_delivered(const DeliveryTarget& target, core::TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("UPDATE ") + table_for(target) +
                      " SET status = 'delivered', delivered_at = ? WHERE id = ? AND status = 'pending';";
    Statement st(*db_, sql.c_str());
    st.bind(1, to_unix_millis(at));
    st.bind(2, target.id);
    Result r = execute(st);
    if (!r) {
        spdlog::error("mark_delivered {} failed: {}", target.key(), r.message);
        return false;
    }
    return db_->changes() > 0;
}

bool SqliteStore::mark_failed(const DeliveryTarget& target, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* reason_column = target.kind == TargetKind::MESSAGE ? "rejection_reason" : "error_message";
    std::string sql = std::string("UPDATE ") + table_for(target) + " SET status = 'failed', " +
                      reason_column + " = ? WHERE id = ? AND status = 'pending';";
    Statement st(*db_, sql.c_str());
    st.bind(1, reason);
    st.bind(2, target.id);
    Result r = execute(st);
    if (!r) {
        spdlog::error("mark_failed {} failed: {}", target.key(), r.message);
        return false;
    }
    return db_->changes() > 0;
}

std::optional<int> SqliteStore::increment_retry_count(const DeliveryTarget& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);

    std::string update = std::string("UPDATE ") + table_for(target) +
                         " SET retry_count = retry_count + 1 WHERE id = ? AND status = 'pending';";
    Statement up(*db_, update.c_str());
    up.bind(1, target.id);
    Result r = execute(up);
    if (!r) {
        spdlog::error("increment_retry_count {} failed: {}", target.key(), r.message);
        return std::nullopt;
    }
    if (db_->changes() == 0) {
        return std::nullopt;
    }

    std::string select = std::string("SELECT retry_count FROM ") + table_for(target) + " WHERE id = ?;";
    Statement sel(*db_, select.c_str());
    sel.bind(1, target.id);
    if (sel.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    int count = sel.integer(0);
    tx.commit();
    return count;
}

bool SqliteStore::settle_message(const std::string& message_id, MessageStatus status,
                                 std::optional<core::TimePoint> delivered_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_,
        "UPDATE messages SET status = ?, delivered_at = COALESCE(?, delivered_at) "
        "WHERE id = ? AND status = 'pending';");
    st.bind(1, std::string(core::to_string(status)));
    bind_time(st, 2, delivered_at);
    st.bind(3, message_id);
    Result r = execute(st);
    if (!r) {
        spdlog::error("settle_message {} failed: {}", message_id, r.message);
        return false;
    }
    return db_->changes() > 0;
}

std::vector<Message> SqliteStore::list_messages(const HistoryQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string where;
    switch (query.direction) {
        case HistoryDirection::SENT:
            where = "sender_user_id = ?1";
            break;
        case HistoryDirection::RECEIVED:
            where = "recipient_type = 'user' AND recipient_id = ?1";
            break;
        case HistoryDirection::BOTH:
            where = "(sender_user_id = ?1 OR (recipient_type = 'user' AND recipient_id = ?1))";
            break;
    }

    std::string sql = std::string("SELECT ") + kMessageColumns + " FROM messages WHERE " + where +
                      " AND (?2 IS NULL OR created_at > ?2)"
                      " ORDER BY created_at DESC, rowid DESC LIMIT ?3;";
    Statement st(*db_, sql.c_str());
    st.bind(1, query.user_id);
    bind_time(st, 2, query.since);
    st.bind(3, query.limit);

    std::vector<Message> out;
    while (st.step() == SQLITE_ROW) {
        out.push_back(read_message(st));
    }
    return out;
}

// ============================================================================
// ConnectionRegistry
// ============================================================================

std::optional<AgentConnection> SqliteStore::find_connection(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kConnectionColumns + " FROM agent_connections WHERE id = ?;";
    Statement st(*db_, sql.c_str());
    st.bind(1, id);
    if (st.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return read_connection(st);
}

std::vector<AgentConnection> SqliteStore::active_connections_for(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kConnectionColumns +
                      " FROM agent_connections WHERE user_id = ? AND status = 'active'"
                      " ORDER BY routing_priority DESC, rowid;";
    Statement st(*db_, sql.c_str());
    st.bind(1, user_id);

    std::vector<AgentConnection> out;
    while (st.step() == SQLITE_ROW) {
        out.push_back(read_connection(st));
    }
    return out;
}

std::optional<AgentConnection> SqliteStore::find_by_label(const std::string& user_id,
                                                          const std::string& framework,
                                                          const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kConnectionColumns +
                      " FROM agent_connections WHERE user_id = ? AND framework = ? AND label = ?;";
    Statement st(*db_, sql.c_str());
    st.bind(1, user_id);
    st.bind(2, framework);
    st.bind(3, label);
    if (st.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return read_connection(st);
}

Result SqliteStore::insert_connection(const AgentConnection& c) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("INSERT INTO agent_connections (") + kConnectionColumns +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    Statement st(*db_, sql.c_str());
    st.bind(1, c.id);
    st.bind(2, c.user_id);
    st.bind(3, c.framework);
    st.bind(4, c.label);
    st.bind(5, c.description);
    st.bind(6, json(c.capabilities).dump());
    st.bind(7, c.public_key);
    st.bind(8, c.public_key_alg);
    st.bind(9, c.routing_priority);
    st.bind(10, c.callback_url);
    st.bind(11, c.callback_secret);
    st.bind(12, c.status);
    bind_time(st, 13, c.last_seen);
    st.bind(14, to_unix_millis(c.created_at));
    return execute(st);
}

Result SqliteStore::update_connection(const AgentConnection& c) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_,
        "UPDATE agent_connections SET description = ?, capabilities = ?, public_key = ?, "
        "public_key_alg = ?, routing_priority = ?, callback_url = ?, callback_secret = ?, "
        "status = ?, last_seen = ? WHERE id = ?;");
    st.bind(1, c.description);
    st.bind(2, json(c.capabilities).dump());
    st.bind(3, c.public_key);
    st.bind(4, c.public_key_alg);
    st.bind(5, c.routing_priority);
    st.bind(6, c.callback_url);
    st.bind(7, c.callback_secret);
    st.bind(8, c.status);
    bind_time(st, 9, c.last_seen);
    st.bind(10, c.id);
    Result r = execute(st);
    if (r && db_->changes() == 0) {
        return Result::err(ErrorCode::NOT_FOUND, "connection not found");
    }
    return r;
}

void SqliteStore::touch_last_seen(const std::string& connection_id, core::TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_, "UPDATE agent_connections SET last_seen = ? WHERE id = ?;");
    st.bind(1, to_unix_millis(at));
    st.bind(2, connection_id);
    Result r = execute(st);
    if (!r) {
        spdlog::warn("touch_last_seen {} failed: {}", connection_id, r.message);
    }
}

// ============================================================================
// RelationshipOracle
// ============================================================================

std::optional<core::User> SqliteStore::find_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_, "SELECT id, username FROM users WHERE id = ?;");
    st.bind(1, user_id);
    if (st.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return core::User{st.text(0), st.text(1)};
}

std::optional<core::User> SqliteStore::find_user_by_username(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_, "SELECT id, username FROM users WHERE username = ?;");
    st.bind(1, to_lower(username));
    if (st.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return core::User{st.text(0), st.text(1)};
}

FriendshipStatus SqliteStore::friendship(const std::string& a, const std::string& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_,
        "SELECT status FROM friendships WHERE (requester_id = ?1 AND addressee_id = ?2) "
        "OR (requester_id = ?2 AND addressee_id = ?1) LIMIT 1;");
    st.bind(1, a);
    st.bind(2, b);
    if (st.step() != SQLITE_ROW) {
        return FriendshipStatus::NONE;
    }
    return parse_friendship(st.text(0));
}

std::vector<std::string> SqliteStore::roles_for(const std::string& owner_id, const std::string& friend_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_, "SELECT role FROM friend_roles WHERE owner_id = ? AND friend_id = ? ORDER BY rowid;");
    st.bind(1, owner_id);
    st.bind(2, friend_id);

    std::vector<std::string> out;
    while (st.step() == SQLITE_ROW) {
        out.push_back(st.text(0));
    }
    return out;
}

std::optional<core::Group> SqliteStore::find_group(const std::string& group_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_, "SELECT id, name FROM user_groups WHERE id = ?;");
    st.bind(1, group_id);
    if (st.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return core::Group{st.text(0), st.text(1)};
}

bool SqliteStore::is_active_member(const std::string& group_id, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_,
        "SELECT 1 FROM group_memberships WHERE group_id = ? AND user_id = ? AND status = 'active';");
    st.bind(1, group_id);
    st.bind(2, user_id);
    return st.step() == SQLITE_ROW;
}

std::vector<std::string> SqliteStore::active_members(const std::string& group_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(*db_,
        "SELECT user_id FROM group_memberships WHERE group_id = ? AND status = 'active' ORDER BY rowid;");
    st.bind(1, group_id);

    std::vector<std::string> out;
    while (st.step() == SQLITE_ROW) {
        out.push_back(st.text(0));
    }
    return out;
}

// ============================================================================
// PolicyStore
// ============================================================================

std::vector<core::Policy> SqliteStore::enabled_policies(const std::optional<std::string>& owner_id,
                                                        core::PolicyScope scope,
                                                        const std::vector<std::string>& target_ids) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kPolicyColumns +
                      " FROM policies WHERE enabled = 1 AND scope = ?";
    if (owner_id) {
        sql += " AND user_id = ?";
    }
    if (!target_ids.empty()) {
        sql += " AND target_id IN (";
        for (std::size_t i = 0; i < target_ids.size(); ++i) {
            sql += i == 0 ? "?" : ", ?";
        }
        sql += ")";
    }
    sql += " ORDER BY rowid;";

    Statement st(*db_, sql.c_str());
    int idx = 1;
    st.bind(idx++, std::string(core::to_string(scope)));
    if (owner_id) {
        st.bind(idx++, *owner_id);
    }
    for (const auto& target : target_ids) {
        st.bind(idx++, target);
    }

    std::vector<core::Policy> out;
    while (st.step() == SQLITE_ROW) {
        out.push_back(read_policy(st));
    }
    return out;
}

} // namespace mahilo::store
