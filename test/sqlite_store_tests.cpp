#include <catch2/catch.hpp>
#include <filesystem>
#include "store/sqlite_store.hpp"
#include "util/clock.hpp"
#include "util/ids.hpp"

using namespace mahilo;
using core::DeliveryTarget;
using core::MessageStatus;
using store::ErrorCode;
using store::SqliteStore;

namespace {

// Database file removed with its WAL side files on scope exit
class TempDatabase {
public:
    TempDatabase()
        : path_(std::filesystem::temp_directory_path() / ("mahilo-test-" + util::generate_id(12) + ".db")) {}

    ~TempDatabase() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(path_.string() + suffix, ec);
        }
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

const core::TimePoint t0 = util::from_unix_millis(1700000000000LL);

core::Message make_message(const std::string& id, const std::string& sender, const std::string& recipient,
                           std::optional<std::string> key = std::nullopt,
                           core::TimePoint at = t0) {
    core::Message m;
    m.id = id;
    m.sender_user_id = sender;
    m.sender_agent = "agent";
    m.recipient_id = recipient;
    m.payload = "hello";
    m.context = "ctx";
    m.encryption = R"({"alg":"none"})";
    m.idempotency_key = std::move(key);
    m.created_at = at;
    return m;
}

void seed(SqliteStore& store) {
    REQUIRE(store.add_user({"u-alice", "Alice"}));
    REQUIRE(store.add_user({"u-bob", "bob"}));
    REQUIRE(store.set_friendship("u-alice", "u-bob", core::FriendshipStatus::ACCEPTED));
    REQUIRE(store.assign_role("u-alice", "u-bob", "coworker"));
    REQUIRE(store.add_group({"g-team", "team"}));
    REQUIRE(store.add_member("g-team", "u-alice"));
    REQUIRE(store.add_member("g-team", "u-bob", false));
}

core::AgentConnection make_connection(const std::string& id, int priority, const std::string& label) {
    core::AgentConnection c;
    c.id = id;
    c.user_id = "u-bob";
    c.framework = "clawdbot";
    c.label = label;
    c.capabilities = {"calendar"};
    c.public_key = "pk";
    c.public_key_alg = "ed25519";
    c.routing_priority = priority;
    c.callback_url = "https://bob.example.com/" + id;
    c.callback_secret = "0123456789abcdef";
    c.created_at = t0;
    return c;
}

} // namespace

SCENARIO("sqlite relationship directory", "[sqlite]") {
    GIVEN("a seeded database") {
        TempDatabase db;
        SqliteStore store(db.path());
        seed(store);

        THEN("users resolve by id and by case-insensitive username") {
            REQUIRE(store.find_user("u-alice")->username == "alice");
            REQUIRE(store.find_user_by_username("ALICE")->id == "u-alice");
            REQUIRE_FALSE(store.find_user_by_username("carol"));
        }

        THEN("friendship is symmetric") {
            REQUIRE(store.friendship("u-bob", "u-alice") == core::FriendshipStatus::ACCEPTED);
            REQUIRE(store.friendship("u-alice", "u-carol") == core::FriendshipStatus::NONE);
        }

        THEN("roles and memberships are readable") {
            REQUIRE(store.roles_for("u-alice", "u-bob") == std::vector<std::string>{"coworker"});
            REQUIRE(store.find_group("g-team")->name == "team");
            REQUIRE(store.is_active_member("g-team", "u-alice"));
            REQUIRE_FALSE(store.is_active_member("g-team", "u-bob"));
            REQUIRE(store.active_members("g-team") == std::vector<std::string>{"u-alice"});
        }
    }
}

SCENARIO("sqlite message ledger", "[sqlite]") {
    GIVEN("an empty ledger") {
        TempDatabase db;
        SqliteStore store(db.path());
        seed(store);

        WHEN("a keyed message is inserted twice") {
            auto first = store.insert_message(make_message("m1", "u-alice", "u-bob", std::string("k1")));
            auto second = store.insert_message(make_message("m2", "u-alice", "u-bob", std::string("k1")));

            THEN("the unique index returns the original row") {
                REQUIRE(first.inserted);
                REQUIRE(second.result);
                REQUIRE_FALSE(second.inserted);
                REQUIRE(second.message.id == "m1");
                REQUIRE_FALSE(store.find_message("m2"));
                REQUIRE(store.find_by_idempotency_key("u-alice", "k1")->id == "m1");
                REQUIRE_FALSE(store.find_by_idempotency_key("u-bob", "k1"));
            }
        }

        WHEN("a message round-trips") {
            REQUIRE(store.insert_message(make_message("m1", "u-alice", "u-bob")).inserted);
            auto m = store.find_message("m1");

            THEN("its fields survive") {
                REQUIRE(m);
                REQUIRE(m->payload == "hello");
                REQUIRE(m->context == std::string("ctx"));
                REQUIRE(m->encryption == std::string(R"({"alg":"none"})"));
                REQUIRE_FALSE(m->idempotency_key);
                REQUIRE(m->status == MessageStatus::PENDING);
                REQUIRE(m->created_at == t0);
            }
        }

        WHEN("status transitions run") {
            REQUIRE(store.insert_message(make_message("m1", "u-alice", "u-bob")).inserted);
            auto target = DeliveryTarget::for_message("m1");

            THEN("the retry count increments atomically") {
                REQUIRE(store.increment_retry_count(target) == 1);
                REQUIRE(store.increment_retry_count(target) == 2);
                REQUIRE(store.find_message("m1")->retry_count == 2);
            }

            THEN("terminal rows are immutable") {
                REQUIRE(store.mark_delivered(target, t0));
                REQUIRE_FALSE(store.mark_failed(target, "late failure"));
                REQUIRE_FALSE(store.increment_retry_count(target));
                auto m = store.find_message("m1");
                REQUIRE(m->status == MessageStatus::DELIVERED);
                REQUIRE(m->delivered_at == t0);
            }

            THEN("failure records the reason") {
                REQUIRE(store.mark_failed(target, "Max retries exceeded"));
                REQUIRE(store.find_message("m1")->rejection_reason == std::string("Max retries exceeded"));
            }
        }

        WHEN("a group message fans out") {
            auto group = make_message("mg", "u-alice", "g-team");
            group.recipient_type = core::RecipientType::GROUP;
            REQUIRE(store.insert_message(group).inserted);
            REQUIRE(store.insert_connection(make_connection("c1", 1, "one")));

            core::MessageDelivery d;
            d.id = "d1";
            d.message_id = "mg";
            d.recipient_user_id = "u-bob";
            d.recipient_connection_id = "c1";
            d.created_at = t0;
            REQUIRE(store.insert_delivery(d));

            THEN("a second row for the same connection is a constraint violation") {
                d.id = "d2";
                auto r = store.insert_delivery(d);
                REQUIRE(r.code == ErrorCode::CONSTRAINT_VIOLATION);
            }

            THEN("delivery rows transition and the parent settles") {
                auto target = DeliveryTarget::for_delivery("d1", "mg");
                REQUIRE(store.increment_retry_count(target) == 1);
                REQUIRE(store.mark_delivered(target, t0));
                REQUIRE(store.find_delivery("d1")->status == MessageStatus::DELIVERED);

                REQUIRE(store.settle_message("mg", MessageStatus::DELIVERED, t0));
                REQUIRE_FALSE(store.settle_message("mg", MessageStatus::FAILED, std::nullopt));
                REQUIRE(store.find_message("mg")->status == MessageStatus::DELIVERED);
            }
        }

        WHEN("history is listed") {
            using std::chrono::seconds;
            REQUIRE(store.insert_message(make_message("a", "u-alice", "u-bob", std::nullopt, t0)).inserted);
            REQUIRE(store.insert_message(make_message("b", "u-bob", "u-alice", std::nullopt, t0 + seconds(1))).inserted);
            REQUIRE(store.insert_message(make_message("c", "u-alice", "u-bob", std::nullopt, t0 + seconds(2))).inserted);

            THEN("filters, ordering and limit apply") {
                store::HistoryQuery query;
                query.user_id = "u-alice";
                auto all = store.list_messages(query);
                REQUIRE(all.size() == 3);
                REQUIRE(all[0].id == "c");
                REQUIRE(all[2].id == "a");

                query.direction = store::HistoryDirection::RECEIVED;
                REQUIRE(store.list_messages(query).size() == 1);

                query.direction = store::HistoryDirection::BOTH;
                query.since = t0;
                REQUIRE(store.list_messages(query).size() == 2);

                query.limit = 1;
                REQUIRE(store.list_messages(query).at(0).id == "c");
            }
        }
    }
}

SCENARIO("sqlite connections and policies", "[sqlite]") {
    GIVEN("a seeded database") {
        TempDatabase db;
        SqliteStore store(db.path());
        seed(store);
        REQUIRE(store.insert_connection(make_connection("c-low", 1, "low")));
        REQUIRE(store.insert_connection(make_connection("c-high", 9, "high")));

        THEN("active connections come back by priority") {
            auto active = store.active_connections_for("u-bob");
            REQUIRE(active.size() == 2);
            REQUIRE(active[0].id == "c-high");
            REQUIRE(active[0].capabilities == std::vector<std::string>{"calendar"});
        }

        THEN("(user, framework, label) is unique") {
            auto duplicate = make_connection("c-other", 3, "low");
            REQUIRE(store.insert_connection(duplicate).code == ErrorCode::CONSTRAINT_VIOLATION);
            REQUIRE(store.find_by_label("u-bob", "clawdbot", "low")->id == "c-low");
        }

        THEN("inactive connections are skipped") {
            auto conn = *store.find_connection("c-high");
            conn.status = "inactive";
            REQUIRE(store.update_connection(conn));
            REQUIRE(store.active_connections_for("u-bob").size() == 1);
        }

        THEN("last_seen is stamped") {
            store.touch_last_seen("c-low", t0);
            REQUIRE(store.find_connection("c-low")->last_seen == t0);
        }

        THEN("enabled policies filter by scope, owner and target") {
            core::Policy global;
            global.id = "p1";
            global.user_id = "u-alice";
            global.content = "{}";
            global.created_at = t0;
            REQUIRE(store.add_policy(global));

            core::Policy role = global;
            role.id = "p2";
            role.scope = core::PolicyScope::ROLE;
            role.target_id = "coworker";
            REQUIRE(store.add_policy(role));

            core::Policy disabled = global;
            disabled.id = "p3";
            disabled.enabled = false;
            REQUIRE(store.add_policy(disabled));

            auto globals = store.enabled_policies(std::string("u-alice"), core::PolicyScope::GLOBAL, {});
            REQUIRE(globals.size() == 1);
            REQUIRE(globals[0].id == "p1");

            REQUIRE(store.enabled_policies(std::string("u-alice"), core::PolicyScope::ROLE, {"coworker"}).size() == 1);
            REQUIRE(store.enabled_policies(std::string("u-alice"), core::PolicyScope::ROLE, {"family"}).empty());
            REQUIRE(store.enabled_policies(std::string("u-bob"), core::PolicyScope::GLOBAL, {}).empty());
        }
    }
}

TEST_CASE("sqlite schema migration is idempotent", "[sqlite]") {
    TempDatabase db;
    {
        SqliteStore store(db.path());
        seed(store);
    }
    SqliteStore reopened(db.path());
    REQUIRE(reopened.find_user("u-alice"));
}
