#include <catch2/catch.hpp>
#include "router/idempotency_guard.hpp"
#include "store/memory_store.hpp"
#include "util/clock.hpp"

using namespace mahilo;

namespace {

core::Message keyed_message(const std::string& id, const std::string& sender,
                            std::optional<std::string> key) {
    core::Message m;
    m.id = id;
    m.sender_user_id = sender;
    m.sender_agent = "agent";
    m.recipient_id = "u-bob";
    m.payload = "hi";
    m.idempotency_key = std::move(key);
    m.created_at = util::from_unix_millis(1700000000000LL);
    return m;
}

} // namespace

SCENARIO("idempotency guard", "[idempotency]") {
    GIVEN("a ledger holding one keyed message") {
        store::MemoryStore store;
        router::IdempotencyGuard guard(store);
        REQUIRE(guard.claim(keyed_message("m1", "u-alice", std::string("k1"))).inserted);

        THEN("the same sender and key finds it") {
            auto prior = guard.find_prior("u-alice", std::string("k1"));
            REQUIRE(prior);
            REQUIRE(prior->id == "m1");
        }

        THEN("another sender with the same key does not") {
            REQUIRE_FALSE(guard.find_prior("u-bob", std::string("k1")));
        }

        THEN("no key and an empty key never match") {
            REQUIRE_FALSE(guard.find_prior("u-alice", std::nullopt));
            REQUIRE_FALSE(guard.find_prior("u-alice", std::string()));
        }

        WHEN("a concurrent send claims the same key") {
            auto claimed = guard.claim(keyed_message("m2", "u-alice", std::string("k1")));

            THEN("the winning row is returned instead of an error") {
                REQUIRE(claimed.result);
                REQUIRE_FALSE(claimed.inserted);
                REQUIRE(claimed.message.id == "m1");
                REQUIRE_FALSE(store.find_message("m2"));
            }
        }

        WHEN("another sender claims the same key") {
            auto claimed = guard.claim(keyed_message("m3", "u-bob", std::string("k1")));

            THEN("a distinct message is created") {
                REQUIRE(claimed.inserted);
                REQUIRE(claimed.message.id == "m3");
            }
        }

        WHEN("unkeyed messages are claimed") {
            REQUIRE(guard.claim(keyed_message("m4", "u-alice", std::nullopt)).inserted);
            REQUIRE(guard.claim(keyed_message("m5", "u-alice", std::nullopt)).inserted);

            THEN("both exist") {
                REQUIRE(store.find_message("m4"));
                REQUIRE(store.find_message("m5"));
            }
        }
    }
}
