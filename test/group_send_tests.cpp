#include <catch2/catch.hpp>
#include <chrono>
#include <nlohmann/json.hpp>
#include "test_doubles/routing_harness.hpp"

using json = nlohmann::json;
using namespace mahilo;
using core::MessageStatus;
using core::RecipientType;
using router::SendError;

namespace {

const std::string kBobUrl = "https://bob.example.com/hook";
const std::string kCarolUrl = "https://carol.example.com/hook";
const std::string kDaveUrl = "https://dave.example.com/hook";

void seed_group(test::RoutingHarness& h) {
    h.add_user("u-alice", "alice");
    h.add_user("u-bob", "bob");
    h.add_user("u-carol", "carol");
    h.add_user("u-dave", "dave");
    h.store.add_group({"g-team", "team"});
    for (const char* member : {"u-alice", "u-bob", "u-carol", "u-dave"}) {
        h.store.add_member("g-team", member);
    }
    h.add_connection("c-alice", "u-alice", "https://alice.example.com/hook");
    h.add_connection("c-bob", "u-bob", kBobUrl);
    h.add_connection("c-carol", "u-carol", kCarolUrl);
    h.add_connection("c-dave", "u-dave", kDaveUrl);
}

router::SendRequest to_group(const std::string& group_id, const std::string& text) {
    router::SendRequest request;
    request.recipient = group_id;
    request.recipient_type = RecipientType::GROUP;
    request.message = text;
    return request;
}

} // namespace

SCENARIO("group fan-out with one failing member", "[group][e2e]") {
    GIVEN("a group with three other members whose connections are active") {
        test::RoutingHarness h;
        seed_group(h);
        h.http.respond_with_status(kDaveUrl, 500);

        WHEN("alice sends to the group") {
            auto result = h.router.send("u-alice", to_group("g-team", "standup in 5"));

            THEN("one delivery row exists per member connection") {
                REQUIRE(h.store.deliveries_for(result.message_id).size() == 3);
            }

            THEN("the response reports 2 delivered and 1 pending") {
                REQUIRE(result.success);
                REQUIRE(result.status == MessageStatus::PENDING);
                REQUIRE(result.counts);
                REQUIRE(result.counts->recipients == 3);
                REQUIRE(result.counts->delivered == 2);
                REQUIRE(result.counts->pending == 1);
                REQUIRE(result.counts->failed == 0);
                REQUIRE(h.store.find_message(result.message_id)->status == MessageStatus::PENDING);
            }

            THEN("the sender's own connection is not called") {
                REQUIRE(h.http.requests_to("https://alice.example.com/hook").empty());
            }

            AND_WHEN("the retry succeeds") {
                h.clock.advance(std::chrono::milliseconds(1000));
                auto stats = h.scheduler.process_due();

                THEN("all three are delivered and the parent settles") {
                    REQUIRE(stats.delivered == 1);
                    auto status = h.router.group_status(result.message_id);
                    REQUIRE(status);
                    REQUIRE(status->counts.recipients == 3);
                    REQUIRE(status->counts.delivered == 3);
                    REQUIRE(status->counts.pending == 0);
                    REQUIRE(status->status == MessageStatus::DELIVERED);
                    REQUIRE(h.http.requests_to(kDaveUrl).size() == 2);
                }
            }
        }
    }
}

TEST_CASE("fan-out webhooks carry group and delivery ids", "[group][body]") {
    test::RoutingHarness h;
    seed_group(h);

    auto result = h.router.send("u-alice", to_group("g-team", "hello team"));
    auto posts = h.http.requests_to(kBobUrl);
    REQUIRE(posts.size() == 1);

    auto body = json::parse(posts[0].body);
    REQUIRE(body["message_id"] == result.message_id);
    REQUIRE(body["group_id"] == "g-team");
    REQUIRE(body["group_name"] == "team");
    REQUIRE(body["sender"] == "alice");
    REQUIRE(body.contains("delivery_id"));

    REQUIRE(posts[0].header("X-Mahilo-Group-Id") == std::string("g-team"));
    REQUIRE(posts[0].header("X-Mahilo-Delivery-Id") == body["delivery_id"].get<std::string>());
    REQUIRE(posts[0].header("X-Mahilo-Message-Id") == result.message_id);
}

SCENARIO("group membership edge cases", "[group]") {
    GIVEN("a group") {
        test::RoutingHarness h;
        seed_group(h);
        h.add_user("u-eve", "eve");

        THEN("non-members cannot send") {
            auto result = h.router.send("u-eve", to_group("g-team", "hi"));
            REQUIRE(result.code == SendError::RELATIONSHIP_DENIED);
            REQUIRE(result.error == "Not a member of this group");
        }

        THEN("an unknown group is reported") {
            auto result = h.router.send("u-alice", to_group("g-none", "hi"));
            REQUIRE(result.code == SendError::GROUP_NOT_FOUND);
        }

        THEN("invited members are not delivered to") {
            h.add_connection("c-eve", "u-eve", "https://eve.example.com/hook");
            h.store.add_member("g-team", "u-eve", false);
            auto result = h.router.send("u-alice", to_group("g-team", "hi"));
            REQUIRE(result.counts->recipients == 3);
            REQUIRE(h.http.requests_to("https://eve.example.com/hook").empty());
        }

        THEN("a member without connections counts as failed") {
            REQUIRE(h.store.remove_connection("c-carol"));
            auto result = h.router.send("u-alice", to_group("g-team", "hi"));
            REQUIRE(result.counts->recipients == 3);
            REQUIRE(result.counts->delivered == 2);
            REQUIRE(result.counts->failed == 1);
            REQUIRE(result.status == MessageStatus::DELIVERED);

            bool found = false;
            for (const auto& d : h.store.deliveries_for(result.message_id)) {
                if (d.recipient_user_id == "u-carol") {
                    found = true;
                    REQUIRE(d.status == MessageStatus::FAILED);
                    REQUIRE(d.error_message == std::string("No active connection"));
                }
            }
            REQUIRE(found);
        }

        THEN("group status is only reported for group messages") {
            h.befriend("u-alice", "u-bob");
            router::SendRequest direct;
            direct.recipient = "bob";
            direct.message = "hi";
            auto result = h.router.send("u-alice", direct);
            REQUIRE_FALSE(h.router.group_status(result.message_id));
            REQUIRE_FALSE(h.router.group_status("missing"));
        }
    }

    GIVEN("a group where the sender is alone") {
        test::RoutingHarness h;
        h.add_user("u-alice", "alice");
        h.store.add_group({"g-solo", "solo"});
        h.store.add_member("g-solo", "u-alice");

        THEN("the message is delivered to nobody") {
            auto result = h.router.send("u-alice", to_group("g-solo", "echo"));
            REQUIRE(result.success);
            REQUIRE(result.status == MessageStatus::DELIVERED);
            REQUIRE(result.counts->recipients == 0);
            REQUIRE(h.http.requests().empty());
        }
    }
}

SCENARIO("every member exhausting its retries", "[group][retry]") {
    GIVEN("endpoints that always fail and a budget of 1") {
        test::RoutingHarness h(router::RouterOptions{}, delivery::DispatchOptions{1, 30000});
        seed_group(h);
        for (const auto& url : {kBobUrl, kCarolUrl, kDaveUrl}) {
            h.http.respond_with_status(url, 503, 5);
        }

        auto result = h.router.send("u-alice", to_group("g-team", "hi"));
        REQUIRE(result.counts->pending == 3);

        WHEN("the retries run") {
            h.clock.advance(std::chrono::milliseconds(1000));
            h.scheduler.process_due();

            THEN("the parent message fails") {
                auto status = h.router.group_status(result.message_id);
                REQUIRE(status->counts.failed == 3);
                REQUIRE(status->status == MessageStatus::FAILED);
            }
        }
    }
}

TEST_CASE("group policies apply in trusted mode", "[group][policy]") {
    router::RouterOptions options;
    options.trusted_mode = true;
    test::RoutingHarness h(options);
    seed_group(h);

    core::Policy policy;
    policy.id = "team-ctx";
    policy.user_id = "u-bob";
    policy.scope = core::PolicyScope::GROUP;
    policy.target_id = "g-team";
    policy.content = R"({"requireContext": true})";
    policy.created_at = h.clock.now();
    h.store.add_policy(policy);

    auto result = h.router.send("u-alice", to_group("g-team", "hi"));
    REQUIRE(result.code == SendError::POLICY_REJECTED);
    REQUIRE(result.error == "Context is required for messages to group 'team'");
    REQUIRE(h.http.requests().empty());

    auto request = to_group("g-team", "hi");
    request.context = "sprint planning";
    REQUIRE(h.router.send("u-alice", request).success);
}
