#include <catch2/catch.hpp>
#include <chrono>
#include "policy/evaluator.hpp"
#include "policy/llm_judge.hpp"
#include "store/memory_store.hpp"
#include "test_doubles/test_double_llm_provider.hpp"

using namespace mahilo;
using core::Policy;
using core::PolicyScope;
using core::PolicyType;

namespace {

Policy make_policy(const std::string& id, const std::string& owner, PolicyScope scope,
                   const std::string& content, int priority = 0,
                   std::optional<std::string> target = std::nullopt,
                   PolicyType type = PolicyType::HEURISTIC) {
    Policy policy;
    policy.id = id;
    policy.user_id = owner;
    policy.scope = scope;
    policy.target_id = std::move(target);
    policy.policy_type = type;
    policy.content = content;
    policy.priority = priority;
    policy.created_at = util::from_unix_millis(1700000000000LL);
    return policy;
}

struct EvaluatorWorld {
    EvaluatorWorld() : judge(provider, true), evaluator(store, store, judge) {
        store.add_user({"u-alice", "alice"});
        store.add_user({"u-bob", "bob"});
        store.add_user({"u-carol", "carol"});
        store.set_friendship("u-alice", "u-bob", core::FriendshipStatus::ACCEPTED);
        store.add_group({"g-team", "team"});
        store.add_member("g-team", "u-alice");
        store.add_member("g-team", "u-carol");
    }

    store::MemoryStore store;
    test::TestDoubleLLMProvider provider;
    policy::LlmPolicyJudge judge;
    policy::PolicyEvaluator evaluator;
};

} // namespace

SCENARIO("direct send policy evaluation", "[policy]") {
    GIVEN("a sender with no policies") {
        EvaluatorWorld world;

        THEN("everything is allowed") {
            REQUIRE(world.evaluator.evaluate_direct("u-alice", "u-bob", "hi", std::nullopt).allowed);
        }
    }

    GIVEN("a global blocked pattern") {
        EvaluatorWorld world;
        world.store.add_policy(make_policy("p1", "u-alice", PolicyScope::GLOBAL,
                                           R"({"blockedPatterns": ["password"]})"));

        THEN("matching messages are blocked with the policy id") {
            auto decision = world.evaluator.evaluate_direct("u-alice", "u-bob", "my PASSWORD is x", std::nullopt);
            REQUIRE_FALSE(decision.allowed);
            REQUIRE(decision.reason == "Message contains blocked pattern");
            REQUIRE(decision.policy_id == "p1");
        }

        THEN("other senders are unaffected") {
            REQUIRE(world.evaluator.evaluate_direct("u-bob", "u-alice", "password", std::nullopt).allowed);
        }
    }

    GIVEN("two violated policies with different priorities") {
        EvaluatorWorld world;
        world.store.add_policy(make_policy("low", "u-alice", PolicyScope::GLOBAL,
                                           R"({"blockedPatterns": ["x"]})", 1));
        world.store.add_policy(make_policy("high", "u-alice", PolicyScope::GLOBAL,
                                           R"({"maxLength": 3})", 10));

        THEN("the higher priority policy wins") {
            auto decision = world.evaluator.evaluate_direct("u-alice", "u-bob", "xxxxx", std::nullopt);
            REQUIRE(decision.policy_id == "high");
            REQUIRE(decision.reason == "Message exceeds maximum length of 3");
        }
    }

    GIVEN("equal priorities") {
        EvaluatorWorld world;
        world.store.add_policy(make_policy("first", "u-alice", PolicyScope::GLOBAL,
                                           R"({"blockedPatterns": ["x"]})"));
        world.store.add_policy(make_policy("second", "u-alice", PolicyScope::GLOBAL,
                                           R"({"maxLength": 3})"));

        THEN("arrival order decides") {
            auto decision = world.evaluator.evaluate_direct("u-alice", "u-bob", "xxxxx", std::nullopt);
            REQUIRE(decision.policy_id == "first");
        }
    }

    GIVEN("user-scoped and role-scoped policies") {
        EvaluatorWorld world;
        world.store.add_policy(make_policy("to-carol", "u-alice", PolicyScope::USER,
                                           R"({"maxLength": 1})", 0, std::string("u-carol")));
        world.store.add_policy(make_policy("coworkers", "u-alice", PolicyScope::ROLE,
                                           R"({"requireContext": true})", 0, std::string("coworker")));

        THEN("policies for other recipients and unassigned roles do not apply") {
            REQUIRE(world.evaluator.evaluate_direct("u-alice", "u-bob", "hello", std::nullopt).allowed);
        }

        WHEN("the sender assigns the role to the recipient") {
            world.store.assign_role("u-alice", "u-bob", "coworker");

            THEN("the role policy applies") {
                auto decision = world.evaluator.evaluate_direct("u-alice", "u-bob", "hello", std::nullopt);
                REQUIRE_FALSE(decision.allowed);
                REQUIRE(decision.policy_id == "coworkers");
                REQUIRE(world.evaluator.evaluate_direct("u-alice", "u-bob", "hello", std::string("ctx")).allowed);
            }
        }
    }

    GIVEN("a disabled policy and a malformed one") {
        EvaluatorWorld world;
        auto disabled = make_policy("off", "u-alice", PolicyScope::GLOBAL, R"({"maxLength": 1})");
        disabled.enabled = false;
        world.store.add_policy(disabled);
        world.store.add_policy(make_policy("broken", "u-alice", PolicyScope::GLOBAL, R"({"maxLength": "one"})", 5));

        THEN("neither blocks") {
            REQUIRE(world.evaluator.evaluate_direct("u-alice", "u-bob", "hello", std::nullopt).allowed);
        }
    }

    GIVEN("an LLM policy") {
        EvaluatorWorld world;
        world.store.add_policy(make_policy("llm", "u-alice", PolicyScope::GLOBAL,
                                           "Never share home addresses", 0, std::nullopt, PolicyType::LLM));

        WHEN("the judge fails the message") {
            world.provider.answer("FAIL\nContains a street address");
            auto decision = world.evaluator.evaluate_direct("u-alice", "u-bob", "I live at 5 Main St", std::nullopt);

            THEN("the reasoning becomes the rejection reason") {
                REQUIRE_FALSE(decision.allowed);
                REQUIRE(decision.reason == "Contains a street address");
                REQUIRE(world.provider.prompts.at(0).find("MESSAGE TO: bob") != std::string::npos);
            }
        }

        WHEN("the judge is unreachable") {
            world.provider.fail("timeout");

            THEN("the message is allowed") {
                REQUIRE(world.evaluator.evaluate_direct("u-alice", "u-bob", "hi", std::nullopt).allowed);
            }
        }
    }
}

SCENARIO("group send policy evaluation", "[policy][group]") {
    GIVEN("a group policy owned by another member") {
        EvaluatorWorld world;
        world.store.add_policy(make_policy("team-ctx", "u-carol", PolicyScope::GROUP,
                                           R"({"requireContext": true})", 0, std::string("g-team")));

        THEN("missing context names the group") {
            auto decision = world.evaluator.evaluate_group("u-alice", "g-team", "hi", std::nullopt);
            REQUIRE_FALSE(decision.allowed);
            REQUIRE(decision.reason == "Context is required for messages to group 'team'");
        }
    }

    GIVEN("a group blocked pattern") {
        EvaluatorWorld world;
        world.store.add_policy(make_policy("team-words", "u-carol", PolicyScope::GROUP,
                                           R"({"blockedPatterns": ["deadline"]})", 0, std::string("g-team")));

        THEN("the reason is marked as a group policy") {
            auto decision = world.evaluator.evaluate_group("u-alice", "g-team", "the deadline moved", std::nullopt);
            REQUIRE(decision.reason == "Message contains blocked pattern (group policy)");
        }
    }

    GIVEN("a sender global policy and a high priority group policy") {
        EvaluatorWorld world;
        world.store.add_policy(make_policy("mine", "u-alice", PolicyScope::GLOBAL,
                                           R"({"maxLength": 2})", 0));
        world.store.add_policy(make_policy("theirs", "u-carol", PolicyScope::GROUP,
                                           R"({"maxLength": 1})", 100, std::string("g-team")));

        THEN("the sender's globals are evaluated first") {
            auto decision = world.evaluator.evaluate_group("u-alice", "g-team", "hello", std::nullopt);
            REQUIRE(decision.policy_id == "mine");
        }
    }
}
