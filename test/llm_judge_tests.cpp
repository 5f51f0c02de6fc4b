#include <catch2/catch.hpp>
#include "policy/llm_judge.hpp"
#include "test_doubles/test_double_llm_provider.hpp"

using namespace mahilo::policy;
using mahilo::test::TestDoubleLLMProvider;

TEST_CASE("evaluation prompt embeds policy, recipient, message and context", "[llm_judge]") {
    auto prompt = build_evaluation_prompt("No addresses", "meet at 5 Main St", "bob", std::string("planning"));
    REQUIRE(prompt.find("POLICY: No addresses") != std::string::npos);
    REQUIRE(prompt.find("MESSAGE TO: bob") != std::string::npos);
    REQUIRE(prompt.find("MESSAGE CONTENT: meet at 5 Main St") != std::string::npos);
    REQUIRE(prompt.find("MESSAGE CONTEXT: planning") != std::string::npos);

    auto bare = build_evaluation_prompt("No addresses", "hi", "bob", std::nullopt);
    REQUIRE(bare.find("MESSAGE CONTEXT") == std::string::npos);
}

TEST_CASE("verdict parsing", "[llm_judge]") {
    auto pass = parse_evaluation_response("PASS\nNothing sensitive");
    REQUIRE(pass);
    REQUIRE(pass->passed);
    REQUIRE(pass->reasoning == "Nothing sensitive");

    auto fail = parse_evaluation_response("  fail\nContains an address\n");
    REQUIRE(fail);
    REQUIRE_FALSE(fail->passed);
    REQUIRE(fail->reasoning == "Contains an address");

    auto terse = parse_evaluation_response("FAIL");
    REQUIRE(terse);
    REQUIRE(terse->reasoning == "No reasoning provided");

    REQUIRE_FALSE(parse_evaluation_response("I think it is fine"));
    REQUIRE_FALSE(parse_evaluation_response(""));
}

SCENARIO("judging with a fail-open judge", "[llm_judge]") {
    GIVEN("a provider and a fail-open judge") {
        TestDoubleLLMProvider provider;
        LlmPolicyJudge judge(provider, true);

        WHEN("the model answers FAIL") {
            provider.answer("FAIL\nShares a home address");
            auto judgement = judge.evaluate("No addresses", "5 Main St", "bob", std::nullopt);

            THEN("the message is blocked with the model's reasoning") {
                REQUIRE_FALSE(judgement.passed);
                REQUIRE(judgement.reasoning == "Shares a home address");
                REQUIRE(provider.prompts.size() == 1);
            }
        }

        WHEN("the call fails") {
            provider.fail("timeout");
            auto judgement = judge.evaluate("No addresses", "hi", "bob", std::nullopt);

            THEN("it passes and keeps the error") {
                REQUIRE(judgement.passed);
                REQUIRE(judgement.reasoning == "LLM evaluation failed, defaulting to PASS");
                REQUIRE(judgement.error == "timeout");
            }
        }

        WHEN("the answer is ambiguous") {
            provider.answer("Maybe?");
            auto judgement = judge.evaluate("No addresses", "hi", "bob", std::nullopt);

            THEN("it passes") {
                REQUIRE(judgement.passed);
                REQUIRE(judgement.reasoning == "Unclear response: Maybe?");
            }
        }
    }
}

SCENARIO("judging with a fail-closed judge", "[llm_judge]") {
    GIVEN("a fail-closed judge whose provider errors") {
        TestDoubleLLMProvider provider;
        provider.fail("connection refused");
        LlmPolicyJudge judge(provider, false);

        THEN("the message is blocked with the failure named") {
            auto judgement = judge.evaluate("No addresses", "hi", "bob", std::nullopt);
            REQUIRE_FALSE(judgement.passed);
            REQUIRE(judgement.reasoning == "LLM evaluation failed: connection refused");
        }

        THEN("ambiguous answers also block") {
            provider.answer("hmm");
            REQUIRE_FALSE(judge.evaluate("No addresses", "hi", "bob", std::nullopt).passed);
        }
    }
}

TEST_CASE("disabled judge always passes", "[llm_judge]") {
    DisabledPolicyJudge judge;
    auto judgement = judge.evaluate("anything", "hi", "bob", std::nullopt);
    REQUIRE(judgement.passed);
    REQUIRE(judgement.reasoning == "LLM evaluation not configured");
}
