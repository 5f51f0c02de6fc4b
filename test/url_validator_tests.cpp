#include <catch2/catch.hpp>
#include "net/url_validator.hpp"
#include "test_doubles/test_double_resolver.hpp"

using namespace mahilo::net;
using mahilo::test::make_resolver;

namespace {

const std::string kHttpsRequired = "Callback URL must use HTTPS (except localhost in development)";
const std::string kPrivate = "Callback URL cannot point to private/internal addresses";

UrlValidator production_validator(bool allow_private_ips = false) {
    return UrlValidator(UrlPolicy{true, allow_private_ips},
                        make_resolver({{"agent.example.com", {"93.184.216.34"}},
                                       {"rebind.example.com", {"93.184.216.34", "10.1.2.3"}}}));
}

} // namespace

TEST_CASE("URL parsing", "[url]") {
    auto parsed = parse_url("https://Agent.Example.com:8443/hook?x=1");
    REQUIRE(parsed);
    REQUIRE(parsed->scheme == "https");
    REQUIRE(parsed->host == "agent.example.com");
    REQUIRE(parsed->port == 8443);
    REQUIRE(parsed->path == "/hook?x=1");

    auto v6 = parse_url("http://[::1]/cb");
    REQUIRE(v6);
    REQUIRE(v6->host == "::1");
    REQUIRE(v6->port == 80);

    REQUIRE_FALSE(parse_url("not a url"));
    REQUIRE_FALSE(parse_url("https://"));
}

TEST_CASE("private address classification", "[url]") {
    for (const char* ip : {"10.0.0.1", "172.16.5.4", "192.168.1.1", "169.254.169.254",
                           "100.64.0.1", "0.0.0.0", "127.0.0.1", "::1", "fd00::1",
                           "fe80::1", "::ffff:10.0.0.1"}) {
        INFO(ip);
        REQUIRE(is_private_address(ip));
    }
    for (const char* ip : {"8.8.8.8", "172.32.0.1", "2606:4700::1111"}) {
        INFO(ip);
        REQUIRE_FALSE(is_private_address(ip));
    }
    REQUIRE(is_loopback_host("localhost"));
    REQUIRE(is_loopback_host("127.10.0.1"));
    REQUIRE(is_loopback_host("127.1"));
    REQUIRE(is_private_address("0xc0a80001"));
    REQUIRE_FALSE(is_loopback_host("example.com"));
}

SCENARIO("callback URL validation in development", "[url]") {
    GIVEN("a development validator") {
        UrlValidator validator(UrlPolicy{false, false}, make_resolver({}));

        THEN("plain http is accepted for loopback hosts only") {
            REQUIRE(validator.validate("http://localhost:3000/hook").valid);
            REQUIRE(validator.validate("http://127.0.0.1:3000/hook").valid);

            auto check = validator.validate("http://agent.example.com/hook");
            REQUIRE_FALSE(check.valid);
            REQUIRE(check.error == kHttpsRequired);
        }

        THEN("private literals are rejected") {
            auto check = validator.validate("https://10.0.0.1/hook");
            REQUIRE_FALSE(check.valid);
            REQUIRE(check.error == kPrivate);
        }

        THEN("shorthand, hex and integer IPv4 forms are rejected as private literals") {
            for (const char* url : {"https://10.1/hook", "https://0x0a000001/hook",
                                    "https://167772161/hook", "https://192.168.1/hook",
                                    "https://10.0.0.1./hook"}) {
                INFO(url);
                auto check = validator.validate(url);
                REQUIRE_FALSE(check.valid);
                REQUIRE(check.error == kPrivate);
            }
        }

        THEN("shorthand public literals still pass") {
            REQUIRE(validator.validate("https://134744072/hook").valid);
        }

        THEN("names are not resolved") {
            REQUIRE(validator.validate("https://unknown.example.com/hook").valid);
        }

        THEN("garbage is reported as malformed") {
            auto check = validator.validate("::::");
            REQUIRE_FALSE(check.valid);
            REQUIRE(check.error == "Invalid URL format");
        }
    }
}

SCENARIO("callback URL validation in production", "[url]") {
    GIVEN("a production validator") {
        auto validator = production_validator();

        THEN("a private literal is rejected") {
            REQUIRE(validator.validate("https://10.0.0.1/hook").error == kPrivate);
        }

        THEN("http to localhost is rejected") {
            REQUIRE(validator.validate("http://localhost:3000/hook").error == kHttpsRequired);
        }

        THEN("localhost and .local names are rejected") {
            REQUIRE(validator.validate("https://localhost/hook").error ==
                    "Callback URL cannot point to localhost in production");
            REQUIRE(validator.validate("https://printer.local/hook").error ==
                    "Callback URL cannot point to localhost in production");
        }

        THEN("a public name passes") {
            REQUIRE(validator.validate("https://agent.example.com/hook").valid);
        }

        THEN("a name with any private address is rejected") {
            REQUIRE(validator.validate("https://rebind.example.com/hook").error == kPrivate);
        }

        THEN("an unresolvable name fails closed") {
            auto check = validator.validate("https://nowhere.example.com/hook");
            REQUIRE_FALSE(check.valid);
            REQUIRE(check.error == "Callback URL host could not be resolved");
        }
    }

    GIVEN("a production validator allowing private networks") {
        auto validator = production_validator(true);

        THEN("a private literal is accepted") {
            REQUIRE(validator.validate("https://10.0.0.1/hook").valid);
        }
    }
}
