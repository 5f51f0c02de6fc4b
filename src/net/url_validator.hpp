#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mahilo::net {

// Components of an absolute http(s) URL
struct ParsedUrl {
    std::string scheme;   // lowercase
    std::string host;     // lowercase, IPv6 literals without brackets
    int port = 0;         // explicit port or scheme default
    std::string path;     // includes query, "/" when empty
};

std::optional<ParsedUrl> parse_url(const std::string& url);

// Outcome of a callback URL check
struct UrlCheck {
    bool valid = false;
    std::string error;
};

// Maps a host name to its addresses; nullopt when resolution fails
using HostResolver = std::function<std::optional<std::vector<std::string>>(const std::string& host)>;

// getaddrinfo-backed resolver
std::optional<std::vector<std::string>> resolve_host(const std::string& host);

// "localhost", 127.0.0.0/8, ::1 and ::ffff:127.x
bool is_loopback_host(const std::string& host);

// True when host is an IPv4 or IPv6 literal
bool is_ip_literal(const std::string& host);

// Private, loopback, link-local, CGNAT, unspecified and unique-local
// ranges. Expects an IP literal; returns false for names.
bool is_private_address(const std::string& ip);

struct UrlPolicy {
    bool production = false;
    bool allow_private_ips = false;
};

// SSRF guard for callback URLs. Runs at connection registration.
class UrlValidator {
public:
    explicit UrlValidator(UrlPolicy policy, HostResolver resolver = resolve_host);

    UrlCheck validate(const std::string& url) const;

    const UrlPolicy& policy() const { return policy_; }

private:
    UrlPolicy policy_;
    HostResolver resolver_;
};

} // namespace mahilo::net
