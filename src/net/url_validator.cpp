#include "net/url_validator.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <utility>

namespace mahilo::net {

namespace {

constexpr const char* kInvalidFormat = "Invalid URL format";
constexpr const char* kHttpsRequired = "Callback URL must use HTTPS (except localhost in development)";
constexpr const char* kPrivateAddress = "Callback URL cannot point to private/internal addresses";
constexpr const char* kLocalhostInProduction = "Callback URL cannot point to localhost in production";
constexpr const char* kUnresolvable = "Callback URL host could not be resolved";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool valid_host_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_';
}

// Accepts every form the resolver treats as an IPv4 literal ("10.1",
// "0x0a000001", "167772161"), not only dotted quads.
bool parse_v4(const std::string& ip, uint8_t out[4]) {
    std::string text = ip;
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    if (text.empty() || std::any_of(text.begin(), text.end(),
                                    [](unsigned char c) { return std::isspace(c); })) {
        return false;
    }
    in_addr addr{};
    if (inet_aton(text.c_str(), &addr) == 0) {
        return false;
    }
    std::memcpy(out, &addr.s_addr, 4);
    return true;
}

bool parse_v6(const std::string& ip, uint8_t out[16]) {
    in6_addr addr{};
    if (inet_pton(AF_INET6, ip.c_str(), &addr) != 1) {
        return false;
    }
    std::memcpy(out, addr.s6_addr, 16);
    return true;
}

bool private_v4(const uint8_t b[4]) {
    if (b[0] == 10) return true;                                   // 10.0.0.0/8
    if (b[0] == 172 && b[1] >= 16 && b[1] <= 31) return true;      // 172.16.0.0/12
    if (b[0] == 192 && b[1] == 168) return true;                   // 192.168.0.0/16
    if (b[0] == 169 && b[1] == 254) return true;                   // 169.254.0.0/16
    if (b[0] == 100 && b[1] >= 64 && b[1] <= 127) return true;     // 100.64.0.0/10
    if (b[0] == 0) return true;                                    // 0.0.0.0/8
    if (b[0] == 127) return true;                                  // 127.0.0.0/8
    return false;
}

// ::ffff:a.b.c.d
bool mapped_v4(const uint8_t b[16], uint8_t out[4]) {
    for (int i = 0; i < 10; ++i) {
        if (b[i] != 0) {
            return false;
        }
    }
    if (b[10] != 0xff || b[11] != 0xff) {
        return false;
    }
    std::memcpy(out, b + 12, 4);
    return true;
}

bool private_v6(const uint8_t b[16]) {
    uint8_t v4[4];
    if (mapped_v4(b, v4)) {
        return private_v4(v4);
    }

    bool all_zero_prefix = true;
    for (int i = 0; i < 15; ++i) {
        if (b[i] != 0) {
            all_zero_prefix = false;
            break;
        }
    }
    if (all_zero_prefix && (b[15] == 0 || b[15] == 1)) return true; // :: and ::1
    if ((b[0] & 0xfe) == 0xfc) return true;                          // fc00::/7
    if (b[0] == 0xfe && (b[1] & 0xc0) == 0x80) return true;          // fe80::/10
    return false;
}

} // namespace

std::optional<ParsedUrl> parse_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = to_lower(url.substr(0, scheme_end));
    for (char c : parsed.scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return std::nullopt;
        }
    }

    std::string rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, path_start);
    parsed.path = path_start == std::string::npos ? "/" : rest.substr(path_start);
    if (parsed.path.empty() || parsed.path[0] != '/') {
        parsed.path = "/" + parsed.path;
    }
    auto fragment = parsed.path.find('#');
    if (fragment != std::string::npos) {
        parsed.path.erase(fragment);
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    std::string port_text;
    if (authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') {
                return std::nullopt;
            }
            port_text = tail.substr(1);
        }
        uint8_t bytes[16];
        if (!parse_v6(parsed.host, bytes)) {
            return std::nullopt;
        }
    } else {
        auto colon = authority.find(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
        if (parsed.host.empty() ||
            !std::all_of(parsed.host.begin(), parsed.host.end(), valid_host_char)) {
            return std::nullopt;
        }
    }
    parsed.host = to_lower(parsed.host);

    if (!port_text.empty()) {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        parsed.port = std::stoi(port_text);
        if (parsed.port <= 0 || parsed.port > 65535) {
            return std::nullopt;
        }
    } else if (parsed.scheme == "https") {
        parsed.port = 443;
    } else if (parsed.scheme == "http") {
        parsed.port = 80;
    }

    return parsed;
}

std::optional<std::vector<std::string>> resolve_host(const std::string& host) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &results);
    if (rc != 0) {
        spdlog::debug("DNS resolution failed for {}: {}", host, gai_strerror(rc));
        return std::nullopt;
    }

    std::vector<std::string> addresses;
    char buf[INET6_ADDRSTRLEN];
    for (addrinfo* ai = results; ai; ai = ai->ai_next) {
        const void* src = nullptr;
        if (ai->ai_family == AF_INET) {
            src = &reinterpret_cast<sockaddr_in*>(ai->ai_addr)->sin_addr;
        } else if (ai->ai_family == AF_INET6) {
            src = &reinterpret_cast<sockaddr_in6*>(ai->ai_addr)->sin6_addr;
        } else {
            continue;
        }
        if (inet_ntop(ai->ai_family, src, buf, sizeof(buf))) {
            addresses.emplace_back(buf);
        }
    }
    freeaddrinfo(results);

    if (addresses.empty()) {
        return std::nullopt;
    }
    return addresses;
}

bool is_loopback_host(const std::string& host) {
    if (host == "localhost") {
        return true;
    }
    uint8_t v4[4];
    if (parse_v4(host, v4)) {
        return v4[0] == 127;
    }
    uint8_t v6[16];
    if (parse_v6(host, v6)) {
        if (mapped_v4(v6, v4)) {
            return v4[0] == 127;
        }
        for (int i = 0; i < 15; ++i) {
            if (v6[i] != 0) {
                return false;
            }
        }
        return v6[15] == 1;
    }
    return false;
}

bool is_ip_literal(const std::string& host) {
    uint8_t v4[4];
    uint8_t v6[16];
    return parse_v4(host, v4) || parse_v6(host, v6);
}

bool is_private_address(const std::string& ip) {
    uint8_t v4[4];
    if (parse_v4(ip, v4)) {
        return private_v4(v4);
    }
    uint8_t v6[16];
    if (parse_v6(ip, v6)) {
        return private_v6(v6);
    }
    return false;
}

UrlValidator::UrlValidator(UrlPolicy policy, HostResolver resolver)
    : policy_(policy), resolver_(std::move(resolver)) {}

UrlCheck UrlValidator::validate(const std::string& url) const {
    auto parsed = parse_url(url);
    if (!parsed) {
        return {false, kInvalidFormat};
    }

    const std::string& host = parsed->host;
    const bool loopback = is_loopback_host(host);

    if (parsed->scheme != "https") {
        if (parsed->scheme != "http" || !loopback || policy_.production) {
            return {false, kHttpsRequired};
        }
    }

    // Local development callbacks
    if (!policy_.production && loopback) {
        return {true, ""};
    }

    if (policy_.allow_private_ips) {
        return {true, ""};
    }

    if (is_ip_literal(host)) {
        if (is_private_address(host)) {
            return {false, kPrivateAddress};
        }
        return {true, ""};
    }

    if (policy_.production) {
        if (loopback || ends_with(host, ".local")) {
            return {false, kLocalhostInProduction};
        }

        // Resolve now so a name pointing at an internal address is caught
        auto addresses = resolver_(host);
        if (!addresses) {
            return {false, kUnresolvable};
        }
        for (const auto& addr : *addresses) {
            if (is_private_address(addr)) {
                spdlog::warn("Callback host {} resolves to internal address {}", host, addr);
                return {false, kPrivateAddress};
            }
        }
    }

    return {true, ""};
}

} // namespace mahilo::net
