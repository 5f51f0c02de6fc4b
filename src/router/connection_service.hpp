#pragma once
#include <optional>
#include <string>
#include <vector>
#include "net/url_validator.hpp"
#include "store/store.hpp"
#include "util/clock.hpp"

namespace mahilo::router {

enum class RegisterError {
    NONE,
    INVALID_REQUEST,
    INVALID_CALLBACK_URL,
    STORAGE_ERROR
};

struct RegisterRequest {
    std::string framework;
    std::string label;
    std::string description;
    std::vector<std::string> capabilities;
    int routing_priority = 0;
    std::string callback_url;
    std::optional<std::string> callback_secret;
    std::string public_key;
    std::string public_key_alg;
    bool rotate_secret = false;
};

struct RegisterResult {
    bool success = false;
    RegisterError code = RegisterError::NONE;
    std::string error;

    std::string connection_id;
    std::optional<std::string> callback_secret;   // only when generated or rotated
    bool updated = false;
};

// Agent webhook registration. Upserts on (user, framework, label).
class ConnectionService {
public:
    ConnectionService(store::ConnectionRegistry& connections,
                      const net::UrlValidator& validator,
                      util::Clock& clock);

    // Non-copyable
    ConnectionService(const ConnectionService&) = delete;
    ConnectionService& operator=(const ConnectionService&) = delete;

    RegisterResult register_connection(const std::string& user_id, const RegisterRequest& request);

private:
    store::ConnectionRegistry& connections_;
    const net::UrlValidator& validator_;
    util::Clock& clock_;
};

// Field checks only; the callback URL is checked separately
std::optional<std::string> validate_register_request(const RegisterRequest& request);

} // namespace mahilo::router
