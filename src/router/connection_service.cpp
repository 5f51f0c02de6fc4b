#include "router/connection_service.hpp"
#include "util/ids.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>

namespace mahilo::router {

namespace {

constexpr std::size_t kMaxNameLength = 50;
constexpr std::size_t kMaxDescriptionLength = 500;
constexpr std::size_t kMinSecretLength = 16;
constexpr std::size_t kMaxSecretLength = 64;

RegisterResult failure(RegisterError code, std::string error) {
    RegisterResult result;
    result.code = code;
    result.error = std::move(error);
    return result;
}

} // namespace

std::optional<std::string> validate_register_request(const RegisterRequest& request) {
    if (request.framework.empty() || request.framework.size() > kMaxNameLength) {
        return "framework must be 1-50 characters";
    }
    if (request.label.empty() || request.label.size() > kMaxNameLength) {
        return "label must be 1-50 characters";
    }
    if (request.description.size() > kMaxDescriptionLength) {
        return "description must be at most 500 characters";
    }
    if (request.routing_priority < 0 || request.routing_priority > 100) {
        return "routing_priority must be between 0 and 100";
    }
    if (request.callback_secret &&
        (request.callback_secret->size() < kMinSecretLength ||
         request.callback_secret->size() > kMaxSecretLength)) {
        return "callback_secret must be 16-64 characters";
    }
    if (request.public_key.empty()) {
        return "public_key is required";
    }
    if (request.public_key_alg != "ed25519" && request.public_key_alg != "x25519") {
        return "public_key_alg must be ed25519 or x25519";
    }
    return std::nullopt;
}

ConnectionService::ConnectionService(store::ConnectionRegistry& connections,
                                     const net::UrlValidator& validator,
                                     util::Clock& clock)
    : connections_(connections)
    , validator_(validator)
    , clock_(clock) {}

RegisterResult ConnectionService::register_connection(const std::string& user_id,
                                                      const RegisterRequest& request) {
    if (auto invalid = validate_register_request(request)) {
        return failure(RegisterError::INVALID_REQUEST, *invalid);
    }

    auto check = validator_.validate(request.callback_url);
    if (!check.valid) {
        spdlog::warn("Rejected callback URL for user {}: {}", user_id, check.error);
        return failure(RegisterError::INVALID_CALLBACK_URL, check.error);
    }

    auto existing = connections_.find_by_label(user_id, request.framework, request.label);
    if (existing) {
        core::AgentConnection conn = *existing;
        conn.description = request.description;
        conn.capabilities = request.capabilities;
        conn.routing_priority = request.routing_priority;
        conn.callback_url = request.callback_url;
        conn.public_key = request.public_key;
        conn.public_key_alg = request.public_key_alg;
        conn.status = "active";
        conn.last_seen = clock_.now();

        std::optional<std::string> new_secret;
        if (request.callback_secret) {
            new_secret = *request.callback_secret;
        } else if (request.rotate_secret) {
            new_secret = util::generate_secret();
        }
        if (new_secret) {
            conn.callback_secret = *new_secret;
        }

        auto updated = connections_.update_connection(conn);
        if (!updated) {
            spdlog::error("Failed to update connection {}: {}", conn.id, updated.message);
            return failure(RegisterError::STORAGE_ERROR, "Failed to update connection");
        }

        spdlog::info("Updated connection {} ({}/{}) for user {}",
                     conn.id, conn.framework, conn.label, user_id);

        RegisterResult result;
        result.success = true;
        result.connection_id = conn.id;
        result.callback_secret = new_secret;
        result.updated = true;
        return result;
    }

    core::AgentConnection conn;
    conn.id = util::generate_id();
    conn.user_id = user_id;
    conn.framework = request.framework;
    conn.label = request.label;
    conn.description = request.description;
    conn.capabilities = request.capabilities;
    conn.public_key = request.public_key;
    conn.public_key_alg = request.public_key_alg;
    conn.routing_priority = request.routing_priority;
    conn.callback_url = request.callback_url;
    conn.callback_secret = request.callback_secret.value_or(util::generate_secret());
    conn.status = "active";
    conn.created_at = clock_.now();

    auto inserted = connections_.insert_connection(conn);
    if (!inserted) {
        spdlog::error("Failed to register connection for user {}: {}", user_id, inserted.message);
        return failure(RegisterError::STORAGE_ERROR, "Failed to register connection");
    }

    spdlog::info("Registered connection {} ({}/{}) for user {}",
                 conn.id, conn.framework, conn.label, user_id);

    RegisterResult result;
    result.success = true;
    result.connection_id = conn.id;
    result.callback_secret = conn.callback_secret;
    return result;
}

} // namespace mahilo::router
