#include "core/config.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace mahilo::core {

namespace {

template <typename T>
void read_field(const json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return;
    }
    try {
        out = j[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
}

bool env_flag(const std::string& value) {
    return value == "true" || value == "1";
}

int env_int(const char* name, const std::string& value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " must be an integer");
    }
}

void check_ranges(const RegistryConfig& config) {
    if (config.max_payload_size == 0) {
        throw ConfigError("max_payload_size must be positive");
    }
    if (config.max_retries < 0) {
        throw ConfigError("max_retries must not be negative");
    }
    if (config.callback_timeout_ms <= 0) {
        throw ConfigError("callback_timeout_ms must be positive");
    }
    if (config.retry_tick_ms <= 0) {
        throw ConfigError("retry_tick_ms must be positive");
    }
}

std::size_t to_payload_size(const char* name, long long value) {
    if (value <= 0) {
        throw ConfigError(std::string(name) + " must be positive");
    }
    return static_cast<std::size_t>(value);
}

} // namespace

RegistryConfig parse_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config root must be an object");
    }

    RegistryConfig config;
    read_field(root, "database_path", config.database_path);
    read_field(root, "environment", config.environment);
    read_field(root, "trusted_mode", config.trusted_mode);
    read_field(root, "allow_private_ips", config.allow_private_ips);
    if (root.contains("max_payload_size") && !root["max_payload_size"].is_null()) {
        long long payload_size = 0;
        read_field(root, "max_payload_size", payload_size);
        config.max_payload_size = to_payload_size("max_payload_size", payload_size);
    }
    read_field(root, "max_retries", config.max_retries);
    read_field(root, "callback_timeout_ms", config.callback_timeout_ms);
    read_field(root, "retry_tick_ms", config.retry_tick_ms);
    read_field(root, "log_level", config.log_level);
    read_field(root, "log_pattern", config.log_pattern);

    if (root.contains("llm")) {
        const json& llm = root["llm"];
        if (!llm.is_object()) {
            throw ConfigError("'llm' must be an object");
        }
        read_field(llm, "api_key", config.llm.api_key);
        read_field(llm, "model", config.llm.model);
        read_field(llm, "api_host", config.llm.api_host);
        read_field(llm, "timeout_ms", config.llm.timeout_ms);
        read_field(llm, "max_tokens", config.llm.max_tokens);
        read_field(llm, "fail_open", config.llm.fail_open);
    }

    check_ranges(config);
    return config;
}

RegistryConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

void apply_env_overrides(RegistryConfig& config) {
    std::string value;

    if (!(value = env_or_empty("DATABASE_URL")).empty()) {
        config.database_path = value;
    }
    if (!(value = env_or_empty("NODE_ENV")).empty()) {
        config.environment = value;
    }
    if (!(value = env_or_empty("TRUSTED_MODE")).empty()) {
        config.trusted_mode = env_flag(value);
    }
    if (!(value = env_or_empty("ALLOW_PRIVATE_IPS")).empty()) {
        config.allow_private_ips = env_flag(value);
    }
    if (!(value = env_or_empty("MAX_PAYLOAD_SIZE")).empty()) {
        config.max_payload_size = to_payload_size("MAX_PAYLOAD_SIZE", env_int("MAX_PAYLOAD_SIZE", value));
    }
    if (!(value = env_or_empty("MAX_RETRIES")).empty()) {
        config.max_retries = env_int("MAX_RETRIES", value);
    }
    if (!(value = env_or_empty("CALLBACK_TIMEOUT_MS")).empty()) {
        config.callback_timeout_ms = env_int("CALLBACK_TIMEOUT_MS", value);
    }
    if (!(value = env_or_empty("ANTHROPIC_API_KEY")).empty()) {
        config.llm.api_key = value;
    }
    if (!(value = env_or_empty("LLM_POLICY_MODEL")).empty()) {
        config.llm.model = value;
    }
    if (!(value = env_or_empty("LLM_POLICY_TIMEOUT_MS")).empty()) {
        config.llm.timeout_ms = env_int("LLM_POLICY_TIMEOUT_MS", value);
    }
    if (!(value = env_or_empty("LLM_POLICY_FAIL_OPEN")).empty()) {
        config.llm.fail_open = env_flag(value);
    }
    if (!(value = env_or_empty("MAHILO_LOG_LEVEL")).empty()) {
        config.log_level = value;
    }

    check_ranges(config);
}

} // namespace mahilo::core
