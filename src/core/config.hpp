#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mahilo::core {

// LLM judge configuration
struct LLMJudgeConfig {
    std::string api_key;                                   // ANTHROPIC_API_KEY
    std::string model = "claude-3-haiku-20240307";
    std::string api_host = "api.anthropic.com";
    int timeout_ms = 5000;
    int max_tokens = 256;
    bool fail_open = true;                                 // errors/unclear answers resolve to PASS

    bool enabled() const { return !api_key.empty(); }
};

// Registry configuration
struct RegistryConfig {
    std::string database_path = "./data/mahilo.db";
    std::string environment = "development";              // "production" enables hosted checks
    bool trusted_mode = false;                             // registry may read plaintext
    bool allow_private_ips = false;                        // self-hosted deployments
    std::size_t max_payload_size = 32768;                  // bytes
    int max_retries = 5;
    int callback_timeout_ms = 30000;
    int retry_tick_ms = 1000;
    std::string log_level = "info";
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    LLMJudgeConfig llm;

    bool is_production() const { return environment == "production"; }
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Load from a JSON file. Missing keys keep their defaults.
RegistryConfig load_config(const std::string& path);

// Parse from JSON text (used by load_config and tests)
RegistryConfig parse_config(const std::string& json_text);

// Environment variables win over file values. The merged result is
// range-checked like a parsed file; violations throw ConfigError.
void apply_env_overrides(RegistryConfig& config);

} // namespace mahilo::core
