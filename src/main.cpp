#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include "core/config.hpp"
#include "registry/registry.hpp"
#include "util/logger.hpp"

namespace {

mahilo::core::RegistryConfig load(int argc, char** argv) {
    std::string path;
    if (argc > 1) {
        path = argv[1];
    } else if (const char* env = std::getenv("MAHILO_CONFIG")) {
        path = env;
    }

    mahilo::core::RegistryConfig config;
    if (!path.empty()) {
        config = mahilo::core::load_config(path);
    }
    mahilo::core::apply_env_overrides(config);
    return config;
}

} // namespace

int main(int argc, char** argv) {
    mahilo::core::RegistryConfig config;
    try {
        config = load(argc, argv);
    } catch (const mahilo::core::ConfigError& e) {
        mahilo::util::init_logger();
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    mahilo::util::init_logger(config.log_level, config.log_pattern);

    spdlog::info("=================================");
    spdlog::info("  Mahilo Registry v0.1.0");
    spdlog::info("=================================");

    std::filesystem::path db_path(config.database_path);
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create database directory {}: {}",
                          db_path.parent_path().string(), ec.message());
            return 1;
        }
    }

    try {
        mahilo::registry::Registry registry(config);

        if (!registry.init()) {
            spdlog::error("Failed to initialize registry");
            return 1;
        }

        // Run (blocks until Ctrl+C)
        registry.run();
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
