#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include "util/logger.hpp"

int main(int argc, char* argv[]) {
    mahilo::util::set_log_level(spdlog::level::off);
    return Catch::Session().run(argc, argv);
}
