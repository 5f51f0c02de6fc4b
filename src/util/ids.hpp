#pragma once
#include <cstddef>
#include <string>

namespace mahilo::util {

// URL-safe random identifier (A-Za-z0-9_-)
std::string generate_id(std::size_t length = 21);

// Per-connection HMAC key handed to the agent once at registration
std::string generate_secret();

} // namespace mahilo::util
