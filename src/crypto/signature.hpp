#pragma once
#include <cstdint>
#include <string>

namespace mahilo::crypto {

// Lowercase hex HMAC-SHA256 of data under key
std::string hmac_sha256_hex(const std::string& key, const std::string& data);

// Value of X-Mahilo-Signature: "sha256=" + hex HMAC over "<timestamp>.<body>"
std::string sign_webhook(const std::string& secret, int64_t timestamp, const std::string& body);

// Constant-time check of a received X-Mahilo-Signature header
bool verify_webhook(const std::string& secret, int64_t timestamp, const std::string& body,
                    const std::string& signature_header);

} // namespace mahilo::crypto
