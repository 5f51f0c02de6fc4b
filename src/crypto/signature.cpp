#include "crypto/signature.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace mahilo::crypto {

namespace {

constexpr const char* kSignaturePrefix = "sha256=";

std::string to_hex(const unsigned char* data, std::size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

} // namespace

std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    unsigned char* result = HMAC(EVP_sha256(),
                                 key.data(), static_cast<int>(key.size()),
                                 reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                                 digest, &digest_len);
    if (!result) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return to_hex(digest, digest_len);
}

std::string sign_webhook(const std::string& secret, int64_t timestamp, const std::string& body) {
    return kSignaturePrefix + hmac_sha256_hex(secret, std::to_string(timestamp) + "." + body);
}

bool verify_webhook(const std::string& secret, int64_t timestamp, const std::string& body,
                    const std::string& signature_header) {
    std::string expected = sign_webhook(secret, timestamp, body);
    if (expected.size() != signature_header.size()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), signature_header.data(), expected.size()) == 0;
}

} // namespace mahilo::crypto
