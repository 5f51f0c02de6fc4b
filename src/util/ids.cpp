#include "util/ids.hpp"
#include <openssl/rand.h>
#include <stdexcept>
#include <vector>

namespace mahilo::util {

namespace {

constexpr char kAlphabet[] =
    "useandom-26T198340PX75pxJACKVERYMINDBUSHWOLF_GQZbfghjklqvwyzrict";

} // namespace

std::string generate_id(std::size_t length) {
    std::vector<unsigned char> bytes(length);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    std::string id;
    id.reserve(length);
    for (unsigned char b : bytes) {
        id.push_back(kAlphabet[b & 63]);
    }
    return id;
}

std::string generate_secret() {
    return generate_id(32);
}

} // namespace mahilo::util
