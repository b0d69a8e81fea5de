/**
 * SecureRandom — libsodium-backed random tokens.
 *
 * Message ids are 16 random bytes in hex, so collisions are negligible
 * without any bookkeeping on the relay side.
 */

#include "crypto/secure_random.h"

#include <vector>

#include <sodium.h>

bool SecureRandom::init() {
    // 0 on first success, 1 when already initialised, -1 on failure.
    return sodium_init() >= 0;
}

std::string SecureRandom::hex_token(std::size_t bytes) {
    std::vector<unsigned char> raw(bytes);
    randombytes_buf(raw.data(), raw.size());

    std::string hex(bytes * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
    hex.resize(bytes * 2);
    return hex;
}
