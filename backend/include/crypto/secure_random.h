#pragma once

#include <cstddef>
#include <string>

/**
 * Wraps libsodium's CSPRNG for the relay's message identifiers.
 */
class SecureRandom {
public:
    /// Must be called once before any other method. Safe to call again.
    static bool init();

    /// `bytes` random bytes rendered as lower-case hex (2 * bytes characters).
    static std::string hex_token(std::size_t bytes = 16);
};
