#pragma once

#include "crypto/PasswordHash.hpp"

#include <sodium.h>
#include <string>
#include <vector>

namespace fdx::crypto {

// Hex encoded string of `bytes` random bytes from libsodium's CSPRNG.
inline std::string generateSecureToken(const std::size_t bytes = 32) {
    ensureSodiumInit();
    std::vector<unsigned char> buf(bytes);
    randombytes_buf(buf.data(), buf.size());

    std::string hex(bytes * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), buf.data(), buf.size());
    hex.pop_back();
    return hex;
}

}
