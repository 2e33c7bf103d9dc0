#include "crypto/PasswordHash.hpp"

#include <sodium.h>
#include <stdexcept>

namespace fdx::crypto {

constexpr std::size_t OPSLIMIT = crypto_pwhash_OPSLIMIT_INTERACTIVE;
constexpr std::size_t MEMLIMIT = crypto_pwhash_MEMLIMIT_INTERACTIVE;

void ensureSodiumInit() {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
}

std::string hashPassword(const std::string& password) {
    ensureSodiumInit();
    char hashed[crypto_pwhash_STRBYTES];

    if (crypto_pwhash_str(hashed, password.c_str(), password.size(), OPSLIMIT, MEMLIMIT) != 0)
        throw std::runtime_error("Password hashing failed (out of memory?)");

    return {hashed};
}

bool verifyPassword(const std::string& password, const std::string& hash) {
    ensureSodiumInit();
    return crypto_pwhash_str_verify(hash.c_str(), password.c_str(), password.size()) == 0;
}

}
