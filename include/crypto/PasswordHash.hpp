#pragma once

#include <string>

namespace fdx::crypto {

// Must run once before any other libsodium call; safe to call repeatedly.
void ensureSodiumInit();

// Hashes a password with Argon2id using libsodium
std::string hashPassword(const std::string& password);

// Verifies a password against a given Argon2id hash
bool verifyPassword(const std::string& password, const std::string& hash);

}
