#pragma once

#include "auth/model/Session.hpp"
#include "identities/model/User.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace fdx::db { class Store; }
namespace fdx::cache { class Cache; }

namespace fdx::auth {

class SessionManager;

class AuthManager {
public:
    AuthManager(db::Store& store, cache::Cache& cache, SessionManager& sessions, const config::AuthConfig& auth,
                const config::CachingConfig& caching);

    identities::model::User registerUser(const std::string& username, const std::string& displayName,
                                         const std::string& password);

    // Opens a session of ttl (default from config) for a correct username/password pair.
    model::Session login(const std::string& username, const std::string& password,
                         const std::optional<std::chrono::seconds>& ttl = std::nullopt);

    void logout(const std::string& sessionId);

    // Served from the cache; password_hash is not part of the cached document and comes back empty.
    [[nodiscard]] identities::model::User getUser(const std::string& id);
    [[nodiscard]] std::vector<identities::model::User> listUsers();

    identities::model::User updateUser(const std::string& id, const identities::model::UserUpdate& update);

    // Removes the user along with their sessions, entries and those entries' transactions.
    void deleteUser(const std::string& id);

private:
    db::Store& store_;
    cache::Cache& cache_;
    SessionManager& sessions_;
    std::chrono::seconds default_session_ttl_;
    std::chrono::seconds user_ttl_;

    static bool isValidName(const std::string& name);
    static bool isValidPassword(const std::string& password);
};

}
