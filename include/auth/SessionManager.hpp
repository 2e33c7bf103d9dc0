#pragma once

#include "auth/model/Session.hpp"
#include "identities/model/User.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <string>

namespace fdx::db { class Store; }
namespace fdx::cache { class Cache; }

namespace fdx::auth {

class SessionManager {
public:
    SessionManager(db::Store& store, cache::Cache& cache, const config::AuthConfig& auth,
                   const config::CachingConfig& caching);

    // SessionTooLong when ttl exceeds the configured maximum.
    model::Session createSession(const std::string& userId, std::chrono::seconds ttl);

    // Returns the session even when it has expired; authenticate() is the checked path.
    [[nodiscard]] model::Session getSession(const std::string& id);

    void deleteSession(const std::string& id);

    // The session's user, provided the session exists and is still valid.
    [[nodiscard]] identities::model::User authenticate(const std::string& sessionId);

    std::size_t purgeExpired();

    [[nodiscard]] std::chrono::seconds maxTtl() const { return max_ttl_; }

private:
    db::Store& store_;
    cache::Cache& cache_;
    std::chrono::seconds max_ttl_;
    std::chrono::seconds cache_ttl_;
};

}
