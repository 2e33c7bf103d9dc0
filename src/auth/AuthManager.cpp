#include "auth/AuthManager.hpp"
#include "auth/SessionManager.hpp"
#include "cache/Cache.hpp"
#include "cache/Keys.hpp"
#include "crypto/PasswordHash.hpp"
#include "db/Store.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"
#include "util/uuid.hpp"

#include <algorithm>
#include <cctype>

using namespace fdx::auth;
using namespace fdx::auth::model;
using namespace fdx::identities::model;
using namespace fdx::error;
using namespace fdx::util;

AuthManager::AuthManager(db::Store& store, cache::Cache& cache, SessionManager& sessions,
                         const config::AuthConfig& auth, const config::CachingConfig& caching)
    : store_(store), cache_(cache), sessions_(sessions),
      default_session_ttl_(auth.default_session_ttl), user_ttl_(caching.user_ttl) {
    crypto::ensureSodiumInit();
}

User AuthManager::registerUser(const std::string& username, const std::string& displayName,
                               const std::string& password) {
    if (!isValidName(username)) throw std::invalid_argument("Invalid username: '" + username + "'");
    if (displayName.empty()) throw std::invalid_argument("Display name must not be empty");
    if (!isValidPassword(password)) throw std::invalid_argument("Password must be between 8 and 128 characters");

    const auto hash = crypto::hashPassword(password);

    const auto user = store_.exec("AuthManager::registerUser", [&](db::Work& work) {
        if (work.findUserByName(username)) throw UserExists(username);

        User u;
        u.id = generateUUID();
        u.username = username;
        u.display_name = displayName;
        u.password_hash = hash;
        u.created_at = u.updated_at = now();

        work.insertUser(u);
        return u;
    });

    cache_.writeThrough(cache::keys::user(user.id), user, user_ttl_);
    log::Registry::auth()->info("[AuthManager::registerUser] Registered {} ({})", user.username, user.id);
    return user;
}

Session AuthManager::login(const std::string& username, const std::string& password,
                           const std::optional<std::chrono::seconds>& ttl) {
    const auto user = store_.exec("AuthManager::login", [&](db::Work& work) { return work.findUserByName(username); });
    if (!user) {
        log::Registry::auth()->warn("[AuthManager::login] Unknown user '{}'", username);
        throw UserNotFound(username);
    }

    if (!crypto::verifyPassword(password, user->password_hash)) {
        log::Registry::auth()->warn("[AuthManager::login] Wrong password for '{}'", username);
        throw InvalidCredentials(username);
    }

    auto session = sessions_.createSession(user->id, ttl.value_or(default_session_ttl_));
    log::Registry::auth()->debug("[AuthManager::login] {} logged in", username);
    return session;
}

void AuthManager::logout(const std::string& sessionId) {
    sessions_.deleteSession(sessionId);
}

User AuthManager::getUser(const std::string& id) {
    return cache_.cachedRead<User>(cache::keys::user(id), [&] {
        return store_.exec("AuthManager::getUser", [&](db::Work& work) {
            auto u = work.findUser(id);
            if (!u) throw UserNotFound(id);
            return *u;
        });
    }, user_ttl_);
}

std::vector<User> AuthManager::listUsers() {
    return store_.exec("AuthManager::listUsers", [&](db::Work& work) { return work.listUsers(); });
}

User AuthManager::updateUser(const std::string& id, const UserUpdate& update) {
    if (update.username && !isValidName(*update.username))
        throw std::invalid_argument("Invalid username: '" + *update.username + "'");
    if (update.display_name && update.display_name->empty())
        throw std::invalid_argument("Display name must not be empty");
    if (update.password && !isValidPassword(*update.password))
        throw std::invalid_argument("Password must be between 8 and 128 characters");

    const auto hash = update.password ? std::make_optional(crypto::hashPassword(*update.password)) : std::nullopt;

    const auto user = store_.exec("AuthManager::updateUser", [&](db::Work& work) {
        auto u = work.findUser(id);
        if (!u) throw UserNotFound(id);

        if (update.username && *update.username != u->username) {
            if (work.findUserByName(*update.username)) throw UserExists(*update.username);
            u->username = *update.username;
        }
        if (update.display_name) u->display_name = *update.display_name;
        if (hash) u->password_hash = *hash;
        u->updated_at = now();

        work.updateUser(*u);
        return *u;
    });

    cache_.writeThrough(cache::keys::user(user.id), user, user_ttl_);
    return user;
}

void AuthManager::deleteUser(const std::string& id) {
    const auto [entryIds, sessionIds] = store_.exec("AuthManager::deleteUser", [&](db::Work& work) {
        if (!work.findUser(id)) throw UserNotFound(id);
        auto entries = work.listEntryIdsByAuthor(id);
        auto sessions = work.listSessionIdsByUser(id);
        work.deleteUser(id);
        return std::make_pair(std::move(entries), std::move(sessions));
    });

    cache_.invalidate(cache::keys::user(id));
    cache_.invalidatePrefix(cache::keys::entriesPrefix(id));
    for (const auto& entryId : entryIds) cache_.invalidate(cache::keys::entry(entryId));
    for (const auto& sessionId : sessionIds) cache_.invalidate(cache::keys::session(sessionId));

    log::Registry::auth()->info("[AuthManager::deleteUser] Deleted {} with {} entr{} and {} session(s)",
                                id, entryIds.size(), entryIds.size() == 1 ? "y" : "ies", sessionIds.size());
}

bool AuthManager::isValidName(const std::string& name) {
    if (name.empty() || name.size() > 255) return false;
    return std::ranges::all_of(name, [](const unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

bool AuthManager::isValidPassword(const std::string& password) {
    return password.size() >= 8 && password.size() <= 128;
}
