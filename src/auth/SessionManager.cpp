#include "auth/SessionManager.hpp"
#include "cache/Cache.hpp"
#include "cache/Keys.hpp"
#include "crypto/random.hpp"
#include "db/Store.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

using namespace fdx::auth;
using namespace fdx::auth::model;
using namespace fdx::identities::model;
using namespace fdx::error;
using namespace fdx::util;

SessionManager::SessionManager(db::Store& store, cache::Cache& cache, const config::AuthConfig& auth,
                               const config::CachingConfig& caching)
    : store_(store), cache_(cache), max_ttl_(auth.session_max_ttl), cache_ttl_(caching.session_ttl) {}

Session SessionManager::createSession(const std::string& userId, const std::chrono::seconds ttl) {
    if (ttl <= std::chrono::seconds::zero()) throw std::invalid_argument("Session ttl must be positive");
    if (ttl > max_ttl_) {
        log::Registry::auth()->warn("[SessionManager::createSession] Refused {}s session for {} (max {}s)",
                                    ttl.count(), userId, max_ttl_.count());
        throw SessionTooLong(std::to_string(ttl.count()) + "s exceeds " + std::to_string(max_ttl_.count()) + "s");
    }

    const auto session = store_.exec("SessionManager::createSession", [&](db::Work& work) {
        if (!work.findUser(userId)) throw UserNotFound(userId);

        Session s;
        s.id = crypto::generateSecureToken();
        s.user_id = userId;
        s.created_at = now();
        s.valid_until = s.created_at + static_cast<std::time_t>(ttl.count());

        work.insertSession(s);
        return s;
    });

    cache_.writeThrough(cache::keys::session(session.id), session, cache_ttl_);
    log::Registry::audit()->info("session_create user={} valid_until={}", userId, timestampToString(session.valid_until));
    return session;
}

Session SessionManager::getSession(const std::string& id) {
    return cache_.cachedRead<Session>(cache::keys::session(id), [&] {
        return store_.exec("SessionManager::getSession", [&](db::Work& work) {
            auto s = work.findSession(id);
            if (!s) throw SessionNotFound();
            return *s;
        });
    }, cache_ttl_);
}

void SessionManager::deleteSession(const std::string& id) {
    const auto userId = store_.exec("SessionManager::deleteSession", [&](db::Work& work) {
        const auto s = work.findSession(id);
        if (!s) throw SessionNotFound();
        work.deleteSession(id);
        return s->user_id;
    });

    cache_.invalidate(cache::keys::session(id));
    log::Registry::audit()->info("session_delete user={}", userId);
}

User SessionManager::authenticate(const std::string& sessionId) {
    const auto session = getSession(sessionId);
    if (session.isExpired(now())) {
        log::Registry::auth()->debug("[SessionManager::authenticate] Session of {} expired at {}",
                                     session.user_id, timestampToString(session.valid_until));
        throw SessionExpired("expired at " + timestampToString(session.valid_until));
    }

    return store_.exec("SessionManager::authenticate", [&](db::Work& work) {
        auto user = work.findUser(session.user_id);
        if (!user) throw UserNotFound(session.user_id);
        return *user;
    });
}

std::size_t SessionManager::purgeExpired() {
    const auto ts = now();
    const auto [ids, count] = store_.exec("SessionManager::purgeExpired", [&](db::Work& work) {
        auto expired = work.listExpiredSessionIds(ts);
        const auto n = work.deleteExpiredSessions(ts);
        return std::make_pair(std::move(expired), n);
    });

    for (const auto& id : ids) cache_.invalidate(cache::keys::session(id));
    if (count) log::Registry::auth()->info("[SessionManager::purgeExpired] Removed {} expired session(s)", count);
    return count;
}
