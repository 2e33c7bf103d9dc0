#include "db/Janitor.hpp"
#include "auth/SessionManager.hpp"
#include "fs/EntryManager.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

using namespace fdx::db;

Janitor::Janitor(fs::EntryManager& entries, auth::SessionManager& sessions, const config::AuditingConfig& auditing)
    : AsyncService("Janitor", auditing.sweep_interval),
      entries_(entries),
      sessions_(sessions),
      trash_retention_(auditing.trash_retention) {}

Janitor::~Janitor() { stop(); }

void Janitor::sweep() {
    try {
        sessions_.purgeExpired();
    } catch (const std::exception& e) {
        log::Registry::db()->warn("[Janitor] Failed to purge expired sessions: {}", e.what());
    }

    try {
        const auto cutoff = util::now() - std::chrono::duration_cast<std::chrono::seconds>(trash_retention_).count();
        entries_.purgeTrash(cutoff);
    } catch (const std::exception& e) {
        log::Registry::db()->warn("[Janitor] Failed to purge trash: {}", e.what());
    }
}

