#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"

#include <chrono>

namespace fdx::fs { class EntryManager; }
namespace fdx::auth { class SessionManager; }

namespace fdx::db {

// Periodically drops expired sessions and trash older than the retention window.
class Janitor final : public concurrency::AsyncService {
public:
    Janitor(fs::EntryManager& entries, auth::SessionManager& sessions, const config::AuditingConfig& auditing);
    ~Janitor() override;

    // One pass of both sweeps. Each failure is logged and does not stop the other.
    void sweep();

protected:
    void tick() override { sweep(); }

private:
    fs::EntryManager& entries_;
    auth::SessionManager& sessions_;
    std::chrono::days trash_retention_;
};

}
