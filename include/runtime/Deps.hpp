#pragma once

#include <memory>

namespace fdx::config { struct Config; }
namespace fdx::db { class Store; class Janitor; }
namespace fdx::cache { class Cache; }
namespace fdx::storage { class ObjectStore; }
namespace fdx::fs { class EntryManager; }
namespace fdx::auth { class SessionManager; class AuthManager; }
namespace fdx::rbac { class Guard; }

namespace fdx::runtime {

// Owns every service handle of one process. Members are declared in construction order,
// so teardown runs the janitor down first and the store last.
struct Deps {
    std::shared_ptr<db::Store> store;
    std::shared_ptr<cache::Cache> cache;
    std::shared_ptr<storage::ObjectStore> objects;
    std::shared_ptr<fs::EntryManager> entryManager;
    std::shared_ptr<auth::SessionManager> sessionManager;
    std::shared_ptr<auth::AuthManager> authManager;
    std::shared_ptr<rbac::Guard> guard;
    std::shared_ptr<db::Janitor> janitor;

    Deps(const Deps&) = delete;
    Deps& operator=(const Deps&) = delete;
    ~Deps();

    // Store backend and object root come from config. The janitor is created but not started.
    static std::unique_ptr<Deps> build(const config::Config& config);

    // Same wiring over caller supplied store and object store.
    static std::unique_ptr<Deps> build(const config::Config& config, std::shared_ptr<db::Store> store,
                                       std::shared_ptr<storage::ObjectStore> objects);

private:
    Deps() = default;
};

}
