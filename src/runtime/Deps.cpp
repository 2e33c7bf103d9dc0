#include "runtime/Deps.hpp"
#include "auth/AuthManager.hpp"
#include "auth/SessionManager.hpp"
#include "cache/Cache.hpp"
#include "config/Config.hpp"
#include "db/Janitor.hpp"
#include "db/MemoryStore.hpp"
#include "db/PgStore.hpp"
#include "fs/EntryManager.hpp"
#include "log/Registry.hpp"
#include "rbac/Guard.hpp"
#include "storage/LocalObjectStore.hpp"

using namespace fdx::runtime;

Deps::~Deps() {
    if (janitor) janitor->stop();
}

std::unique_ptr<Deps> Deps::build(const config::Config& config) {
    std::shared_ptr<db::Store> store;
    switch (config.database.backend) {
        case config::StoreBackend::Postgres: store = std::make_shared<db::PgStore>(config.database); break;
        case config::StoreBackend::Memory:
            log::Registry::filedex()->warn("[Deps] Using the in-memory store, nothing will persist");
            store = std::make_shared<db::MemoryStore>();
            break;
    }

    return build(config, std::move(store), std::make_shared<storage::LocalObjectStore>(config.storage.objects_path));
}

std::unique_ptr<Deps> Deps::build(const config::Config& config, std::shared_ptr<db::Store> store,
                                  std::shared_ptr<storage::ObjectStore> objects) {
    log::Registry::filedex()->info("[Deps] Initializing...");

    std::unique_ptr<Deps> ctx(new Deps());
    ctx->store = std::move(store);
    ctx->cache = std::make_shared<cache::Cache>(config.caching.max_keys);
    ctx->objects = std::move(objects);
    ctx->entryManager = std::make_shared<fs::EntryManager>(*ctx->store, *ctx->cache, *ctx->objects, config.caching);
    ctx->sessionManager = std::make_shared<auth::SessionManager>(*ctx->store, *ctx->cache, config.auth, config.caching);
    ctx->authManager = std::make_shared<auth::AuthManager>(*ctx->store, *ctx->cache, *ctx->sessionManager,
                                                           config.auth, config.caching);
    ctx->guard = std::make_shared<rbac::Guard>(*ctx->entryManager, *ctx->authManager);
    ctx->janitor = std::make_shared<db::Janitor>(*ctx->entryManager, *ctx->sessionManager, config.auditing);

    log::Registry::filedex()->info("[Deps] Initialized.");
    return ctx;
}
