#include "db/PgStore.hpp"
#include "db/PgWork.hpp"
#include "db/DBPool.hpp"
#include "db/seed/init_db_tables.hpp"
#include "config/Config.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

using namespace fdx::db;

PgStore::PgStore(const config::DatabaseConfig& config) : PgStore(config.connectionString(), config.pool_size) {}

PgStore::PgStore(const std::string& connectionString, const unsigned int poolSize)
    : pool_(std::make_unique<DBPool>(connectionString, poolSize)) {
    log::Registry::db()->info("[PgStore] Connected {} pooled connection(s)", pool_->size());
    initSchema();
    pool_->initPreparedStatements();
}

PgStore::~PgStore() = default;

void PgStore::initSchema() {
    auto conn = pool_->acquire();
    try {
        {
            pqxx::work txn(conn->get());
            seed::init_tables_if_not_exists(txn);
            txn.commit();
        }
        pool_->release(std::move(conn));
    } catch (const std::exception& e) {
        log::Registry::db()->error("[PgStore::initSchema] Failed to create tables: {}", e.what());
        pool_->release(std::move(conn));
        throw;
    }
}

void PgStore::run(const std::string& ctx, const std::function<void(Work&)>& fn) {
    log::Registry::db()->trace("[PgStore::run] Starting transaction: {}", ctx);
    auto conn = pool_->acquire();

    try {
        conn->ensureOpen();
        {
            // the work must be gone before the connection goes back to the pool
            pqxx::work txn(conn->get());
            PgWork work(txn);
            fn(work);
            txn.commit();
        }
        log::Registry::db()->trace("[PgStore::run] Transaction committed: {}", ctx);
        pool_->release(std::move(conn));
    } catch (const error::Error& e) {
        log::Registry::db()->debug("[PgStore::run] Rolled back '{}': {}", ctx, e.what());
        pool_->release(std::move(conn));
        throw;
    } catch (const std::exception& e) {
        log::Registry::db()->error("[PgStore::run] Exception in transaction context '{}', rolling back: {}", ctx, e.what());
        pool_->release(std::move(conn));
        throw;
    }
}
