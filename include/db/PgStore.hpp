#pragma once

#include "db/Store.hpp"

#include <memory>
#include <string>

namespace fdx::config { struct DatabaseConfig; }

namespace fdx::db {

class DBPool;

// PostgreSQL backend. Each unit of work borrows a pooled connection for one pqxx::work.
class PgStore final : public Store {
public:
    // Connects the pool, creates missing tables and prepares all statements.
    explicit PgStore(const config::DatabaseConfig& config);
    PgStore(const std::string& connectionString, unsigned int poolSize);
    ~PgStore() override;

protected:
    void run(const std::string& ctx, const std::function<void(Work&)>& fn) override;

private:
    std::unique_ptr<DBPool> pool_;

    void initSchema();
};

}
