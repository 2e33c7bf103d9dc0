#include "db/DBConnection.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace fdx::db;

DBConnection::DBConnection(std::string connectionString)
    : connectionString_(std::move(connectionString)),
      conn_(std::make_unique<pqxx::connection>(connectionString_)) {}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

bool DBConnection::isOpen() const { return conn_ && conn_->is_open(); }

void DBConnection::initPrepared() {
    if (!isOpen()) throw std::runtime_error("Database connection is not open");

    initPreparedEntries();
    initPreparedTransactions();
    initPreparedUsers();
    initPreparedSessions();
    prepared_ = true;
}

void DBConnection::ensureOpen() {
    if (isOpen()) return;

    log::Registry::db()->warn("[DBConnection::ensureOpen] Connection lost, reconnecting");
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
    if (prepared_) initPrepared();
}
