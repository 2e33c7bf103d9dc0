#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace fdx::db {

class DBConnection {
  public:
    explicit DBConnection(std::string connectionString);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    [[nodiscard]] bool isOpen() const;

    void initPrepared();

    // Replaces a dropped connection, restoring prepared statements if they were set up.
    void ensureOpen();

  private:
    std::string connectionString_;
    std::unique_ptr<pqxx::connection> conn_;
    bool prepared_ = false;

    void initPreparedEntries() const;
    void initPreparedTransactions() const;
    void initPreparedUsers() const;
    void initPreparedSessions() const;
};

}
