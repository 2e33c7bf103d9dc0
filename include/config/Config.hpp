#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace fdx::config {

enum class StoreBackend { Postgres, Memory };

std::string to_string(StoreBackend backend);
StoreBackend storeBackendFromString(const std::string& str);

struct DatabaseConfig {
    StoreBackend backend = StoreBackend::Postgres;
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "filedex";
    std::string user = "filedex";
    std::string password{};
    unsigned int pool_size = 4;

    // FILEDEX_DB_PASSWORD wins over the value in the file
    [[nodiscard]] std::string resolvePassword() const;
    [[nodiscard]] std::string connectionString() const;
};

struct CachingConfig {
    std::chrono::seconds entry_ttl{60};
    std::chrono::seconds list_ttl{60};
    std::chrono::seconds user_ttl{300};
    std::chrono::seconds session_ttl{60};
    std::size_t max_keys = 10000;
};

struct AuthConfig {
    std::chrono::days session_max_ttl{30};
    std::chrono::days default_session_ttl{7};
};

struct StorageConfig {
    std::filesystem::path objects_path = "/var/lib/filedex/objects";
};

struct AuditingConfig {
    std::chrono::days trash_retention{30};
    std::chrono::minutes sweep_interval{10};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum filedex = spdlog::level::info;   // startup/shutdown, service lifecycle
    spdlog::level::level_enum db      = spdlog::level::err;    // failed transactions, connection loss
    spdlog::level::level_enum cache   = spdlog::level::warn;
    spdlog::level::level_enum fs      = spdlog::level::warn;   // entry tree mutations
    spdlog::level::level_enum rbac    = spdlog::level::warn;   // denied access
    spdlog::level::level_enum auth    = spdlog::level::warn;   // failed logins, expired sessions
    spdlog::level::level_enum storage = spdlog::level::warn;   // object store I/O
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/filedex";
    LogLevelsConfig levels;
};

struct Config {
    DatabaseConfig database;
    CachingConfig caching;
    AuthConfig auth;
    StorageConfig storage;
    AuditingConfig auditing;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

}
