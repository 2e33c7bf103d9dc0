#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fdx::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["backend"] = fdx::config::to_string(rhs.backend);
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.backend = storeBackendFromString(node["backend"].as<std::string>("postgres"));
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("filedex");
        rhs.user = node["user"].as<std::string>("filedex");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<CachingConfig> {
    static Node encode(const CachingConfig& rhs) {
        Node node;
        node["entry_ttl_seconds"] = rhs.entry_ttl.count();
        node["list_ttl_seconds"] = rhs.list_ttl.count();
        node["user_ttl_seconds"] = rhs.user_ttl.count();
        node["session_ttl_seconds"] = rhs.session_ttl.count();
        node["max_keys"] = rhs.max_keys;
        return node;
    }

    static bool decode(const Node& node, CachingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.entry_ttl = std::chrono::seconds(node["entry_ttl_seconds"].as<long>(60));
        rhs.list_ttl = std::chrono::seconds(node["list_ttl_seconds"].as<long>(60));
        rhs.user_ttl = std::chrono::seconds(node["user_ttl_seconds"].as<long>(300));
        rhs.session_ttl = std::chrono::seconds(node["session_ttl_seconds"].as<long>(60));
        rhs.max_keys = node["max_keys"].as<std::size_t>(10000);
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static Node encode(const AuthConfig& rhs) {
        Node node;
        node["session_max_ttl_days"] = rhs.session_max_ttl.count();
        node["default_session_ttl_days"] = rhs.default_session_ttl.count();
        return node;
    }

    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.session_max_ttl = std::chrono::days(node["session_max_ttl_days"].as<unsigned int>(30));
        rhs.default_session_ttl = std::chrono::days(node["default_session_ttl_days"].as<unsigned int>(7));
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["objects_path"] = rhs.objects_path.string();
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.objects_path = node["objects_path"].as<std::string>("/var/lib/filedex/objects");
        return true;
    }
};

template<>
struct convert<AuditingConfig> {
    static Node encode(const AuditingConfig& rhs) {
        Node node;
        node["trash_retention_days"] = rhs.trash_retention.count();
        node["sweep_interval_minutes"] = rhs.sweep_interval.count();
        return node;
    }

    static bool decode(const Node& node, AuditingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.trash_retention = std::chrono::days(node["trash_retention_days"].as<unsigned int>(30));
        rhs.sweep_interval = std::chrono::minutes(node["sweep_interval_minutes"].as<unsigned int>(10));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["filedex"] = to_std_string(spdlog::level::to_string_view(rhs.filedex));
        node["db"]      = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["cache"]   = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["fs"]      = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["rbac"]    = to_std_string(spdlog::level::to_string_view(rhs.rbac));
        node["auth"]    = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.filedex = spdlog::level::from_str(node["filedex"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("error"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("warning"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warning"));
        rhs.rbac = spdlog::level::from_str(node["rbac"].as<std::string>("warning"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("warning"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warning"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warning"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/filedex");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
