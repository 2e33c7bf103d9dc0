#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fdx::config {

std::string to_string(const StoreBackend backend) {
    switch (backend) {
        case StoreBackend::Postgres: return "postgres";
        case StoreBackend::Memory: return "memory";
    }
    throw std::invalid_argument("Unknown store backend");
}

StoreBackend storeBackendFromString(const std::string& str) {
    if (str == "postgres") return StoreBackend::Postgres;
    if (str == "memory") return StoreBackend::Memory;
    throw std::invalid_argument("Unknown store backend: " + str);
}

std::string DatabaseConfig::resolvePassword() const {
    if (const char* env = std::getenv("FILEDEX_DB_PASSWORD"); env && *env) return {env};
    return password;
}

std::string DatabaseConfig::connectionString() const {
    std::string conn = "host=" + host + " port=" + std::to_string(port) + " dbname=" + name + " user=" + user;
    if (const auto pass = resolvePassword(); !pass.empty()) conn += " password=" + pass;
    return conn;
}

namespace {

// Absent sections keep their defaults; a present one must be a map.
template <typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::invalid_argument("config section '" + key + "' must be a map");
}

}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    decodeSection(root, "database", cfg.database);
    decodeSection(root, "caching", cfg.caching);
    decodeSection(root, "auth", cfg.auth);
    decodeSection(root, "storage", cfg.storage);
    decodeSection(root, "auditing", cfg.auditing);
    decodeSection(root, "logging", cfg.logging);

    if (cfg.auth.default_session_ttl > cfg.auth.session_max_ttl)
        throw std::invalid_argument("auth.default_session_ttl_days exceeds auth.session_max_ttl_days");

    return cfg;
}

}
