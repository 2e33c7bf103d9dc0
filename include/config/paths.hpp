#pragma once

#include <cstdlib>
#include <filesystem>

namespace fdx::paths {

inline constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/filedex/config.yaml";
inline constexpr const auto* CONFIG_PATH_ENV = "FILEDEX_CONFIG";

inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv(CONFIG_PATH_ENV); env && *env) return {env};
    return {DEFAULT_CONFIG_PATH};
}

}
