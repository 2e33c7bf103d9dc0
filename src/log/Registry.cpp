#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>

namespace fdx::log {

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_  = log_dir_ / "filedex.log";
    audit_log_path_ = log_dir_ / "audit.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("filedex", sub_levels.filedex);
    makeLogger("db",      sub_levels.db);
    makeLogger("cache",   sub_levels.cache);
    makeLogger("fs",      sub_levels.fs);
    makeLogger("rbac",    sub_levels.rbac);
    makeLogger("auth",    sub_levels.auth);
    makeLogger("storage", sub_levels.storage);

    // audit: file-only sink (append)
    {
        audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            audit_log_path_.string(), /*truncate=*/false);
        audit_file_sink_->set_pattern(AUDIT_FORMAT);
        const auto logger = std::make_shared<spdlog::logger>("audit", audit_file_sink_);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    filedex()->info("[log::Registry] Initialized, writing to {}", log_dir_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
