#include "logging/LogRegistry.hpp"

#include <stdexcept>

namespace ferry::logging {

void LogRegistry::init(const config::LoggingConfig& cnf, const std::filesystem::path& sessionLog) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);
    if (sessionLog.has_parent_path() && !fs::exists(sessionLog.parent_path()))
        fs::create_directories(sessionLog.parent_path());

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (cnf.log_dir / "ferry.log").string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.subsystem_levels;
    makeLogger("ferry",    sub_levels.ferry);
    makeLogger("sync",     sub_levels.sync);
    makeLogger("cache",    sub_levels.cache);
    makeLogger("remote",   sub_levels.remote);
    makeLogger("transfer", sub_levels.transfer);

    // session: shares the file rsync writes with --log-file (append)
    {
        session_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            sessionLog.string(), /*truncate=*/false);
        session_file_sink_->set_pattern(SESSION_FORMAT);
        const auto logger = std::make_shared<spdlog::logger>("session", session_file_sink_);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    ferry()->debug("[LogRegistry] Initialized, logs in {}", cnf.log_dir.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    session_file_sink_.reset();
    initialized_ = false;
}

}
