#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace ferry::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels. The session logger appends to sessionLog.
    static void init(const config::LoggingConfig& cnf, const std::filesystem::path& sessionLog);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> ferry()    { return get("ferry"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> cache()    { return get("cache"); }
    static std::shared_ptr<spdlog::logger> remote()   { return get("remote"); }
    static std::shared_ptr<spdlog::logger> transfer() { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> session()  { return get("session"); }

    [[nodiscard]] static bool isInitialized();

    // Drops every registered logger; used between test fixtures.
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* SESSION_FORMAT = "%Y/%m/%d %H:%M:%S [ferry] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt> session_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
