#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace ferry::config {

// Missing or invalid settings; the only error kind that halts a session.
struct ConfigurationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct SSHConfig {
    unsigned int connect_timeout = 30;
    unsigned int server_alive_interval = 60;
    unsigned int server_alive_count_max = 3;
    std::vector<std::string> options{};
};

struct RemoteConfig {
    std::string host;
    std::string destination;
    SSHConfig ssh;
};

struct SyncConfig {
    bool checksum = true;
    bool per_file = false;
    bool exhaustive_checksum = false;
    unsigned int max_attempts = 3;
    unsigned int retry_base_delay = 30; // seconds
    unsigned int parallel_jobs = 1;
    std::vector<std::string> excludes{};
};

struct TransferConfig {
    bool preserve_attributes = true;
    bool partial = true;
    bool compress = false;
    bool sparse = true;
    bool progress = true;
    std::vector<std::string> options{};
};

struct PathsConfig {
    std::filesystem::path checksum_cache = "/var/lib/ferry/checksums.db";
    std::filesystem::path error_log = "/tmp/ferry_errors.log";
    std::filesystem::path session_log = "/tmp/sync_nas.log";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum ferry    = spdlog::level::info;   // Session start/stop, summary
    spdlog::level::level_enum sync     = spdlog::level::info;   // Classification and retry decisions
    spdlog::level::level_enum cache    = spdlog::level::warn;   // Load/save problems only
    spdlog::level::level_enum remote   = spdlog::level::warn;   // ssh failures, unreachable host
    spdlog::level::level_enum transfer = spdlog::level::info;   // rsync invocations and exit codes
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/ferry";
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    RemoteConfig remote;
    std::vector<std::filesystem::path> sources;
    SyncConfig sync;
    TransferConfig transfer;
    PathsConfig paths;
    LoggingConfig logging;

    // Throws ConfigurationError when a required setting is missing.
    void validate() const;

    // "host:destination", the rsync target for whole-tree transfers.
    [[nodiscard]] std::string fullDestination() const;
};

Config loadConfig(const std::filesystem::path& path);

// Picks the YAML or dotenv loader from the file name, then validates.
Config loadConfigFile(const std::filesystem::path& path);

}
