#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ferry::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SSHConfig> {
    static Node encode(const SSHConfig& rhs) {
        Node node;
        node["connect_timeout"] = rhs.connect_timeout;
        node["server_alive_interval"] = rhs.server_alive_interval;
        node["server_alive_count_max"] = rhs.server_alive_count_max;
        node["options"] = rhs.options;
        return node;
    }

    static bool decode(const Node& node, SSHConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.connect_timeout = node["connect_timeout"].as<unsigned int>(30);
        rhs.server_alive_interval = node["server_alive_interval"].as<unsigned int>(60);
        rhs.server_alive_count_max = node["server_alive_count_max"].as<unsigned int>(3);
        rhs.options = node["options"].as<std::vector<std::string>>(std::vector<std::string>{});
        return true;
    }
};

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["destination"] = rhs.destination;
        node["ssh"] = rhs.ssh;
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("");
        rhs.destination = node["destination"].as<std::string>("");
        if (const auto ssh = node["ssh"]) rhs.ssh = ssh.as<SSHConfig>();
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["checksum"] = rhs.checksum;
        node["per_file"] = rhs.per_file;
        node["exhaustive_checksum"] = rhs.exhaustive_checksum;
        node["max_attempts"] = rhs.max_attempts;
        node["retry_base_delay"] = rhs.retry_base_delay;
        node["parallel_jobs"] = rhs.parallel_jobs;
        node["excludes"] = rhs.excludes;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.checksum = node["checksum"].as<bool>(true);
        rhs.per_file = node["per_file"].as<bool>(false);
        rhs.exhaustive_checksum = node["exhaustive_checksum"].as<bool>(false);
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(3);
        rhs.retry_base_delay = node["retry_base_delay"].as<unsigned int>(30);
        rhs.parallel_jobs = node["parallel_jobs"].as<unsigned int>(1);
        rhs.excludes = node["excludes"].as<std::vector<std::string>>(std::vector<std::string>{});
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["preserve_attributes"] = rhs.preserve_attributes;
        node["partial"] = rhs.partial;
        node["compress"] = rhs.compress;
        node["sparse"] = rhs.sparse;
        node["progress"] = rhs.progress;
        node["options"] = rhs.options;
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.preserve_attributes = node["preserve_attributes"].as<bool>(true);
        rhs.partial = node["partial"].as<bool>(true);
        rhs.compress = node["compress"].as<bool>(false);
        rhs.sparse = node["sparse"].as<bool>(true);
        rhs.progress = node["progress"].as<bool>(true);
        rhs.options = node["options"].as<std::vector<std::string>>(std::vector<std::string>{});
        return true;
    }
};

template<>
struct convert<PathsConfig> {
    static Node encode(const PathsConfig& rhs) {
        Node node;
        node["checksum_cache"] = rhs.checksum_cache.string();
        node["error_log"] = rhs.error_log.string();
        node["session_log"] = rhs.session_log.string();
        return node;
    }

    static bool decode(const Node& node, PathsConfig& rhs) {
        if (!node.IsMap()) return false;
        const PathsConfig def;
        rhs.checksum_cache = node["checksum_cache"].as<std::string>(def.checksum_cache.string());
        rhs.error_log = node["error_log"].as<std::string>(def.error_log.string());
        rhs.session_log = node["session_log"].as<std::string>(def.session_log.string());
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["ferry"]    = to_std_string(spdlog::level::to_string_view(rhs.ferry));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["cache"]    = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["remote"]   = to_std_string(spdlog::level::to_string_view(rhs.remote));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ferry = spdlog::level::from_str(node["ferry"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("warn"));
        rhs.remote = spdlog::level::from_str(node["remote"].as<std::string>("warn"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/ferry");
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}
