#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/env.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/core.h>

namespace ferry::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(fmt::format("Failed to read configuration {}: {}", path.string(), e.what()));
    }

    try {
        if (auto node = root["remote"]) YAML::convert<RemoteConfig>::decode(node, cfg.remote);
        if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
        if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
        if (auto node = root["paths"]) YAML::convert<PathsConfig>::decode(node, cfg.paths);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
        if (auto node = root["sources"])
            for (const auto& s : node) cfg.sources.emplace_back(s.as<std::string>());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(fmt::format("Invalid configuration {}: {}", path.string(), e.what()));
    }

    return cfg;
}

Config loadConfigFile(const std::filesystem::path& path) {
    const auto ext = path.extension();
    Config cfg = ext == ".yaml" || ext == ".yml" ? loadConfig(path) : env::load(path);
    cfg.validate();
    return cfg;
}

void Config::validate() const {
    if (remote.host.empty() || remote.destination.empty())
        throw ConfigurationError("Missing required settings: remote host and destination must both be set");
    if (sources.empty())
        throw ConfigurationError("No source directories configured");
}

std::string Config::fullDestination() const {
    return remote.host + ":" + remote.destination;
}

}
