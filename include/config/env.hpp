#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace ferry::config::env {

// KEY=VALUE pairs; '#' comments, blank lines, "export " prefixes and matching quotes are stripped.
std::map<std::string, std::string> parse(const std::string& content);

// SOURCE_<n> values ordered by n as an integer (SOURCE_2 before SOURCE_10).
std::vector<std::filesystem::path> orderedSources(const std::map<std::string, std::string>& vars);

// Overlays NAS_HOST, DESTINATION, SOURCE_<n>, MAX_ATTEMPTS, RSYNC_EXTRA_OPTS, USE_CHECKSUM,
// PARALLEL_JOBS and CHECKSUM_CACHE on top of the defaults.
Config toConfig(const std::map<std::string, std::string>& vars);

Config load(const std::filesystem::path& path);

}
