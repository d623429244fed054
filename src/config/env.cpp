#include "config/env.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <fmt/core.h>

namespace ferry::config::env {

namespace {

constexpr std::string_view SOURCE_PREFIX = "SOURCE_";

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front())
        return s.substr(1, s.size() - 2);
    return s;
}

template <typename T>
bool parseNumber(const std::string& s, T& out) {
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

unsigned int getUnsigned(const std::map<std::string, std::string>& vars, const std::string& key, const unsigned int def) {
    const auto it = vars.find(key);
    if (it == vars.end() || it->second.empty()) return def;
    unsigned int value = 0;
    if (!parseNumber(it->second, value))
        throw ConfigurationError(fmt::format("{} must be a non-negative integer, got '{}'", key, it->second));
    return value;
}

bool getBool(const std::map<std::string, std::string>& vars, const std::string& key, const bool def) {
    const auto it = vars.find(key);
    if (it == vars.end() || it->second.empty()) return def;
    std::string v = it->second;
    std::ranges::transform(v, v.begin(), [](const unsigned char c) { return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigurationError(fmt::format("{} must be a boolean, got '{}'", key, it->second));
}

std::vector<std::string> splitWhitespace(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    for (std::string tok; in >> tok;) out.push_back(tok);
    return out;
}

}

std::map<std::string, std::string> parse(const std::string& content) {
    std::map<std::string, std::string> vars;
    std::istringstream in(content);

    for (std::string line; std::getline(in, line);) {
        line = trim(line);
        if (line.empty() || line.front() == '#') continue;
        if (line.starts_with("export ")) line = trim(line.substr(7));

        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;

        const auto key = trim(line.substr(0, eq));
        vars[key] = unquote(trim(line.substr(eq + 1)));
    }

    return vars;
}

std::vector<std::filesystem::path> orderedSources(const std::map<std::string, std::string>& vars) {
    std::vector<std::pair<unsigned long, std::string>> numbered;

    for (const auto& [key, value] : vars) {
        if (!key.starts_with(SOURCE_PREFIX)) continue;
        unsigned long n = 0;
        if (!parseNumber(key.substr(SOURCE_PREFIX.size()), n)) continue;
        if (value.empty()) continue;
        numbered.emplace_back(n, value);
    }

    std::ranges::stable_sort(numbered, {}, &std::pair<unsigned long, std::string>::first);

    std::vector<std::filesystem::path> sources;
    sources.reserve(numbered.size());
    for (const auto& [_, value] : numbered) sources.emplace_back(value);
    return sources;
}

Config toConfig(const std::map<std::string, std::string>& vars) {
    Config cfg;

    if (const auto it = vars.find("NAS_HOST"); it != vars.end()) cfg.remote.host = it->second;
    if (const auto it = vars.find("DESTINATION"); it != vars.end()) cfg.remote.destination = it->second;
    if (const auto it = vars.find("CHECKSUM_CACHE"); it != vars.end() && !it->second.empty())
        cfg.paths.checksum_cache = it->second;
    if (const auto it = vars.find("RSYNC_EXTRA_OPTS"); it != vars.end())
        cfg.transfer.options = splitWhitespace(it->second);

    cfg.sources = orderedSources(vars);
    cfg.sync.max_attempts = getUnsigned(vars, "MAX_ATTEMPTS", cfg.sync.max_attempts);
    cfg.sync.parallel_jobs = getUnsigned(vars, "PARALLEL_JOBS", cfg.sync.parallel_jobs);
    cfg.sync.checksum = getBool(vars, "USE_CHECKSUM", cfg.sync.checksum);

    return cfg;
}

Config load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError(fmt::format("Configuration file {} does not exist", path.string()));

    std::stringstream buffer;
    buffer << in.rdbuf();
    return toConfig(parse(buffer.str()));
}

}
