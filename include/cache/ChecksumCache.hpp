#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ferry::cache {

struct ChecksumCacheEntry {
    std::string fingerprint;
    int64_t mtime{}; // seconds since epoch the fingerprint was computed against

    friend bool operator==(const ChecksumCacheEntry&, const ChecksumCacheEntry&) = default;
};

// Keyed by absolute local path. Last write wins.
using ChecksumMap = std::unordered_map<std::string, ChecksumCacheEntry>;

/*
 * Persisted fingerprint cache, one "path|fingerprint|mtime" record per line.
 * Loaded once at session start, rewritten in full once at session end.
 * Safe to share between transfer workers.
 */
class ChecksumCache {
public:
    ChecksumCache() = default;

    // Absent file yields an empty map; malformed lines are skipped.
    static ChecksumMap read(const std::filesystem::path& path);

    // Replaces the in-memory mapping with the persisted one; returns the number of entries loaded.
    size_t load(const std::filesystem::path& path);

    // Fingerprint for path, only if it was computed against currentMtime.
    [[nodiscard]] std::optional<std::string> lookup(const std::string& path, int64_t currentMtime) const;

    void update(const std::string& path, const std::string& fingerprint, int64_t mtime);

    // Atomic full rewrite: temp file then rename.
    void save(const std::filesystem::path& path) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] ChecksumMap snapshot() const;

    // Parses one record; nullopt when malformed. Paths may contain '|', so the last two separators split.
    static std::optional<std::pair<std::string, ChecksumCacheEntry>> parseLine(const std::string& line);
    static std::string formatLine(const std::string& path, const ChecksumCacheEntry& entry);

private:
    mutable std::shared_mutex mutex_;
    ChecksumMap entries_;
};

}
