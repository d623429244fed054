#include "cache/ChecksumCache.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <mutex>
#include <vector>
#include <fmt/core.h>

using namespace ferry::cache;
using namespace ferry::logging;

ChecksumMap ChecksumCache::read(const std::filesystem::path& path) {
    ChecksumMap map;

    std::ifstream in(path);
    if (!in) {
        LogRegistry::cache()->debug("[ChecksumCache] No cache at {}, starting empty", path.string());
        return map;
    }

    size_t lineNo = 0, skipped = 0;
    for (std::string line; std::getline(in, line);) {
        ++lineNo;
        if (line.empty()) continue;
        if (auto record = parseLine(line)) {
            map.insert_or_assign(std::move(record->first), std::move(record->second));
        } else {
            ++skipped;
            LogRegistry::cache()->debug("[ChecksumCache] Skipping malformed line {} in {}", lineNo, path.string());
        }
    }

    if (skipped) LogRegistry::cache()->warn("[ChecksumCache] Skipped {} malformed line(s) in {}", skipped, path.string());
    return map;
}

size_t ChecksumCache::load(const std::filesystem::path& path) {
    auto map = read(path);
    std::unique_lock lock(mutex_);
    entries_ = std::move(map);
    return entries_.size();
}

std::optional<std::string> ChecksumCache::lookup(const std::string& path, const int64_t currentMtime) const {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(path);
    if (it == entries_.end() || it->second.mtime != currentMtime) return std::nullopt;
    return it->second.fingerprint;
}

void ChecksumCache::update(const std::string& path, const std::string& fingerprint, const int64_t mtime) {
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(path, ChecksumCacheEntry{fingerprint, mtime});
}

void ChecksumCache::save(const std::filesystem::path& path) const {
    std::vector<std::pair<std::string, ChecksumCacheEntry>> sorted;
    {
        std::shared_lock lock(mutex_);
        sorted.assign(entries_.begin(), entries_.end());
    }
    std::ranges::sort(sorted, {}, &std::pair<std::string, ChecksumCacheEntry>::first);

    std::string content;
    for (const auto& [p, entry] : sorted) {
        // A newline in the path would split the record on reload
        if (p.find('\n') != std::string::npos) continue;
        content += formatLine(p, entry);
        content += '\n';
    }

    util::writeFileAtomic(path, content);
    LogRegistry::cache()->debug("[ChecksumCache] Saved {} entries to {}", sorted.size(), path.string());
}

size_t ChecksumCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

ChecksumMap ChecksumCache::snapshot() const {
    std::shared_lock lock(mutex_);
    return entries_;
}

std::optional<std::pair<std::string, ChecksumCacheEntry>> ChecksumCache::parseLine(const std::string& line) {
    std::string_view sv(line);
    if (!sv.empty() && sv.back() == '\r') sv.remove_suffix(1);

    const auto last = sv.rfind('|');
    if (last == std::string_view::npos || last == 0) return std::nullopt;
    const auto mid = sv.rfind('|', last - 1);
    if (mid == std::string_view::npos || mid == 0) return std::nullopt;

    const auto path = sv.substr(0, mid);
    const auto fingerprint = sv.substr(mid + 1, last - mid - 1);
    const auto mtimeStr = sv.substr(last + 1);
    if (fingerprint.empty() || mtimeStr.empty()) return std::nullopt;

    int64_t mtime = 0;
    const auto [ptr, ec] = std::from_chars(mtimeStr.data(), mtimeStr.data() + mtimeStr.size(), mtime);
    if (ec != std::errc() || ptr != mtimeStr.data() + mtimeStr.size()) return std::nullopt;

    return std::make_pair(std::string(path), ChecksumCacheEntry{std::string(fingerprint), mtime});
}

std::string ChecksumCache::formatLine(const std::string& path, const ChecksumCacheEntry& entry) {
    return fmt::format("{}|{}|{}", path, entry.fingerprint, entry.mtime);
}
