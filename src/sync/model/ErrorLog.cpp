#include "sync/model/ErrorLog.hpp"

#include <fstream>
#include <stdexcept>
#include <fmt/core.h>
#include <fmt/chrono.h>

namespace ferry::sync::model {

std::string to_string(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TransferFailed: return "TRANSFER_FAILED";
    case ErrorKind::SyncFailed: return "SYNC_FAILED";
    case ErrorKind::Critical: return "CRITICAL";
    case ErrorKind::SourceMissing: return "SOURCE_MISSING";
    }
    return "UNKNOWN";
}

std::string ErrorRecord::format() const {
    return fmt::format("[{:%Y-%m-%d %H:%M:%S}] {} {}", fmt::localtime(timestamp), to_string(kind), subject);
}

void SessionErrorLog::append(const ErrorKind kind, const std::string& subject) {
    std::scoped_lock lock(mutex_);
    records_.push_back({std::time(nullptr), subject, kind});
}

std::vector<ErrorRecord> SessionErrorLog::records(const size_t from) const {
    std::scoped_lock lock(mutex_);
    if (from >= records_.size()) return {};
    return {records_.begin() + static_cast<std::ptrdiff_t>(from), records_.end()};
}

std::map<ErrorKind, size_t> SessionErrorLog::countsByKind(const size_t from) const {
    std::map<ErrorKind, size_t> counts;
    for (const auto& r : records(from)) ++counts[r.kind];
    return counts;
}

size_t SessionErrorLog::count(const ErrorKind kind) const {
    std::scoped_lock lock(mutex_);
    size_t n = 0;
    for (const auto& r : records_)
        if (r.kind == kind) ++n;
    return n;
}

size_t SessionErrorLog::size() const {
    std::scoped_lock lock(mutex_);
    return records_.size();
}

bool SessionErrorLog::empty() const { return size() == 0; }

void SessionErrorLog::writeTo(const std::filesystem::path& path, const size_t from) const {
    const auto snapshot = records(from);
    if (snapshot.empty()) return;

    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path()))
        std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::app);
    if (!out) throw std::runtime_error("Failed to open error log: " + path.string());

    for (const auto& r : snapshot) out << r.format() << '\n';
    if (!out) throw std::runtime_error("Failed to write error log: " + path.string());
}

}
