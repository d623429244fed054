#pragma once

#include <ctime>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ferry::sync::model {

enum class ErrorKind {
    TransferFailed,  // one per-file attempt failed
    SyncFailed,      // one whole-tree attempt failed
    Critical,        // a task exhausted its retry budget
    SourceMissing    // a configured source does not exist locally
};

[[nodiscard]] std::string to_string(ErrorKind kind);

struct ErrorRecord {
    std::time_t timestamp{};
    std::string subject;
    ErrorKind kind{ErrorKind::TransferFailed};

    // "[YYYY-MM-DD HH:MM:SS] KIND subject"
    [[nodiscard]] std::string format() const;
};

/*
 * Ordered, append-only record of everything that went wrong in a session.
 * Owned by the session and shared by reference with workers; appends are serialized.
 */
class SessionErrorLog {
public:
    void append(ErrorKind kind, const std::string& subject);

    // Records from index `from` on; sessions sharing one log pass their starting size().
    [[nodiscard]] std::vector<ErrorRecord> records(size_t from = 0) const;
    [[nodiscard]] std::map<ErrorKind, size_t> countsByKind(size_t from = 0) const;
    [[nodiscard]] size_t count(ErrorKind kind) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    // Appends records from index `from` on to path, one line each. Throws if the file cannot be written.
    void writeTo(const std::filesystem::path& path, size_t from = 0) const;

private:
    mutable std::mutex mutex_;
    std::vector<ErrorRecord> records_;
};

}
