#pragma once

#include "sync/model/ErrorLog.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace ferry::sync::model {

struct SessionSummary {
    size_t sources_configured{};
    size_t sources_processed{};
    size_t files_transferred{};
    size_t files_identical{};
    size_t files_failed{};
    size_t checksum_mismatches{};
    size_t trees_synced{};
    size_t trees_failed{};
    uint64_t bytes_sent{};
    uint64_t duration_ms{};
    std::map<ErrorKind, size_t> errors{};
    std::filesystem::path error_log{};
    std::filesystem::path session_log{};

    // No error record at all; anything else is "completed with errors", not a failure.
    [[nodiscard]] bool clean() const { return errors.empty(); }
    [[nodiscard]] size_t errorCount() const;
    [[nodiscard]] std::string outcome() const;

    // Human-readable report, one line per entry.
    [[nodiscard]] std::vector<std::string> lines() const;
};

}
