#include "sync/model/Summary.hpp"

#include <fmt/core.h>

using namespace ferry::sync::model;

size_t SessionSummary::errorCount() const {
    size_t n = 0;
    for (const auto& [_, count] : errors) n += count;
    return n;
}

std::string SessionSummary::outcome() const {
    return clean() ? "success" : "completed with errors";
}

std::vector<std::string> SessionSummary::lines() const {
    std::vector<std::string> out;
    out.push_back(fmt::format("Synchronization {}", outcome()));
    out.push_back(fmt::format("Sources: {} processed of {} configured", sources_processed, sources_configured));

    if (trees_synced || trees_failed)
        out.push_back(fmt::format("Trees: {} synced, {} failed", trees_synced, trees_failed));
    if (files_transferred || files_identical || files_failed)
        out.push_back(fmt::format("Files: {} transferred ({} bytes), {} identical, {} failed",
                                  files_transferred, bytes_sent, files_identical, files_failed));
    if (checksum_mismatches)
        out.push_back(fmt::format("Content changed at equal size: {}", checksum_mismatches));

    for (const auto& [kind, count] : errors)
        out.push_back(fmt::format("{}: {}", to_string(kind), count));

    if (!clean() && !error_log.empty()) out.push_back("Errors recorded in: " + error_log.string());
    if (!session_log.empty()) out.push_back("Log available in: " + session_log.string());
    return out;
}
