#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::sync::model {

enum class Classification {
    New,              // no remote counterpart
    Identical,        // same size (and, in checksum mode, not reported changed by rsync)
    SizeMismatch,
    ChecksumMismatch  // same size, but rsync -c itemized a content change
};

[[nodiscard]] std::string to_string(Classification c);

struct ClassifiedFile {
    std::filesystem::path rel;
    std::filesystem::path local;
    std::string remote;
    uint64_t size{};
    int64_t mtime{};
    Classification classification{Classification::New};
    std::optional<std::string> fingerprint{};
};

struct ClassificationBuckets {
    std::vector<ClassifiedFile> transfer;
    std::vector<ClassifiedFile> identical;

    [[nodiscard]] bool empty() const { return transfer.empty() && identical.empty(); }
    [[nodiscard]] size_t total() const { return transfer.size() + identical.size(); }
};

}
