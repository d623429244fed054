#include "sync/Classifier.hpp"
#include "remote/RemoteProbe.hpp"
#include "cache/ChecksumCache.hpp"
#include "crypto/util/hash.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <stdexcept>

using namespace ferry::sync;
using namespace ferry::sync::model;
using namespace ferry::logging;

namespace fs = std::filesystem;

Classifier::Classifier(std::shared_ptr<remote::RemoteProbe> probe, cache::ChecksumCache& cache,
                       const ClassifierOptions options)
    : probe_(std::move(probe)), cache_(cache), options_(options) {
    if (!probe_) throw std::invalid_argument("Classifier requires a remote probe");
}

ClassificationBuckets Classifier::classify(const SourceFolder& source) const {
    std::vector<fs::path> rels;
    for (const auto& entry : fs::recursive_directory_iterator(source.local, fs::directory_options::skip_permission_denied)) {
        if (!entry.is_regular_file()) continue;
        rels.push_back(entry.path().lexically_relative(source.local));
    }
    std::ranges::sort(rels);

    ClassificationBuckets buckets;
    for (const auto& rel : rels) {
        ClassifiedFile file;
        try {
            file = classifyFile(source, rel);
        } catch (const std::exception& e) {
            // Vanished or unreadable locally; let the transfer attempt report it
            LogRegistry::sync()->warn("[Classifier] Could not inspect {}: {}", (source.local / rel).string(), e.what());
            file.rel = rel;
            file.local = source.local / rel;
            file.remote = source.remotePathFor(rel);
            file.classification = Classification::New;
        }

        LogRegistry::sync()->debug("[Classifier] {} -> {}", file.rel.generic_string(), to_string(file.classification));

        const bool send = file.classification != Classification::Identical ||
                          (options_.checksum && options_.exhaustive);
        if (send) buckets.transfer.push_back(std::move(file));
        else buckets.identical.push_back(std::move(file));
    }

    LogRegistry::sync()->info("[Classifier] {}: {} file(s) to transfer, {} already synchronized",
                              source.local.string(), buckets.transfer.size(), buckets.identical.size());
    return buckets;
}

ClassifiedFile Classifier::classifyFile(const SourceFolder& source, const fs::path& rel) const {
    ClassifiedFile file;
    file.rel = rel;
    file.local = source.local / rel;
    file.remote = source.remotePathFor(rel);
    file.size = fs::file_size(file.local);
    file.mtime = util::mtimeSeconds(file.local);

    if (!probe_->exists(file.remote)) {
        file.classification = Classification::New;
        return file;
    }

    const auto remoteSize = probe_->stat(file.remote).value_or(remote::RemoteStat{}).size;
    if (remoteSize != file.size) {
        file.classification = Classification::SizeMismatch;
        return file;
    }

    if (options_.checksum) {
        try {
            file.fingerprint = fingerprint(file.local, file.mtime);
        } catch (const std::exception& e) {
            LogRegistry::sync()->warn("[Classifier] Fingerprint failed for {}: {}", file.local.string(), e.what());
        }
    }

    file.classification = Classification::Identical;
    return file;
}

std::string Classifier::fingerprint(const fs::path& local, const int64_t mtime) const {
    const auto key = local.string();
    if (auto cached = cache_.lookup(key, mtime)) return *cached;

    auto fp = crypto::hash::blake2b(local);
    cache_.update(key, fp, mtime);
    return fp;
}
