#pragma once

#include "sync/model/Classification.hpp"
#include "sync/model/SourceFolder.hpp"

#include <memory>

namespace ferry::remote {
class RemoteProbe;
}

namespace ferry::cache {
class ChecksumCache;
}

namespace ferry::sync {

struct ClassifierOptions {
    bool checksum = false;
    // Size-matching files are still sent, with rsync verifying content.
    bool exhaustive = false;
};

/*
 * Partitions the regular files of a source tree into "needs transfer" and "already there".
 *
 * Remote presence and size come from the probe. In checksum mode the local fingerprint is
 * looked up (or computed and cached) for size-matching files, but the remote side is never
 * hashed: size equality is the proxy, and content verification is left to the transfer tool.
 */
class Classifier {
public:
    Classifier(std::shared_ptr<remote::RemoteProbe> probe, cache::ChecksumCache& cache, ClassifierOptions options);

    // Throws std::filesystem::filesystem_error if the source root cannot be walked.
    [[nodiscard]] model::ClassificationBuckets classify(const model::SourceFolder& source) const;

    [[nodiscard]] model::ClassifiedFile classifyFile(const model::SourceFolder& source,
                                                     const std::filesystem::path& rel) const;

    // Cached fingerprint if still valid for mtime, otherwise computed and cached.
    std::string fingerprint(const std::filesystem::path& local, int64_t mtime) const;

private:
    std::shared_ptr<remote::RemoteProbe> probe_;
    cache::ChecksumCache& cache_;
    ClassifierOptions options_;
};

}
