#pragma once

#include "config/Config.hpp"
#include "sync/model/SourceFolder.hpp"
#include "sync/model/Summary.hpp"
#include "sync/model/TransferTask.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

namespace ferry::remote {
class RemoteProbe;
}

namespace ferry::transfer {
class Executor;
}

namespace ferry::cache {
class ChecksumCache;
}

namespace ferry::concurrency {
struct Sleeper;
class ThreadPool;
}

namespace ferry::sync {

class Classifier;
class RetryDriver;

/*
 * One replication session:
 *   Init -> ValidateSources -> {Classify -> Transfer}* -> PersistCache -> Summarize -> Done
 *
 * The cache and the error log belong to the caller and outlive the session. Only a
 * ConfigurationError stops a session early; every other failure is recorded and the
 * next file or source is processed.
 */
class Orchestrator {
public:
    enum class Phase { Init, ValidateSources, Classify, Transfer, PersistCache, Summarize, Done };

    Orchestrator(config::Config cfg,
                 std::shared_ptr<remote::RemoteProbe> probe,
                 std::shared_ptr<transfer::Executor> executor,
                 std::shared_ptr<concurrency::Sleeper> sleeper,
                 cache::ChecksumCache& cache,
                 model::SessionErrorLog& errors);

    ~Orchestrator();

    // Throws config::ConfigurationError when no configured source exists.
    // May be called again; each call reports and logs only its own session.
    model::SessionSummary run();

    [[nodiscard]] Phase phase() const { return phase_; }

    // Existing sources; each missing one is recorded as SourceMissing.
    std::vector<model::SourceFolder> validateSources();

    void processSource(const model::SourceFolder& source);

    // One task under the retry budget; true once an attempt succeeds.
    bool transfer(const model::TransferTask& task);

private:
    void transferFiles(const model::SourceFolder& source, std::vector<model::ClassifiedFile> files);
    void resetSession();
    void persistCache();
    model::SessionSummary summarize();

    config::Config cfg_;
    std::shared_ptr<remote::RemoteProbe> probe_;
    std::shared_ptr<transfer::Executor> executor_;
    cache::ChecksumCache& cache_;
    model::SessionErrorLog& errors_;

    std::unique_ptr<Classifier> classifier_;
    std::unique_ptr<RetryDriver> retry_;
    std::unique_ptr<concurrency::ThreadPool> pool_;

    Phase phase_{Phase::Init};
    std::chrono::steady_clock::time_point started_{};
    size_t errorsBase_{}; // first error-log record of the current session

    size_t sourcesProcessed_{};
    std::atomic<size_t> filesTransferred_{}, filesIdentical_{}, filesFailed_{}, checksumMismatches_{};
    std::atomic<size_t> treesSynced_{}, treesFailed_{};
    std::atomic<uint64_t> bytesSent_{};
};

}
