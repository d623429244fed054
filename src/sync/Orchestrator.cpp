#include "sync/Orchestrator.hpp"
#include "sync/Classifier.hpp"
#include "sync/RetryDriver.hpp"
#include "sync/tasks/Transfer.hpp"
#include "sync/model/ScopedOp.hpp"
#include "cache/ChecksumCache.hpp"
#include "concurrency/Sleeper.hpp"
#include "concurrency/ThreadPool.hpp"
#include "remote/RemoteProbe.hpp"
#include "transfer/Executor.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <future>
#include <fmt/core.h>

using namespace ferry::sync;
using namespace ferry::sync::model;
using namespace ferry::logging;
using namespace ferry::config;
using namespace std::chrono;

namespace fs = std::filesystem;

Orchestrator::Orchestrator(Config cfg,
                           std::shared_ptr<remote::RemoteProbe> probe,
                           std::shared_ptr<transfer::Executor> executor,
                           std::shared_ptr<concurrency::Sleeper> sleeper,
                           cache::ChecksumCache& cache,
                           SessionErrorLog& errors)
    : cfg_(std::move(cfg)),
      probe_(std::move(probe)),
      executor_(std::move(executor)),
      cache_(cache),
      errors_(errors),
      classifier_(std::make_unique<Classifier>(probe_, cache_, ClassifierOptions{
          .checksum = cfg_.sync.checksum,
          .exhaustive = cfg_.sync.exhaustive_checksum})),
      retry_(std::make_unique<RetryDriver>(std::move(sleeper), seconds(cfg_.sync.retry_base_delay))) {
    if (!executor_) throw std::invalid_argument("Orchestrator requires a transfer executor");
    cfg_.sync.max_attempts = std::max(1u, cfg_.sync.max_attempts);
}

Orchestrator::~Orchestrator() {
    if (pool_) pool_->stop();
}

void Orchestrator::resetSession() {
    started_ = steady_clock::now();
    errorsBase_ = errors_.size();
    sourcesProcessed_ = 0;
    filesTransferred_ = 0;
    filesIdentical_ = 0;
    filesFailed_ = 0;
    checksumMismatches_ = 0;
    treesSynced_ = 0;
    treesFailed_ = 0;
    bytesSent_ = 0;
}

SessionSummary Orchestrator::run() {
    phase_ = Phase::Init;
    resetSession();

    LogRegistry::session()->info("Synchronization started");
    LogRegistry::ferry()->info("[Orchestrator] Starting session: {} source(s) to {}",
                               cfg_.sources.size(), cfg_.fullDestination());

    const auto loaded = cache_.load(cfg_.paths.checksum_cache);
    LogRegistry::cache()->info("[Orchestrator] Loaded {} checksum cache entries", loaded);

    phase_ = Phase::ValidateSources;
    const auto sources = validateSources();
    if (sources.empty()) {
        try {
            errors_.writeTo(cfg_.paths.error_log, errorsBase_);
        } catch (const std::exception& e) {
            LogRegistry::ferry()->error("[Orchestrator] Could not write error log: {}", e.what());
        }
        LogRegistry::session()->info("Synchronization aborted: no valid source directory");
        throw ConfigurationError("None of the configured source directories exist");
    }

    for (const auto& source : sources) processSource(source);

    persistCache();
    return summarize();
}

std::vector<SourceFolder> Orchestrator::validateSources() {
    std::vector<SourceFolder> valid;
    valid.reserve(cfg_.sources.size());

    for (const auto& source : cfg_.sources) {
        std::error_code ec;
        if (!fs::is_directory(source, ec)) {
            LogRegistry::sync()->error("[Orchestrator] Source directory {} does not exist, skipping", source.string());
            errors_.append(ErrorKind::SourceMissing, source.string());
            continue;
        }
        valid.push_back(SourceFolder::under(source, cfg_.remote.destination));
    }

    return valid;
}

void Orchestrator::processSource(const SourceFolder& source) {
    LogRegistry::sync()->info("[Orchestrator] Synchronizing {} to {}:{}",
                              source.local.string(), cfg_.remote.host, source.remote_prefix);

    if (!cfg_.sync.per_file) {
        phase_ = Phase::Transfer;
        transfer(TransferTask::forTree(source, cfg_.fullDestination()));
        ++sourcesProcessed_;
        return;
    }

    phase_ = Phase::Classify;
    ClassificationBuckets buckets;
    try {
        buckets = classifier_->classify(source);
    } catch (const std::exception& e) {
        LogRegistry::sync()->error("[Orchestrator] Could not classify {}: {}", source.local.string(), e.what());
        errors_.append(ErrorKind::SyncFailed, source.local.string());
        return;
    }

    filesIdentical_ += buckets.identical.size();

    phase_ = Phase::Transfer;
    transferFiles(source, std::move(buckets.transfer));
    ++sourcesProcessed_;
}

void Orchestrator::transferFiles(const SourceFolder& source, std::vector<ClassifiedFile> files) {
    if (cfg_.sync.parallel_jobs <= 1 || files.size() <= 1) {
        for (auto& file : files) transfer(TransferTask::forFile(source, std::move(file)));
        return;
    }

    if (!pool_) pool_ = std::make_unique<concurrency::ThreadPool>(cfg_.sync.parallel_jobs);

    std::vector<std::future<bool>> futures;
    futures.reserve(files.size());

    for (auto& file : files) {
        auto task = std::make_shared<tasks::Transfer>(*this, TransferTask::forFile(source, std::move(file)));
        futures.push_back(*task->getFuture());
        pool_->submit(task);
    }

    // Barrier: every file of this source settles before the next source starts
    for (auto& f : futures) f.wait();
}

bool Orchestrator::transfer(const TransferTask& task) {
    const auto subject = task.subject();
    const bool isFile = task.kind == TransferKind::File;
    const auto failKind = isFile ? ErrorKind::TransferFailed : ErrorKind::SyncFailed;

    ScopedOp op;
    op.start(isFile ? task.file.size : 0);

    bool contentChanged = false;
    const auto state = retry_->execute(
        [&](const unsigned int attempt) {
            LogRegistry::sync()->info("[Orchestrator] Attempt {}/{} for {}", attempt, cfg_.sync.max_attempts, subject);
            const auto result = executor_->run(task);
            if (result.success) contentChanged = result.changedAny();
            return result.success;
        },
        cfg_.sync.max_attempts,
        [&](const unsigned int attempt) {
            LogRegistry::sync()->warn("[Orchestrator] Attempt {} failed for {}", attempt, subject);
            errors_.append(failKind, subject);
        });

    op.stop();
    op.success = state.succeeded();

    if (!op.success) {
        LogRegistry::sync()->error("[Orchestrator] Giving up on {} after {} attempt(s)", subject, state.attempt);
        errors_.append(ErrorKind::Critical, subject);
        if (isFile) ++filesFailed_;
        else ++treesFailed_;
        return false;
    }

    if (!isFile) {
        LogRegistry::sync()->info("[Orchestrator] Synchronized {} in {} ms", subject, op.duration_ms());
        ++treesSynced_;
        return true;
    }

    // Same-size files only reach the transfer bucket in exhaustive checksum mode
    if (task.file.classification == Classification::Identical) {
        if (contentChanged) {
            LogRegistry::sync()->info("[Orchestrator] {} -> {}", subject, to_string(Classification::ChecksumMismatch));
            ++checksumMismatches_;
            ++filesTransferred_;
            bytesSent_ += op.size_bytes;
        } else {
            ++filesIdentical_;
        }
        return true;
    }

    ++filesTransferred_;
    bytesSent_ += op.size_bytes;
    return true;
}

void Orchestrator::persistCache() {
    phase_ = Phase::PersistCache;
    try {
        cache_.save(cfg_.paths.checksum_cache);
        LogRegistry::cache()->info("[Orchestrator] Saved {} checksum cache entries to {}",
                                   cache_.size(), cfg_.paths.checksum_cache.string());
    } catch (const std::exception& e) {
        LogRegistry::cache()->error("[Orchestrator] Failed to save checksum cache: {}", e.what());
    }
}

SessionSummary Orchestrator::summarize() {
    phase_ = Phase::Summarize;

    SessionSummary s;
    s.sources_configured = cfg_.sources.size();
    s.sources_processed = sourcesProcessed_;
    s.files_transferred = filesTransferred_;
    s.files_identical = filesIdentical_;
    s.files_failed = filesFailed_;
    s.checksum_mismatches = checksumMismatches_;
    s.trees_synced = treesSynced_;
    s.trees_failed = treesFailed_;
    s.bytes_sent = bytesSent_;
    s.duration_ms = duration_cast<milliseconds>(steady_clock::now() - started_).count();
    s.errors = errors_.countsByKind(errorsBase_);
    s.error_log = cfg_.paths.error_log;
    s.session_log = cfg_.paths.session_log;

    try {
        errors_.writeTo(cfg_.paths.error_log, errorsBase_);
    } catch (const std::exception& e) {
        LogRegistry::ferry()->error("[Orchestrator] Could not write error log: {}", e.what());
    }

    LogRegistry::session()->info("Synchronization finished: {}", s.outcome());
    phase_ = Phase::Done;
    return s;
}
