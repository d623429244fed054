#pragma once

#include "sync/model/RetryState.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace ferry::concurrency {
struct Sleeper;
}

namespace ferry::sync {

/*
 * Bounded retries with linear backoff: after failed attempt n (n < max) the driver waits
 * n * baseDelay before attempt n+1. Nothing is waited after the last attempt.
 * Each task gets an independent budget.
 */
class RetryDriver {
public:
    // Returns true on success. The attempt number is 1-indexed.
    using Attempt = std::function<bool(unsigned int attempt)>;
    using FailureHook = std::function<void(unsigned int attempt)>;

    RetryDriver(std::shared_ptr<concurrency::Sleeper> sleeper, std::chrono::seconds baseDelay);

    // An attempt that throws counts as a failure. maxAttempts below 1 is treated as 1.
    model::RetryState execute(const Attempt& attempt, unsigned int maxAttempts,
                              const FailureHook& onFailure = {}) const;

    [[nodiscard]] std::chrono::seconds waitAfter(unsigned int failedAttempt) const;
    [[nodiscard]] std::chrono::seconds baseDelay() const { return baseDelay_; }

private:
    std::shared_ptr<concurrency::Sleeper> sleeper_;
    std::chrono::seconds baseDelay_;
};

}
