#include "sync/RetryDriver.hpp"
#include "concurrency/Sleeper.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace ferry::sync;
using namespace ferry::sync::model;
using namespace ferry::logging;

RetryDriver::RetryDriver(std::shared_ptr<concurrency::Sleeper> sleeper, const std::chrono::seconds baseDelay)
    : sleeper_(std::move(sleeper)), baseDelay_(baseDelay) {
    if (!sleeper_) throw std::invalid_argument("RetryDriver requires a sleeper");
}

std::chrono::seconds RetryDriver::waitAfter(const unsigned int failedAttempt) const {
    return baseDelay_ * failedAttempt;
}

RetryState RetryDriver::execute(const Attempt& attempt, const unsigned int maxAttempts,
                                const FailureHook& onFailure) const {
    RetryState state;
    state.max_attempts = std::max(1u, maxAttempts);
    state.phase = RetryState::Phase::Attempting;
    state.attempt = 1;

    while (!state.done()) {
        bool ok = false;
        try {
            ok = attempt(state.attempt);
        } catch (const std::exception& e) {
            LogRegistry::sync()->error("[RetryDriver] Attempt {}/{} threw: {}", state.attempt, state.max_attempts, e.what());
        }

        if (ok) {
            state.phase = RetryState::Phase::Succeeded;
            break;
        }

        if (onFailure) onFailure(state.attempt);

        if (state.attempt >= state.max_attempts) {
            state.phase = RetryState::Phase::Exhausted;
            break;
        }

        state.phase = RetryState::Phase::Waiting;
        const auto wait = waitAfter(state.attempt);
        LogRegistry::sync()->info("[RetryDriver] Attempt {}/{} failed, waiting {}s before retrying",
                                  state.attempt, state.max_attempts, wait.count());
        state.waits.push_back(wait);
        sleeper_->sleep(wait);

        ++state.attempt;
        state.phase = RetryState::Phase::Attempting;
    }

    return state;
}
