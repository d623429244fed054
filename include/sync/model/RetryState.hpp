#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace ferry::sync::model {

struct RetryState {
    enum class Phase {
        Pending,
        Attempting,
        Waiting,
        Succeeded,
        Exhausted
    };

    Phase phase{Phase::Pending};
    unsigned int attempt{0};   // 1-indexed once Attempting
    unsigned int max_attempts{1};
    std::vector<std::chrono::seconds> waits{};

    [[nodiscard]] bool succeeded() const { return phase == Phase::Succeeded; }
    [[nodiscard]] bool exhausted() const { return phase == Phase::Exhausted; }
    [[nodiscard]] bool done() const { return succeeded() || exhausted(); }

    [[nodiscard]] std::string phaseToString() const;
};

}
