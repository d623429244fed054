#pragma once

#include <chrono>
#include <cstdint>

namespace ferry::sync::model {

// Wall-clock span and payload size of one transfer task.
struct ScopedOp {
    uint64_t size_bytes{};
    std::chrono::steady_clock::time_point begin{};
    std::chrono::steady_clock::time_point end{};
    bool success{};

    void start();
    void start(uint64_t size_bytes);
    void stop();
    [[nodiscard]] uint64_t duration_ms() const;
};

}
