#pragma once

#include <chrono>
#include <thread>

namespace ferry::concurrency {

struct Sleeper {
    virtual ~Sleeper() = default;
    virtual void sleep(std::chrono::seconds duration) = 0;
};

// Blocks only the calling thread.
struct ThreadSleeper final : Sleeper {
    void sleep(const std::chrono::seconds duration) override { std::this_thread::sleep_for(duration); }
};

}
