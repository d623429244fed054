#pragma once

#include <future>
#include <optional>
#include <stdexcept>

namespace ferry::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Optional future for reporting
    virtual std::optional<std::future<bool>> getFuture() { return std::nullopt; }
};

struct PromisedTask : Task {
    std::promise<bool> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<bool> p) : promise(std::move(p)) {}

    std::optional<std::future<bool>> getFuture() override { return promise.get_future(); }

    void operator()() override { throw std::logic_error("PromisedTask must implement operator()()"); }
};

}
