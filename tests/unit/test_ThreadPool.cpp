#include <gtest/gtest.h>
#include "concurrency/ThreadPool.hpp"

#include <atomic>
#include <stdexcept>

using namespace ferry::concurrency;

namespace {

struct CountingTask final : PromisedTask {
    std::atomic<int>& counter;
    bool fail;

    CountingTask(std::atomic<int>& c, const bool f) : counter(c), fail(f) {}

    void operator()() override {
        ++counter;
        promise.set_value(!fail);
    }
};

struct ThrowingTask final : Task {
    void operator()() override { throw std::runtime_error("boom"); }
};

}

TEST(ThreadPoolTest, RunsEveryTaskAndReportsThroughFutures) {
    std::atomic<int> counter{0};
    ThreadPool pool(3);
    EXPECT_EQ(pool.workerCount(), 3u);

    std::vector<std::future<bool>> futures;
    for (int i = 0; i < 20; ++i) {
        auto task = std::make_shared<CountingTask>(counter, i % 5 == 0);
        futures.push_back(*task->getFuture());
        pool.submit(task);
    }

    int ok = 0;
    for (auto& f : futures) ok += f.get() ? 1 : 0;

    EXPECT_EQ(counter.load(), 20);
    EXPECT_EQ(ok, 16);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);

    pool.submit(std::make_shared<ThrowingTask>());
    auto task = std::make_shared<CountingTask>(counter, false);
    auto future = *task->getFuture();
    pool.submit(task);

    EXPECT_TRUE(future.get());
    EXPECT_EQ(counter.load(), 1);
}

TEST(ThreadPoolTest, StopDrainsQueueAndRejectsNewWork) {
    std::atomic<int> counter{0};
    ThreadPool pool(2);
    for (int i = 0; i < 10; ++i) pool.submit(std::make_shared<CountingTask>(counter, false));

    pool.stop();
    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool.queueDepth(), 0u);
    EXPECT_THROW(pool.submit(std::make_shared<CountingTask>(counter, false)), std::runtime_error);
}

TEST(ThreadPoolTest, ZeroWorkersBecomesOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.workerCount(), 1u);
}
