#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace ferry::concurrency {

// Fixed number of workers draining one FIFO queue.
class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Lets queued tasks finish, then joins every worker.
    void stop();

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] size_t queueDepth() const;
    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

}
