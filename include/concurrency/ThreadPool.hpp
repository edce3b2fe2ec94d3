#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include <chrono>

namespace dl::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 2);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks and waits for running ones up to gracefulTimeout.
    // Workers still busy after that are detached.
    void stop(std::chrono::milliseconds gracefulTimeout = std::chrono::milliseconds(1200));

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] unsigned int workerCount() const;

    [[nodiscard]] bool isStopped() const { return state_->stopFlag.load(); }

private:
    // Outlives the pool when a worker has to be detached.
    struct State {
        std::condition_variable cv;
        std::mutex mutex;
        std::queue<std::shared_ptr<Task>> queue;
        std::atomic<bool> stopFlag{false};
    };

    void spawnWorker();

    std::shared_ptr<State> state_ = std::make_shared<State>();
    std::vector<std::thread> threads_;
    std::vector<std::shared_ptr<std::atomic<bool>>> idleFlags_;
};

} // namespace dl::concurrency
