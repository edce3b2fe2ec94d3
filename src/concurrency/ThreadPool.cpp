#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace dl::concurrency;
using namespace dl;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    for (unsigned int i = 0; i < std::max(1u, nThreads); ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop(const std::chrono::milliseconds gracefulTimeout) {
    {
        std::scoped_lock lock(state_->mutex);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(state_->queue, empty);
        state_->stopFlag.store(true);
    }
    state_->cv.notify_all();

    const auto deadline = std::chrono::steady_clock::now() + gracefulTimeout;
    for (size_t i = 0; i < threads_.size(); ++i) {
        auto& t = threads_[i];
        if (!t.joinable()) continue;

        while (!idleFlags_[i]->load() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));

        if (idleFlags_[i]->load()) t.join();
        else {
            // A remote call can't be interrupted; the worker exits on its own once it returns.
            log::Registry::drivelock()->warn("[ThreadPool] Worker still busy after {}ms, detaching",
                                             gracefulTimeout.count());
            t.detach();
        }
    }

    threads_.clear();
    idleFlags_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(state_->mutex);
        if (state_->stopFlag.load()) throw std::runtime_error("ThreadPool is stopped");
        state_->queue.push(std::move(task));
    }
    state_->cv.notify_one();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    auto flag = std::make_shared<std::atomic<bool>>(true); // idle at start
    idleFlags_.push_back(flag);

    threads_.emplace_back([state = state_, flag] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(state->mutex);
                state->cv.wait(lock, [&state] {
                    return state->stopFlag.load() || !state->queue.empty();
                });

                if (state->stopFlag.load() && state->queue.empty()) break;

                task = std::move(state->queue.front());
                state->queue.pop();
                flag->store(false);
            }

            if (task) {
                try {
                    (*task)();
                } catch (const std::exception& e) {
                    log::Registry::drivelock()->error("[ThreadPool] Task threw: {}", e.what());
                } catch (...) {
                    log::Registry::drivelock()->error("[ThreadPool] Task threw: unknown exception");
                }
            }
            flag->store(true);
        }
    });
}
