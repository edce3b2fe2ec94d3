#include "concurrency/PathSerializer.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace dl::concurrency;
using namespace dl;

PathSerializer::PathSerializer(std::shared_ptr<ThreadPool> pool) : pool_(std::move(pool)) {
    if (!pool_) throw std::invalid_argument("PathSerializer requires a thread pool");
}

void PathSerializer::submit(const std::string& key, std::shared_ptr<Task> task) {
    std::unique_lock lock(state_->mutex);
    if (state_->abandoned) throw std::runtime_error("PathSerializer was abandoned");
    if (pool_->isStopped()) throw std::runtime_error("ThreadPool is stopped");

    auto& queue = state_->queues[key];
    queue.tasks.push_back(std::move(task));
    ++state_->pending;

    // A non-empty queue already has a runner draining it
    if (queue.tasks.size() > 1) return;

    try {
        pool_->submit(std::make_shared<FunctionTask>([state = state_, key] { drain(state, key); }));
    } catch (...) {
        --state_->pending;
        state_->queues.erase(key);
        state_->cv.notify_all();
        throw;
    }
}

void PathSerializer::abandon() {
    size_t dropped = 0;
    {
        std::scoped_lock lock(state_->mutex);
        state_->abandoned = true;

        for (auto it = state_->queues.begin(); it != state_->queues.end();) {
            auto& queue = it->second;
            if (queue.running) {
                dropped += queue.tasks.size() - 1;
                queue.tasks.resize(1);
                ++it;
            } else {
                dropped += queue.tasks.size();
                it = state_->queues.erase(it);
            }
        }

        state_->pending -= dropped;
    }
    state_->cv.notify_all();

    if (dropped) log::Registry::drivelock()->warn("[PathSerializer] Abandoned {} queued task(s)", dropped);
}

void PathSerializer::drain(const std::shared_ptr<State>& state, const std::string& key) {
    while (true) {
        std::shared_ptr<Task> task;
        {
            std::scoped_lock lock(state->mutex);
            const auto it = state->queues.find(key);
            if (it == state->queues.end()) return; // abandoned before this runner started
            it->second.running = true;
            task = it->second.tasks.front();
        }

        try {
            (*task)();
        } catch (const std::exception& e) {
            log::Registry::drivelock()->error("[PathSerializer] Task for {} threw: {}", key, e.what());
        } catch (...) {
            log::Registry::drivelock()->error("[PathSerializer] Task for {} threw: unknown exception", key);
        }

        std::scoped_lock lock(state->mutex);
        auto& queue = state->queues.at(key);
        queue.tasks.pop_front();
        queue.running = false;
        --state->pending;
        state->cv.notify_all();

        if (queue.tasks.empty() || state->abandoned) {
            state->queues.erase(key);
            return;
        }
    }
}

void PathSerializer::waitIdle() const {
    std::unique_lock lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->pending == 0; });
}

bool PathSerializer::waitIdle(const std::chrono::milliseconds timeout) const {
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->pending == 0; });
}

size_t PathSerializer::pending() const {
    std::scoped_lock lock(state_->mutex);
    return state_->pending;
}

size_t PathSerializer::pending(const std::string& key) const {
    std::scoped_lock lock(state_->mutex);
    const auto it = state_->queues.find(key);
    return it == state_->queues.end() ? 0 : it->second.tasks.size();
}
