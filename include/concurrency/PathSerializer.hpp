#pragma once

#include "concurrency/Task.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dl::concurrency {

class ThreadPool;

// Runs tasks that share a key one at a time, in submission order, on the
// pool. Tasks with different keys run in parallel. Keyed by file path so an
// unlock+sync for a closing document always finishes before the lock taken
// when the same document is reopened.
class PathSerializer {
public:
    explicit PathSerializer(std::shared_ptr<ThreadPool> pool);

    PathSerializer(const PathSerializer&) = delete;
    PathSerializer& operator=(const PathSerializer&) = delete;

    // Throws std::runtime_error if the pool is stopped or the serializer was
    // abandoned; nothing is queued then.
    void submit(const std::string& key, std::shared_ptr<Task> task);

    // Drops every task that has not started and rejects further submits.
    // Tasks already running finish and are still counted by pending().
    // Call after stopping the pool, which discards the runners of queued keys.
    void abandon();

    void waitIdle() const;

    // Returns false if work was still queued or running at the deadline.
    [[nodiscard]] bool waitIdle(std::chrono::milliseconds timeout) const;

    [[nodiscard]] size_t pending() const;
    [[nodiscard]] size_t pending(const std::string& key) const;

private:
    struct Queue {
        std::deque<std::shared_ptr<Task>> tasks;
        bool running = false;
    };

    struct State {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        std::unordered_map<std::string, Queue> queues;
        size_t pending = 0;
        bool abandoned = false;
    };

    static void drain(const std::shared_ptr<State>& state, const std::string& key);

    std::shared_ptr<ThreadPool> pool_;
    std::shared_ptr<State> state_ = std::make_shared<State>();
};

}
