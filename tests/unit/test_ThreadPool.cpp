#include <gtest/gtest.h>

#include "concurrency/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace dl::concurrency;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, RunsSubmittedTasks) {
    ThreadPool pool(2);
    std::atomic<int> ran{0};

    for (int i = 0; i < 10; ++i) pool.submit(std::make_shared<FunctionTask>([&ran] { ++ran; }));

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (ran.load() < 10 && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(5ms);

    EXPECT_EQ(ran.load(), 10);
    EXPECT_EQ(pool.workerCount(), 2u);
}

TEST(ThreadPoolTest, WorkerSurvivesThrowingTask) {
    ThreadPool pool(1);
    std::atomic<bool> ran{false};

    pool.submit(std::make_shared<FunctionTask>([] { throw std::runtime_error("boom"); }));
    pool.submit(std::make_shared<FunctionTask>([&ran] { ran = true; }));

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!ran.load() && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(5ms);

    EXPECT_TRUE(ran.load());
}

TEST(ThreadPoolTest, StopRejectsNewWork) {
    ThreadPool pool(1);
    pool.stop();

    EXPECT_TRUE(pool.isStopped());
    EXPECT_EQ(pool.workerCount(), 0u);
    EXPECT_THROW(pool.submit(std::make_shared<FunctionTask>([] {})), std::runtime_error);
}

TEST(ThreadPoolTest, ZeroThreadsStillGetsOneWorker) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.workerCount(), 1u);
}
