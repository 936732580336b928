#include "core/ThreadPool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>

using reading_service::core::ThreadPool;

TEST(ThreadPoolTest, StartAndStop) {
    ThreadPool pool;
    EXPECT_FALSE(pool.IsRunning());

    pool.Start(4);
    EXPECT_TRUE(pool.IsRunning());
    EXPECT_EQ(pool.GetThreadCount(), 4u);

    pool.Stop();
    EXPECT_FALSE(pool.IsRunning());
    EXPECT_EQ(pool.GetThreadCount(), 0u);
}

TEST(ThreadPoolTest, ZeroThreadsStartsOne) {
    ThreadPool pool;
    pool.Start(0);
    EXPECT_EQ(pool.GetThreadCount(), 1u);
}

TEST(ThreadPoolTest, RunsSubmittedTasksBeforeStopping) {
    ThreadPool pool;
    pool.Start(2);

    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(pool.Submit([&counter]() { counter.fetch_add(1); }));
    }

    pool.Stop();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, SubmitAfterStopIsRejected) {
    ThreadPool pool;
    pool.Start(1);
    pool.Stop();

    EXPECT_FALSE(pool.Submit([]() {}));
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    ThreadPool pool;
    pool.Start(1);

    std::atomic<bool> ran{false};
    pool.Submit([]() { throw std::runtime_error("task failure"); });
    pool.Submit([&ran]() { ran.store(true); });

    pool.Stop();
    EXPECT_TRUE(ran.load());
}

TEST(ThreadPoolTest, OptimalThreadCountIsPositive) {
    EXPECT_GE(ThreadPool::GetOptimalThreadCount(), 2u);
}
