#include "../libdocmill/include/thread_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

using namespace docmill;

TEST(ThreadPoolTest, RunsTasksAndReturnsResults) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.enqueue([i](std::stop_token) { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ExceptionsAreStoredInTheFuture) {
    ThreadPool pool(1);
    auto fut = pool.enqueue([](std::stop_token) -> int { throw std::runtime_error("boom"); });

    EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(ThreadPoolTest, WaitIdleBlocksUntilAllTasksFinished) {
    ThreadPool pool(2);
    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        (void)pool.enqueue([&done](std::stop_token) { ++done; });
    }
    pool.wait_idle();

    EXPECT_EQ(done.load(), 10);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne) {
    const ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(ThreadPoolTest, EnqueueAfterStopThrows) {
    ThreadPool pool(1);
    pool.request_stop();

    EXPECT_THROW((void)pool.enqueue([](std::stop_token) { return 1; }), std::runtime_error);
}
