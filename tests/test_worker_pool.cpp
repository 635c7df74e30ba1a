#include <gtest/gtest.h>

#include "util/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace {

TEST(WorkerPoolTests, ReturnsResultsThroughFutures) {
    batchsync::WorkerPool pool(3);
    EXPECT_EQ(pool.Size(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.Submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[static_cast<size_t>(i)].get(), i * i);
    }
}

TEST(WorkerPoolTests, ZeroThreadsStillRunsTasks) {
    batchsync::WorkerPool pool(0);
    EXPECT_EQ(pool.Size(), 1u);
    EXPECT_EQ(pool.Submit([]() { return std::string("done"); }).get(), "done");
}

TEST(WorkerPoolTests, DestructorDrainsQueuedTasks) {
    std::atomic<int> ran{0};
    {
        batchsync::WorkerPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.Submit([&ran]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ran.fetch_add(1);
            });
        }
    }
    EXPECT_EQ(ran.load(), 10);
}

TEST(WorkerPoolTests, ExceptionsTravelThroughFuture) {
    batchsync::WorkerPool pool(2);
    auto fut = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(fut.get(), std::runtime_error);
}

} // namespace
