#include "install/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

namespace {

TEST(WorkerPoolTests, RunsEveryTask) {
    ngdp::WorkerPool pool(4, "test");
    EXPECT_EQ(pool.Size(), 4u);

    std::atomic<int> sum{0};
    for (int i = 1; i <= 100; ++i) {
        pool.Submit([&sum, i] { sum += i; });
    }
    pool.Wait();
    EXPECT_EQ(sum.load(), 5050);
}

TEST(WorkerPoolTests, RunsTasksInParallel) {
    ngdp::WorkerPool pool(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 9; ++i) {
        pool.Submit([&] {
            const int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --running;
        });
    }
    pool.Wait();
    EXPECT_GT(peak.load(), 1);
    EXPECT_LE(peak.load(), 3);
}

TEST(WorkerPoolTests, WaitCanBeReused) {
    ngdp::WorkerPool pool(0);
    EXPECT_EQ(pool.Size(), 1u);

    std::atomic<int> n{0};
    pool.Submit([&] { ++n; });
    pool.Wait();
    EXPECT_EQ(n.load(), 1);

    pool.Submit([&] { ++n; });
    pool.Submit([&] { ++n; });
    pool.Wait();
    EXPECT_EQ(n.load(), 3);

    // Nothing queued: returns immediately.
    pool.Wait();
}

TEST(WorkerPoolTests, DestructorDrainsQueue) {
    std::atomic<int> n{0};
    {
        ngdp::WorkerPool pool(2);
        for (int i = 0; i < 50; ++i)
            pool.Submit([&] { ++n; });
    }
    EXPECT_EQ(n.load(), 50);
}

} // namespace
