#include "seedwise/thread_pool.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <thread>

using namespace seedwise;

TEST(thread_pool, executes_every_job)
{
    thread_pool pool(4);
    std::atomic<int> n{0};
    for(int i = 0; i < 100; ++i) { pool.post([&n] { ++n; }); }
    pool.join();
    EXPECT_EQ(n.load(), 100);
    EXPECT_EQ(pool.num_executed_jobs(), 100);
    EXPECT_EQ(pool.num_threads(), 0);
}

TEST(thread_pool, never_exceeds_concurrency)
{
    thread_pool pool(2);
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};
    for(int i = 0; i < 10; ++i)
    {
        pool.post([&]
        {
            const int now = ++running;
            int prev = max_running.load();
            while(prev < now && !max_running.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(milliseconds(5));
            --running;
        });
        EXPECT_LE(pool.num_threads(), 2);
    }
    pool.join();
    EXPECT_LE(max_running.load(), 2);
    EXPECT_EQ(pool.num_executed_jobs(), 10);
}

TEST(thread_pool, back_to_back_jobs_run_in_parallel)
{
    thread_pool pool(2);
    // each job waits for the other to start, which only works with two workers
    std::promise<void> first_started;
    std::promise<void> second_started;
    auto first = first_started.get_future().share();
    auto second = second_started.get_future().share();
    std::atomic<int> num_met{0};

    // let the first worker go idle before posting the pair
    pool.post([] {});
    while(pool.num_executed_jobs() < 1) { std::this_thread::yield(); }

    pool.post([&first_started, second, &num_met]
    {
        first_started.set_value();
        if(second.wait_for(seconds(5)) == std::future_status::ready) { ++num_met; }
    });
    pool.post([&second_started, first, &num_met]
    {
        second_started.set_value();
        if(first.wait_for(seconds(5)) == std::future_status::ready) { ++num_met; }
    });
    pool.join();

    EXPECT_EQ(num_met.load(), 2);
    EXPECT_EQ(pool.num_executed_jobs(), 3);
}

TEST(thread_pool, can_be_reused_after_join)
{
    thread_pool pool(2);
    std::atomic<int> n{0};
    pool.post([&n] { ++n; });
    pool.join();
    pool.post([&n] { ++n; });
    pool.post([&n] { ++n; });
    pool.join();
    EXPECT_EQ(n.load(), 3);
}

TEST(thread_pool, clear_pending_jobs)
{
    thread_pool pool(1);
    std::promise<void> started;
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<int> n{0};

    pool.post([&started, released, &n]
    {
        started.set_value();
        released.wait();
        ++n;
    });
    started.get_future().wait();

    // the only thread is busy, so these are queued
    for(int i = 0; i < 5; ++i) { pool.post([&n] { ++n; }); }
    EXPECT_EQ(pool.num_pending_jobs(), 5);
    pool.clear_pending_jobs();
    EXPECT_EQ(pool.num_pending_jobs(), 0);

    release.set_value();
    pool.join();
    EXPECT_EQ(n.load(), 1);
}

TEST(thread_pool, concurrency)
{
    thread_pool pool(3);
    EXPECT_EQ(pool.concurrency(), 3);
    pool.set_concurrency(0);
    EXPECT_EQ(pool.concurrency(), 3);
    pool.set_concurrency(8);
    EXPECT_EQ(pool.concurrency(), 8);

    EXPECT_GT(thread_pool().concurrency(), 0);
}
