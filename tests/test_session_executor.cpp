#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "util/session_executor.hpp"

using namespace fchat::util;

TEST(SessionExecutor, SameSessionRunsInSubmitOrder)
{
    ThreadPool pool(4);
    SessionExecutor exec(pool);

    std::mutex m;
    std::vector<int> seen;
    for (int i = 0; i < static_cast<int>(kMaxPendingJobs); ++i)
        ASSERT_TRUE(exec.submit("a", [&, i] {
            std::this_thread::sleep_for(std::chrono::microseconds(200 * (i % 3)));
            std::lock_guard lk(m);
            seen.push_back(i);
        }));
    exec.wait_idle();

    ASSERT_EQ(seen.size(), kMaxPendingJobs);
    for (int i = 0; i < static_cast<int>(seen.size()); ++i)
        EXPECT_EQ(seen[i], i);
}

TEST(SessionExecutor, SameSessionNeverOverlaps)
{
    ThreadPool pool(4);
    SessionExecutor exec(pool);

    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    for (int i = 0; i < 10; ++i)
        ASSERT_TRUE(exec.submit("a", [&] {
            const int now = ++inside;
            int prev = max_inside.load();
            while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            --inside;
        }));
    exec.wait_idle();
    EXPECT_EQ(max_inside.load(), 1);
}

TEST(SessionExecutor, DifferentSessionsRunInParallel)
{
    ThreadPool pool(2);
    SessionExecutor exec(pool);

    std::promise<void> a_started;
    std::promise<void> b_started;
    auto a_ready = a_started.get_future();
    auto b_ready = b_started.get_future();

    // each job waits for the other; only completes if both run at once
    ASSERT_TRUE(exec.submit("a", [&] {
        a_started.set_value();
        b_ready.wait_for(std::chrono::seconds(5));
    }));
    ASSERT_TRUE(exec.submit("b", [&] {
        b_started.set_value();
        a_ready.wait_for(std::chrono::seconds(5));
    }));
    exec.wait_idle();

    EXPECT_EQ(a_ready.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_EQ(b_ready.wait_for(std::chrono::seconds(0)), std::future_status::ready);
}

TEST(SessionExecutor, FullLaneRefusesWork)
{
    ThreadPool pool(1);
    SessionExecutor exec(pool);

    std::promise<void> release;
    std::promise<void> running;
    auto gate = release.get_future().share();

    ASSERT_TRUE(exec.submit("a", [&, gate] {
        running.set_value();
        gate.wait();
    }));
    running.get_future().wait();

    std::atomic<int> ran{0};
    for (std::size_t i = 0; i < kMaxPendingJobs; ++i)
        EXPECT_TRUE(exec.submit("a", [&] { ++ran; }));
    EXPECT_EQ(exec.pending("a"), kMaxPendingJobs);
    EXPECT_FALSE(exec.submit("a", [&] { ++ran; }));

    release.set_value();
    exec.wait_idle();
    EXPECT_EQ(ran.load(), static_cast<int>(kMaxPendingJobs));
    EXPECT_EQ(exec.pending("a"), 0u);
}

TEST(SessionExecutor, CancelDropsWaitingJobs)
{
    ThreadPool pool(1);
    SessionExecutor exec(pool);

    std::promise<void> release;
    std::promise<void> running;
    auto gate = release.get_future().share();

    std::atomic<bool> first_done{false};
    ASSERT_TRUE(exec.submit("a", [&, gate] {
        running.set_value();
        gate.wait();
        first_done = true;
    }));
    running.get_future().wait();

    std::atomic<int> ran{0};
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(exec.submit("a", [&] { ++ran; }));

    exec.cancel("a");
    EXPECT_EQ(exec.pending("a"), 0u);

    release.set_value();
    exec.wait_idle();
    EXPECT_TRUE(first_done);
    EXPECT_EQ(ran.load(), 0);

    EXPECT_NO_THROW(exec.cancel("never-seen"));
}

TEST(SessionExecutor, ThrowingJobDoesNotStallTheLane)
{
    ThreadPool pool(1);
    SessionExecutor exec(pool);

    bool second = false;
    ASSERT_TRUE(exec.submit("a", [] { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(exec.submit("a", [&] { second = true; }));
    exec.wait_idle();
    EXPECT_TRUE(second);
}

TEST(BoundedQueue, RefusesBeyondCapacity)
{
    BoundedQueue<int, 2> q;
    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    EXPECT_FALSE(q.push(3));
    EXPECT_EQ(q.pop(), 1);
    EXPECT_EQ(q.pop(), 2);
    EXPECT_FALSE(q.pop());
}
