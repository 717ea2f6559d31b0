#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <thread>

#include "cw/concurrency.hpp"

using namespace cw;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

// Tracks the highest number of tasks observed running at once.
struct InFlight
{
    std::atomic<int> now{0};
    std::atomic<int> peak{0};

    void enter()
    {
        int v = now.fetch_add(1) + 1;
        int p = peak.load();
        while (v > p && !peak.compare_exchange_weak(p, v)) {}
    }
    void leave() { now.fetch_sub(1); }
};

static void test_pool_submit_and_wait()
{
    ThreadPool pool(4);
    assert_true(pool.size() == 4, "pool size");
    std::atomic<int> c{0};
    for (int i = 0; i < 100; ++i)
    {
        pool.submit([&] { c.fetch_add(1, std::memory_order_relaxed); });
    }
    pool.wait_idle();
    assert_true(c.load() == 100, "pool completes all tasks");
    assert_true(pool.first_exception() == nullptr, "no exception recorded");
}

static void test_pool_size_floor()
{
    ThreadPool zero(0);
    assert_true(zero.size() == 1, "threads=0 -> 1 worker");
    ThreadPool neg(-3);
    assert_true(neg.size() == 1, "threads<0 -> 1 worker");
    std::atomic<int> c{0};
    neg.submit([&] { c.fetch_add(1); });
    neg.wait_idle();
    assert_true(c.load() == 1, "single worker runs tasks");
}

static void test_pool_bounded_in_flight()
{
    using namespace std::chrono;
    InFlight f;
    ThreadPool pool(3);
    for (int i = 0; i < 12; ++i)
    {
        pool.submit([&]
        {
            f.enter();
            std::this_thread::sleep_for(milliseconds(20));
            f.leave();
        });
    }
    pool.wait_idle();
    assert_true(f.peak.load() <= 3, "never more than 3 tasks at once");
    assert_true(f.peak.load() >= 2, "tasks actually overlap");
}

static void test_pool_single_worker_serializes()
{
    using namespace std::chrono;
    InFlight f;
    ThreadPool pool(1);
    for (int i = 0; i < 5; ++i)
    {
        pool.submit([&]
        {
            f.enter();
            std::this_thread::sleep_for(milliseconds(5));
            f.leave();
        });
    }
    pool.wait_idle();
    assert_true(f.peak.load() == 1, "one worker -> strictly serial");
}

static void test_pool_exception_and_cancel()
{
    ThreadPool pool(3);
    std::atomic<int> c{0};
    for (int i = 0; i < 10; ++i)
    {
        if (i == 5)
        {
            pool.submit([] { throw std::runtime_error("boom"); });
        }
        else
        {
            pool.submit([&] { c.fetch_add(1, std::memory_order_relaxed); });
        }
    }
    pool.wait_idle();
    assert_true(pool.first_exception() != nullptr, "first exception captured");
    assert_true(pool.cancel_flag().load(), "exception sets cancel flag");
    assert_true(c.load() == 9, "plain tasks still run after a failure");
}

static void test_pool_cancel_cooperative()
{
    ThreadPool pool(4);
    std::atomic<int> c{0};
    for (int i = 0; i < 200; ++i)
    {
        pool.submit_cancelable(
            [&](const std::atomic<bool> &flag)
            {
                if (flag.load(std::memory_order_relaxed)) return;
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                c.fetch_add(1, std::memory_order_relaxed);
            });
    }
    pool.cancel();
    pool.wait_idle();
    assert_true(c.load() < 200, "cancel reduces completed tasks");
}

static void test_pool_post_cancel_submit()
{
    ThreadPool pool(4);
    pool.cancel();
    pool.cancel(); // idempotent
    std::atomic<int> cancelable_count{0};
    std::atomic<int> plain_count{0};
    for (int i = 0; i < 50; ++i)
    {
        pool.submit_cancelable(
            [&](const std::atomic<bool> &flag)
            {
                if (flag.load(std::memory_order_relaxed)) return;
                cancelable_count.fetch_add(1, std::memory_order_relaxed);
            });
    }
    for (int i = 0; i < 10; ++i)
    {
        pool.submit([&] { plain_count.fetch_add(1, std::memory_order_relaxed); });
    }
    pool.wait_idle();
    assert_true(cancelable_count.load() == 0, "post-cancel submit_cancelable does nothing");
    assert_true(plain_count.load() == 10, "post-cancel submit still runs");
}

static void test_pool_destructor_drains_queue()
{
    std::atomic<int> c{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 20; ++i)
        {
            pool.submit([&]
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                c.fetch_add(1);
            });
        }
    }
    assert_true(c.load() == 20, "destructor runs queued tasks before joining");
}

static void test_pool_wait_idle_with_long_tasks()
{
    using namespace std::chrono;
    ThreadPool pool(4);
    std::atomic<int> c{0};
    for (int i = 0; i < 2; ++i)
    {
        pool.submit(
            [&]
            {
                std::this_thread::sleep_for(milliseconds(50));
                c.fetch_add(1, std::memory_order_relaxed);
            });
    }
    for (int i = 0; i < 20; ++i)
    {
        pool.submit([&] { c.fetch_add(1, std::memory_order_relaxed); });
    }
    auto t0 = steady_clock::now();
    pool.wait_idle();
    auto dt = duration_cast<milliseconds>(steady_clock::now() - t0);
    assert_true(c.load() == 22, "all long+short tasks completed");
    assert_true(dt.count() >= 40, "wait_idle blocks until long tasks complete (>=40ms)");
}

static void test_cancellation_token()
{
    Cancellation c;
    assert_true(!c.is_cancelled(), "fresh token not cancelled");
    c.cancel();
    assert_true(c.is_cancelled() && c.flag().load(), "cancel sets flag");
}

int main()
{
    test_pool_submit_and_wait();
    test_pool_size_floor();
    test_pool_bounded_in_flight();
    test_pool_single_worker_serializes();
    test_pool_exception_and_cancel();
    test_pool_cancel_cooperative();
    test_pool_post_cancel_submit();
    test_pool_destructor_drains_queue();
    test_pool_wait_idle_with_long_tasks();
    test_cancellation_token();

    std::cout << "concurrency tests: OK" << std::endl;
    return 0;
}
