#include "cw/concurrency.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace cw {

struct ThreadPool::Impl {
    explicit Impl(int n)
    {
        const int count = n > 0 ? n : 1;
        threads.reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i)
        {
            threads.emplace_back([this] { run_worker(); });
        }
    }

    ~Impl()
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            closing = true;
        }
        has_work.notify_all();
        for (auto& th : threads) th.join();
    }

    bool idle() const { return pending.empty() && running == 0; }

    void push(std::function<void()> task)
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (closing) return;
            pending.push_back(std::move(task));
        }
        has_work.notify_one();
    }

    // Blocks until a task is available; false once closing and drained.
    bool pop(std::function<void()>& task)
    {
        std::unique_lock<std::mutex> lk(mtx);
        has_work.wait(lk, [&] { return closing || !pending.empty(); });
        if (pending.empty()) return false;
        task = std::move(pending.front());
        pending.pop_front();
        ++running;
        return true;
    }

    void finish_one()
    {
        std::lock_guard<std::mutex> lk(mtx);
        --running;
        if (idle()) became_idle.notify_all();
    }

    void record_failure(std::exception_ptr ep)
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (!failure) failure = std::move(ep);
        }
        stop_flag.store(true, std::memory_order_relaxed);
    }

    void run_worker()
    {
        std::function<void()> task;
        while (pop(task))
        {
            try
            {
                task();
            }
            catch (...)
            {
                record_failure(std::current_exception());
            }
            task = nullptr;
            finish_one();
        }
    }

    mutable std::mutex mtx;
    std::condition_variable has_work;
    std::condition_variable became_idle;
    std::deque<std::function<void()>> pending;
    std::size_t running = 0;
    bool closing = false;
    std::atomic<bool> stop_flag{false};
    std::exception_ptr failure;
    std::vector<std::thread> threads;
};

ThreadPool::ThreadPool(int threads)
  : impl_(new Impl(threads))
{}

ThreadPool::~ThreadPool()
{
    delete impl_;
}

std::size_t ThreadPool::size() const
{
    return impl_->threads.size();
}

void ThreadPool::submit(std::function<void()> task)
{
    impl_->push(std::move(task));
}

void ThreadPool::submit_cancelable(std::function<void(const std::atomic<bool>&)> task)
{
    Impl* impl = impl_;
    impl_->push([impl, t = std::move(task)] { t(impl->stop_flag); });
}

void ThreadPool::wait_idle()
{
    std::unique_lock<std::mutex> lk(impl_->mtx);
    impl_->became_idle.wait(lk, [this] { return impl_->idle(); });
}

void ThreadPool::cancel()
{
    impl_->stop_flag.store(true, std::memory_order_relaxed);
}

const std::atomic<bool>& ThreadPool::cancel_flag() const
{
    return impl_->stop_flag;
}

std::exception_ptr ThreadPool::first_exception() const
{
    std::lock_guard<std::mutex> lk(impl_->mtx);
    return impl_->failure;
}

} // namespace cw
