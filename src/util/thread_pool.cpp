#include "util/thread_pool.hpp"

#include <exception>
#include <iostream>

namespace fchat::util
{

ThreadPool::ThreadPool(std::size_t n)
{
    if (n == 0) n = 1;
    for (std::size_t i = 0; i < n; ++i)
        workers_.emplace_back([this] { worker_loop(); });
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard<std::mutex> lk(m_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_)
        if (t.joinable()) t.join();
}

void ThreadPool::worker_loop()
{
    for (;;)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [this] { return stop_ || !q_.empty(); });
            if (stop_ && q_.empty())
                return;
            job = std::move(q_.front());
            q_.pop();
        }

        try {
            job();
        } catch (const std::exception& e) {
            std::cerr << "[POOL] job failed: " << e.what() << '\n';
        }
    }
}

} // namespace fchat::util
