#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace fchat::util
{
/**
 *  Fixed set of workers draining one FIFO of jobs.
 *  The destructor runs the jobs still queued before joining.
 */
class ThreadPool
{
public:
    explicit ThreadPool(std::size_t n);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    void post(F&& f)
    {
        {
            std::lock_guard<std::mutex> lk(m_);
            q_.emplace(std::forward<F>(f));
        }
        cv_.notify_one();
    }

    std::size_t size() const noexcept { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread>          workers_;
    std::mutex                        m_;
    std::condition_variable           cv_;
    std::queue<std::function<void()>> q_;
    std::atomic<bool>                 stop_{false};
};
} // namespace fchat::util
