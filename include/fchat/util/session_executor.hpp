#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "util/bounded_queue.hpp"
#include "util/thread_pool.hpp"

namespace fchat::util
{

constexpr std::size_t kMaxPendingJobs = 16;

/**
 *  One ordered lane of jobs per session over a shared ThreadPool.
 *
 *  Jobs of the same session never run concurrently and run in submit
 *  order; jobs of different sessions run in parallel. A lane holds at
 *  most kMaxPendingJobs waiting jobs.
 */
class SessionExecutor
{
public:
    using Job = std::function<void()>;

    explicit SessionExecutor(ThreadPool& pool) : pool_(pool) {}
    ~SessionExecutor() { wait_idle(); }

    SessionExecutor(const SessionExecutor&) = delete;
    SessionExecutor& operator=(const SessionExecutor&) = delete;

    /** false when the session's lane is full; the job is not queued */
    [[nodiscard]] bool submit(const std::string& session_id, Job job);

    /** Drops the session's waiting jobs. A running job is left to finish. */
    void cancel(const std::string& session_id);

    /** Blocks until no lane has work left. */
    void wait_idle();

    std::size_t pending(const std::string& session_id) const;

    /** true if submit() for this session would currently be accepted */
    bool has_room(const std::string& session_id) const
    {
        return pending(session_id) < kMaxPendingJobs;
    }

private:
    struct Lane {
        BoundedQueue<Job, kMaxPendingJobs> jobs;
        bool running = false;
    };
    using LanePtr = std::shared_ptr<Lane>;

    void drain(const std::string& session_id, LanePtr lane);

    ThreadPool&                              pool_;
    mutable std::mutex                       m_;
    std::condition_variable                  idle_cv_;
    std::unordered_map<std::string, LanePtr> lanes_;
    std::size_t                              active_ = 0;
};

} // namespace fchat::util
