#include "util/session_executor.hpp"

#include <exception>
#include <iostream>

namespace fchat::util {

bool SessionExecutor::submit(const std::string& session_id, Job job)
{
    std::lock_guard<std::mutex> lock(m_);

    auto& lane = lanes_[session_id];
    if (!lane) lane = std::make_shared<Lane>();

    if (!lane->jobs.push(std::move(job))) {
        std::cerr << "[EXEC] lane full for session " << session_id << '\n';
        return false;
    }

    if (!lane->running) {
        lane->running = true;
        ++active_;
        pool_.post([this, session_id, lane] { drain(session_id, lane); });
    }
    return true;
}

void SessionExecutor::drain(const std::string& session_id, LanePtr lane)
{
    for (;;) {
        std::optional<Job> job;
        {
            std::lock_guard<std::mutex> lock(m_);
            job = lane->jobs.pop();
            if (!job) {
                lane->running = false;
                auto it = lanes_.find(session_id);
                if (it != lanes_.end() && it->second == lane)
                    lanes_.erase(it);
                --active_;
                idle_cv_.notify_all();
                return;
            }
        }

        try {
            (*job)();
        } catch (const std::exception& e) {
            std::cerr << "[EXEC] job for session " << session_id
                      << " failed: " << e.what() << '\n';
        }
    }
}

void SessionExecutor::cancel(const std::string& session_id)
{
    std::lock_guard<std::mutex> lock(m_);
    auto it = lanes_.find(session_id);
    if (it == lanes_.end()) return;

    it->second->jobs.clear();
    if (!it->second->running)
        lanes_.erase(it);
}

void SessionExecutor::wait_idle()
{
    std::unique_lock<std::mutex> lock(m_);
    idle_cv_.wait(lock, [this] { return active_ == 0; });
}

std::size_t SessionExecutor::pending(const std::string& session_id) const
{
    std::lock_guard<std::mutex> lock(m_);
    auto it = lanes_.find(session_id);
    return it == lanes_.end() ? 0 : it->second->jobs.size();
}

} // namespace fchat::util
