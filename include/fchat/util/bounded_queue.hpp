#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace fchat::util
{

/** Mutex-protected FIFO that refuses pushes beyond N items. */
template<typename T, std::size_t N = 16>
class BoundedQueue
{
public:
    bool push(T v)
    {
        std::lock_guard<std::mutex> lk(m_);
        if (dq_.size() >= N) return false;
        dq_.push_back(std::move(v));
        return true;
    }

    std::optional<T> pop()
    {
        std::lock_guard<std::mutex> lk(m_);
        if (dq_.empty()) return std::nullopt;
        T v = std::move(dq_.front());
        dq_.pop_front();
        return v;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lk(m_);
        return dq_.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lk(m_);
        dq_.clear();
    }

    static constexpr std::size_t capacity() noexcept { return N; }

private:
    mutable std::mutex m_;
    std::deque<T>      dq_;
};

} // namespace fchat::util
