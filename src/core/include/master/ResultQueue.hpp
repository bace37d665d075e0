#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace disagg::master
{

/// Multi-producer, single-consumer FIFO; push blocks while a bounded queue is full.
template <class T> class ResultQueue
{
  public:
    explicit ResultQueue(std::size_t max_size = 0) : max_(max_size) {}

    void push(T v)
    {
        std::unique_lock<std::mutex> lk(m_);
        not_full_.wait(lk, [&] { return closed_ || max_ == 0 || q_.size() < max_; });
        if (closed_)
            return;
        q_.push_back(std::move(v));
        lk.unlock();
        not_empty_.notify_one();
    }

    // nullopt once the queue is closed and drained
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lk(m_);
        not_empty_.wait(lk, [&] { return closed_ || !q_.empty(); });
        if (q_.empty())
            return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return v;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

  private:
    std::size_t max_;
    mutable std::mutex m_;
    std::condition_variable not_empty_, not_full_;
    std::deque<T> q_;
    bool closed_ = false;
};

} // namespace disagg::master
