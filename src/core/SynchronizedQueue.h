#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace SandSim {

/**
 * @brief Thread-safe FIFO feeding the worker pool.
 *
 * Multiple producers, multiple consumers. After stop(), waiting consumers
 * wake up and pop() reports std::nullopt once the queue has drained.
 */
template <typename T>
class SynchronizedQueue {
public:
    SynchronizedQueue() = default;

    void push(T item)
    {
        {
            std::unique_lock lock(mutex_);
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    /**
     * @brief Pop an item, blocking until one is available or the queue stops.
     * @return The next item, or std::nullopt once stopped and empty.
     */
    std::optional<T> pop()
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || shouldStop_; });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    size_t size() const
    {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    void stop()
    {
        {
            std::unique_lock lock(mutex_);
            shouldStop_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool shouldStop_ = false;
};

} // namespace SandSim
