/**
 * \file pipeline/InProcessQueue.hpp
 * \brief Thread-safe bounded FIFO for use within one process.
 * \ingroup pipeline_module
 */
#pragma once

#include "IQueue.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace takclient::pipeline {

/**
 * \brief Mutex-guarded deque with drop-oldest overflow.
 *
 * Coroutines wait through \ref IQueue::get; plain threads can block in
 * \ref pop_for. \ref shutdown wakes every blocked thread.
 *
 * \tparam T The type of elements stored in the queue.
 */
template <typename T>
class InProcessQueue : public IQueue<T> {
public:
    explicit InProcessQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    bool put(T value) override {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (capacity_ != 0 && queue_.size() >= capacity_) {
                queue_.pop_front();
                dropped = true;
            }
            queue_.push_back(std::move(value));
        }
        condition_.notify_one();
        return dropped;
    }

    std::optional<T> try_get() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /**
     * \brief Block the calling thread for up to `timeout`.
     * \return The front element, or nullopt on timeout or shutdown.
     */
    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait_for(lock, timeout, [this]() { return shutdown_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    std::size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const override { return capacity_; }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        condition_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;
    std::condition_variable condition_;
    std::size_t capacity_;
    bool shutdown_{false};
};

} // namespace takclient::pipeline
