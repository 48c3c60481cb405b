/**
 * \file pipeline/IQueue.hpp
 * \brief Bounded FIFO interface shared by the transmit and receive workers.
 * \ingroup pipeline_module
 */
#pragma once

#include "transport/coro/coroIoContext.hpp"

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <optional>

/**
 * \defgroup pipeline_module Worker/Queue Pipeline
 * \brief Queues, pacing, transmit/receive workers and the session that drives them.
 */

namespace takclient::pipeline {

/**
 * \brief FIFO with an optional capacity; a full queue drops its oldest element.
 * \details Implementations are thread-safe so application threads may produce
 * while the workers consume on the coroutine loop.
 * \tparam T Element type.
 */
template <typename T>
class IQueue {
public:
    using Clock = transport::CoroIoContext::Clock;

    virtual ~IQueue() = default;

    /**
     * \brief Append `value`.
     * \return true if the queue was full and its oldest element was discarded.
     */
    virtual bool put(T value) = 0;
    /** \brief Remove the front element without waiting. */
    virtual std::optional<T> try_get() = 0;
    virtual std::size_t size() const = 0;
    /** \brief 0 means unbounded. */
    virtual std::size_t capacity() const = 0;

    bool empty() const { return size() == 0; }

    /**
     * \brief Awaitable get with timeout.
     * \details Resumes with the front element, or with nullopt once `timeout` has
     * elapsed. Waiting is a `QueueWait` pending operation on `ctx`.
     */
    auto get(transport::CoroIoContext& ctx, Clock::duration timeout) {
        struct GetAwaitable {
            IQueue* queue;
            transport::CoroIoContext* ctx;
            Clock::time_point deadline;
            std::optional<T> result;

            bool poll() {
                result = queue->try_get();
                return result.has_value() || Clock::now() >= deadline;
            }
            bool await_ready() { return poll(); }
            void await_suspend(std::coroutine_handle<> handle) {
                ctx->register_pending(transport::CoroIoContext::PendingOpCategory::QueueWait,
                                      [this]() { return poll(); }, handle);
            }
            std::optional<T> await_resume() { return std::move(result); }
        };
        return GetAwaitable{this, &ctx, Clock::now() + timeout, std::nullopt};
    }
};

} // namespace takclient::pipeline
