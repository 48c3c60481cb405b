/**
 * \file CoroChannelAdapter.hpp
 * \brief Adds C++20 coroutine awaitable operations to a \ref ChannelPair.
 * \details Wraps the reader and writer ends and provides awaitable read/write
 * operations that resume on the owning \ref CoroIoContext. Uses composition:
 * the channel roles stay plain non-blocking objects.
 */
#pragma once

#include "logger.hpp"
#include "coroIoContext.hpp"
#include "transport/socket/ChannelPair.hpp"
#include <coroutine>
#include <memory>
#include <system_error>

namespace takclient::transport {

/** \defgroup coro_adapter Channel Adapter
 *  \ingroup coro_module
 *  \brief Awaitable channel operations.
 */

/**
 * \brief Coroutine-aware wrapper adding awaitable operations to a channel pair.
 * \details
 * - Fast-path: attempts the non-blocking `try_*` call in `await_ready()` to avoid suspension
 * - Slow-path: unfinished operations are registered with `CoroIoContext` and resumed when ready
 * - Errors surface from `await_resume()` as `std::system_error`
 * - \invariant At most one in-flight operation per direction
 * \ingroup coro_adapter
 */
class CoroChannelAdapter : public std::enable_shared_from_this<CoroChannelAdapter> {
public:
    CoroChannelAdapter(ChannelPair channel, std::shared_ptr<CoroIoContext> ctx, std::shared_ptr<Logger> logger = nullptr)
        : channel_(std::move(channel)), context_(std::move(ctx)), logger_(std::move(logger)) {}

    const ChannelPair& channel() const { return channel_; }
    bool can_read() const { return channel_.has_reader(); }
    bool can_write() const { return channel_.has_writer(); }
    /** \brief True if the read side yields whole datagrams. */
    bool message_oriented() const { return channel_.reader && channel_.reader->message_oriented(); }
    void close() { channel_.close(); }

    /** \brief Asynchronously read up to `size` bytes (one datagram on message-oriented readers). */
    auto async_read(void* buffer, size_t size) {
        struct ReadAwaitable {
            std::shared_ptr<CoroChannelAdapter> adapter;
            void* buffer;
            size_t size;
            bool await_ready() const noexcept {
                adapter->read_op_.prepare(buffer, size);
                return adapter->try_complete_read();
            }
            void await_suspend(std::coroutine_handle<> handle) {
                adapter->context_->register_pending(CoroIoContext::PendingOpCategory::Read, [a = adapter]() {
                    return a->try_complete_read();
                }, handle);
            }
            size_t await_resume() {
                if (adapter->read_op_.error) {
                    throw std::system_error(adapter->read_op_.error, "Async read operation failed");
                }
                return adapter->read_op_.transferred;
            }
        };
        return ReadAwaitable{shared_from_this(), buffer, size};
    }

    /** \brief Asynchronously write up to `size` bytes; may complete partially on streams. */
    auto async_write(const void* buffer, size_t size) {
        struct WriteAwaitable {
            std::shared_ptr<CoroChannelAdapter> adapter;
            const void* buffer;
            size_t size;
            bool await_ready() const noexcept {
                adapter->write_op_.prepare(const_cast<void*>(buffer), size);
                return adapter->try_complete_write();
            }
            void await_suspend(std::coroutine_handle<> handle) {
                adapter->context_->register_pending(CoroIoContext::PendingOpCategory::Write, [a = adapter]() {
                    return a->try_complete_write();
                }, handle);
            }
            size_t await_resume() {
                if (adapter->write_op_.error) {
                    throw std::system_error(adapter->write_op_.error, "Async write operation failed");
                }
                return adapter->write_op_.transferred;
            }
        };
        return WriteAwaitable{shared_from_this(), buffer, size};
    }

    /** \brief Attempt to advance the read; true when finished (success or error). */
    bool try_complete_read();
    /** \brief Attempt to advance the write; true when finished (success or error). */
    bool try_complete_write();

    std::shared_ptr<CoroIoContext> context() const { return context_; }

private:
    struct OperationState {
        void* buffer{nullptr};
        size_t size{0};
        size_t transferred{0};
        std::error_code error;
        void prepare(void* b, size_t s) { buffer = b; size = s; transferred = 0; error.clear(); }
    };

    ChannelPair channel_;
    std::shared_ptr<CoroIoContext> context_;
    std::shared_ptr<Logger> logger_;
    OperationState read_op_;
    OperationState write_op_;
};

} // namespace takclient::transport
