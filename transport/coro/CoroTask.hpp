/**
 * \file CoroTask.hpp
 * \brief Minimal C++20 coroutine task type used by the coro module.
 * \details Provides a lightweight Task<T> and Task<void> that own the coroutine
 * handle and define explicit suspend semantics: initial_suspend = suspend_never
 * to begin execution immediately and final_suspend = suspend_always to leave the
 * coroutine suspended at completion until the handle is destroyed.
 *
 * Exception policy: an exception escaping the coroutine body is captured and
 * the task completes; the owner inspects it with failed() and rethrows it with
 * rethrow_if_failed() (or get_result() for Task<T>).
 */
#pragma once
#include <coroutine>
#include <exception>
#include <utility>

/**
 * \defgroup coro_module Coroutine I/O Module
 * \brief Event loop, task types, and channel adapter for coroutine-based non-blocking I/O.
 * \details Provides the building blocks for coroutine-style networking: `Task<T>` wrappers,
 * the `CoroIoContext` event loop, and `CoroChannelAdapter` awaitables over the channel roles.
 */

/** \defgroup coro_task Task Types
 *  \ingroup coro_module
 *  \brief Minimal coroutine task wrappers and semantics.
 */

/** \addtogroup coro_task
 *  @{ */

namespace takclient::transport {

/** \brief Simple coroutine task type for C++20 coroutines.
 *  \details Owns the coroutine handle; `initial_suspend = suspend_never` starts execution immediately.
 *  `final_suspend = suspend_always` keeps the frame alive until destruction.
 *  \see transport::CoroIoContext
 */
template<typename T = void>
struct Task {
    struct promise_type {
        /// Returns a Task that owns the coroutine handle
        Task<T> get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
        /// Start executing immediately on creation
        std::suspend_never initial_suspend() { return {}; }
        /// Suspend at final suspend; lifetime controlled by Task owner
        std::suspend_always final_suspend() noexcept { return {}; }
        /// Capture the exception; the task is complete and failed
        void unhandled_exception() { exception_ = std::current_exception(); }

        /// Store the result value for retrieval via Task::get_result()
        void return_value(T value) {
            result_ = std::move(value);
        }

        /// Access the stored result value
        T get_result() {
            if (exception_) std::rethrow_exception(exception_);
            return result_;
        }

        std::exception_ptr exception_;
    private:
        T result_{};
    };

    std::coroutine_handle<promise_type> h;

    /// Construct from an existing coroutine handle (Task takes ownership)
    explicit Task(std::coroutine_handle<promise_type> handle) : h(handle) {}
    /// Destroys the coroutine if still present (destroys frame)
    ~Task() { if (h) h.destroy(); }
    /// Move constructible; transfers handle ownership
    Task(Task&& other) noexcept : h(other.h) { other.h = nullptr; }
    /// Move assignable; destroys current handle then takes ownership
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (h) h.destroy();
            h = other.h;
            other.h = nullptr;
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    /// True if the coroutine has reached final suspend
    bool done() const { return !h || h.done(); }
    /// True if the body exited with an exception
    bool failed() const { return h && h.promise().exception_ != nullptr; }
    /// Rethrow the captured exception, if any
    void rethrow_if_failed() const { if (failed()) std::rethrow_exception(h.promise().exception_); }
    /// Access the underlying coroutine handle (do not destroy externally)
    std::coroutine_handle<promise_type> get_handle() const { return h; }

    /// Retrieve the result produced by the coroutine body
    T get_result() {
        return h.promise().get_result();
    }
};

/** \brief Specialization for `Task<void>` implementing the same lifetime semantics. */
template<>
struct Task<void> {
    struct promise_type {
        /// Returns a Task<void> that owns the coroutine handle
        Task<void> get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
        /// Start executing immediately on creation
        std::suspend_never initial_suspend() { return {}; }
        /// Suspend at final suspend; lifetime controlled by Task owner
        std::suspend_always final_suspend() noexcept { return {}; }
        /// Capture the exception; the task is complete and failed
        void unhandled_exception() { exception_ = std::current_exception(); }

        /// No result to return for void
        void return_void() {}

        std::exception_ptr exception_;
    };

    std::coroutine_handle<promise_type> h;

    /// Construct from an existing coroutine handle (Task takes ownership)
    explicit Task(std::coroutine_handle<promise_type> handle) : h(handle) {}
    /// Destroys the coroutine if still present (destroys frame)
    ~Task() { if (h) h.destroy(); }
    /// Move constructible; transfers handle ownership
    Task(Task&& other) noexcept : h(other.h) { other.h = nullptr; }
    /// Move assignable; destroys current handle then takes ownership
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (h) h.destroy();
            h = other.h;
            other.h = nullptr;
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    /// True if the coroutine has reached final suspend
    bool done() const { return !h || h.done(); }
    /// True if the body exited with an exception
    bool failed() const { return h && h.promise().exception_ != nullptr; }
    /// Rethrow the captured exception, if any
    void rethrow_if_failed() const { if (failed()) std::rethrow_exception(h.promise().exception_); }
    /// Access the underlying coroutine handle (do not destroy externally)
    std::coroutine_handle<promise_type> get_handle() const { return h; }
};

} // namespace takclient::transport

/** @} */
