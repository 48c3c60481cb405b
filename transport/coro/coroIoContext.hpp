/**
 * \file coroIoContext.hpp
 * \brief Coroutine-aware event loop with pending-operation polling and timers.
 * \details Pending operations register non-blocking `try_complete()` functors.
 * The loop, driven by the calling thread, polls them and resumes the associated
 * coroutine handle when ready. A short timed wait between idle passes bounds
 * CPU use; `stop()` may be called from any thread. Per-category completion
 * histograms are collected for diagnostics.
 */
#pragma once

#include "logger.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace takclient::transport {

/** \defgroup coro_context I/O Context
 *  \ingroup coro_module
 *  \brief Event-loop for coroutine scheduling and pending operation polling.
 */

/** \brief Coroutine-aware event loop that polls pending operations and resumes coroutines.
 *  \ingroup coro_context
 */
class CoroIoContext : public std::enable_shared_from_this<CoroIoContext> {
public:
	using Clock = std::chrono::steady_clock;

	CoroIoContext();
	~CoroIoContext();

	/** \brief Classification for per-category completion histograms. */
	enum class PendingOpCategory : uint8_t { Generic = 0, Read, Write, QueueWait, Timer, Count };
	static constexpr size_t category_count_ = static_cast<size_t>(PendingOpCategory::Count);

	// --- Lifecycle ---
	/** \brief Run on the current thread until no work is outstanding or `stop()` is called. */
	void run();
	/**
	 * \brief Run on the current thread until `done()` returns true or `stop()` is called.
	 * \return true if `done()` became true, false if stopped.
	 */
	bool run_until(const std::function<bool()>& done);
	/** \brief Request the running loop to return (thread-safe). */
	void stop();
	/** \brief Clear a previous stop request so the context can run again. */
	void restart() { stop_requested_.store(false, std::memory_order_release); }
	bool stopped() const { return stop_requested_.load(std::memory_order_acquire); }

	// --- Logger ---
	void set_logger(std::shared_ptr<Logger> logger);
	std::shared_ptr<Logger> get_logger() const;

	/** \brief Idle wait between passes that completed nothing (default 1 ms). */
	void set_poll_interval(std::chrono::milliseconds interval) { poll_interval_ = interval; }

	// --- Pending operations registration ---
	/** \brief Register a pending operation; resumes `handle` when the predicate returns true. */
	void register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle);
	/** \brief Register a categorized pending operation for metrics. */
	void register_pending(PendingOpCategory category, std::function<bool()> try_complete, std::coroutine_handle<> handle);
	/**
	 * \brief Drop every pending operation without resuming it.
	 * \details Must be called before destroying the suspended coroutines' frames.
	 */
	void cancel_pending();
	size_t pending_count() const;

	/** \brief Awaitable that resumes once `duration` has elapsed. */
	auto sleep_for(Clock::duration duration) {
		struct SleepAwaitable {
			CoroIoContext* ctx;
			Clock::time_point deadline;
			bool await_ready() const noexcept { return Clock::now() >= deadline; }
			void await_suspend(std::coroutine_handle<> handle) {
				ctx->register_pending(PendingOpCategory::Timer, [d = deadline]() { return Clock::now() >= d; }, handle);
			}
			void await_resume() const noexcept {}
		};
		return SleepAwaitable{this, Clock::now() + duration};
	}

	// --- Work guard ---
	/** \brief RAII object that increments outstanding work to keep `run()` alive. */
	class WorkGuard {
	public:
		explicit WorkGuard(std::shared_ptr<CoroIoContext> loop);
		WorkGuard(const WorkGuard&) = delete;
		WorkGuard& operator=(const WorkGuard&) = delete;
		WorkGuard(WorkGuard&& other) noexcept;
		WorkGuard& operator=(WorkGuard&& other) noexcept;
		~WorkGuard();
		bool active() const noexcept { return active_; }
	private:
		void increment_();
		void decrement_();
		std::shared_ptr<CoroIoContext> loop_;
		bool active_{true};
	};
	WorkGuard make_work_guard() { return WorkGuard(shared_from_this()); }

	// --- Statistics ---
	/** \brief Per-category completion attempt histograms (copy).
	 *  \ingroup coro_stats
	 */
	std::array<std::vector<size_t>, category_count_> get_completion_attempt_histograms_by_category() const;
	/** \brief Human-readable multi-line summary.
	 *  \ingroup coro_stats
	 */
	std::string format_detailed_statistics() const;
	/** \brief Log the summary at debug level (if a logger is set). */
	void log_detailed_statistics() const;
	size_t get_total_operations_processed() const;
	void reset_statistics();

private:
	/** \brief Process all currently pending operations once; returns true if any completed. */
	bool process_pending_ops();
	void record_completion_(PendingOpCategory category, size_t failures);

	struct PendingOp {
		std::function<bool()> try_complete;      ///< Readiness predicate/work attempt
		std::coroutine_handle<> handle;          ///< Coroutine to resume on success
		uint16_t attempts{0};                    ///< Failed attempts before success
		PendingOpCategory category{PendingOpCategory::Generic};
	};
	std::vector<PendingOp> pending_ops_;
	mutable std::mutex pending_mutex_;
	std::condition_variable pending_cv_;
	void wake_() { pending_cv_.notify_one(); }

	std::atomic<bool> stop_requested_{false};
	std::shared_ptr<Logger> logger_;
	std::chrono::milliseconds poll_interval_{std::chrono::milliseconds(1)};
	std::atomic<size_t> outstanding_work_{0};

	mutable std::mutex stats_mutex_;
	size_t total_operations_processed_{0};
	static constexpr size_t max_tracked_attempts_ = 1024; ///< Buckets 0..1023 (1023 aggregates 1023+)
	std::array<std::vector<size_t>, category_count_> completion_attempt_histograms_{};
};

} // namespace takclient::transport
