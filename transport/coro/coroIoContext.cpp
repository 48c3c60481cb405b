/**
 * \file coroIoContext.cpp
 * \brief Operational implementation for `transport::CoroIoContext`.
 * \details Pending operations are stolen in one batch (swap with a local vector)
 * so resumed coroutines can register new work without deadlocking. A short
 * timed wait (`poll_interval_`) backs idle passes and keeps `stop()` responsive.
 */
#include "coroIoContext.hpp"
#include <algorithm>
#include <iterator>

namespace takclient::transport {

CoroIoContext::CoroIoContext() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    for (auto& hist : completion_attempt_histograms_) {
        hist.assign(max_tracked_attempts_, 0);
    }
}

CoroIoContext::~CoroIoContext() { cancel_pending(); }

void CoroIoContext::set_logger(std::shared_ptr<Logger> logger) { logger_ = std::move(logger); }
std::shared_ptr<Logger> CoroIoContext::get_logger() const { return logger_; }

void CoroIoContext::run() {
    run_until([this]() {
        return outstanding_work_.load(std::memory_order_acquire) == 0 && pending_count() == 0;
    });
}

bool CoroIoContext::run_until(const std::function<bool()>& done) {
    if (logger_) logger_->debug("CoroIoContext loop started");
    bool finished = false;
    while (!stop_requested_.load(std::memory_order_acquire)) {
        if (done && done()) {
            finished = true;
            break;
        }
        bool progressed = process_pending_ops();
        if (done && done()) {
            finished = true;
            break;
        }
        if (!progressed) {
            std::unique_lock<std::mutex> lk(pending_mutex_);
            pending_cv_.wait_for(lk, poll_interval_, [this]() {
                return stop_requested_.load(std::memory_order_acquire);
            });
        }
    }
    if (logger_) logger_->debug(std::string("CoroIoContext loop finished (") + (finished ? "done" : "stopped") + ")");
    return finished;
}

void CoroIoContext::stop() {
    stop_requested_.store(true, std::memory_order_release);
    wake_();
}

bool CoroIoContext::process_pending_ops() {
    std::vector<PendingOp> fetched;
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        if (pending_ops_.empty()) return false;
        fetched.swap(pending_ops_);
    }

    bool progressed = false;
    std::vector<PendingOp> requeue;
    for (size_t i = 0; i < fetched.size(); ++i) {
        auto& op = fetched[i];
        if (stop_requested_.load(std::memory_order_acquire)) {
            // Keep the remainder registered so cancel_pending() sees every live handle.
            requeue.insert(requeue.end(), std::make_move_iterator(fetched.begin() + static_cast<std::ptrdiff_t>(i)),
                           std::make_move_iterator(fetched.end()));
            break;
        }
        // Exceptions from try_complete propagate to the run_until caller; they are programming errors.
        bool completed = op.try_complete ? op.try_complete() : true;
        if (completed) {
            progressed = true;
            record_completion_(op.category, op.attempts);
            auto h = op.handle;
            if (h && !h.done()) h.resume();
        } else {
            if (op.attempts < std::numeric_limits<uint16_t>::max()) ++op.attempts;
            requeue.push_back(std::move(op));
        }
    }

    if (!requeue.empty()) {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        pending_ops_.reserve(pending_ops_.size() + requeue.size());
        for (auto& op : requeue) pending_ops_.push_back(std::move(op));
    }
    return progressed;
}

void CoroIoContext::record_completion_(PendingOpCategory category, size_t failures) {
    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    total_operations_processed_++;
    size_t idx = std::min<size_t>(failures, max_tracked_attempts_ - 1);
    size_t cat_idx = static_cast<size_t>(category);
    if (cat_idx >= category_count_) cat_idx = 0;
    completion_attempt_histograms_[cat_idx][idx]++;
}

void CoroIoContext::register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    register_pending(PendingOpCategory::Generic, std::move(try_complete), handle);
}

void CoroIoContext::register_pending(PendingOpCategory category, std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        PendingOp op{};
        op.try_complete = std::move(try_complete);
        op.handle = handle;
        op.category = category;
        pending_ops_.push_back(std::move(op));
    }
    wake_();
}

void CoroIoContext::cancel_pending() {
    std::vector<PendingOp> dropped;
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        dropped.swap(pending_ops_);
    }
    if (!dropped.empty() && logger_) {
        logger_->debug("CoroIoContext cancelled " + std::to_string(dropped.size()) + " pending operation(s)");
    }
}

size_t CoroIoContext::pending_count() const {
    std::lock_guard<std::mutex> lk(pending_mutex_);
    return pending_ops_.size();
}

std::array<std::vector<size_t>, CoroIoContext::category_count_> CoroIoContext::get_completion_attempt_histograms_by_category() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return completion_attempt_histograms_;
}

std::string CoroIoContext::format_detailed_statistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    std::string out;
    out += "CoroIoContext statistics\n";
    out += "Total operations processed: " + std::to_string(total_operations_processed_) + "\n";
    auto cat_name = [](PendingOpCategory c) -> const char* {
        switch (c) {
            case PendingOpCategory::Generic: return "Generic";
            case PendingOpCategory::Read: return "Read";
            case PendingOpCategory::Write: return "Write";
            case PendingOpCategory::QueueWait: return "QueueWait";
            case PendingOpCategory::Timer: return "Timer";
            default: return "Unknown";
        }
    };
    bool any_hist = false;
    for (size_t cat = 0; cat < category_count_; ++cat) {
        const auto& hist = completion_attempt_histograms_[cat];
        bool has_data = std::any_of(hist.begin(), hist.end(), [](size_t v) { return v != 0; });
        if (!has_data) continue;
        any_hist = true;
        out += std::string("Completion attempt distribution [") + cat_name(static_cast<PendingOpCategory>(cat)) + "]:\n";
        for (size_t i = 0; i < hist.size(); ++i) {
            size_t count = hist[i];
            if (count == 0) continue;
            if (i < hist.size() - 1) {
                out += "  " + std::to_string(i) + " : " + std::to_string(count) + "\n";
            } else {
                out += "  >=" + std::to_string(i) + " : " + std::to_string(count) + "\n";
            }
        }
    }
    if (!any_hist) out += "(no histogram data)\n";
    return out;
}

void CoroIoContext::log_detailed_statistics() const {
    if (!logger_) return;
    logger_->debug(format_detailed_statistics());
}

size_t CoroIoContext::get_total_operations_processed() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return total_operations_processed_;
}

void CoroIoContext::reset_statistics() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    total_operations_processed_ = 0;
    for (auto& hist : completion_attempt_histograms_) std::fill(hist.begin(), hist.end(), 0);
}

// WorkGuard
CoroIoContext::WorkGuard::WorkGuard(std::shared_ptr<CoroIoContext> loop) : loop_(std::move(loop)) { increment_(); }
CoroIoContext::WorkGuard::WorkGuard(WorkGuard&& other) noexcept : loop_(std::move(other.loop_)), active_(other.active_) { other.active_ = false; }
CoroIoContext::WorkGuard& CoroIoContext::WorkGuard::operator=(WorkGuard&& other) noexcept {
    if (this != &other) {
        decrement_();
        loop_ = std::move(other.loop_);
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}
CoroIoContext::WorkGuard::~WorkGuard() { decrement_(); }
void CoroIoContext::WorkGuard::increment_() { if (loop_ && active_) { loop_->outstanding_work_.fetch_add(1, std::memory_order_relaxed); loop_->wake_(); } }
void CoroIoContext::WorkGuard::decrement_() { if (loop_ && active_) { active_ = false; if (loop_->outstanding_work_.fetch_sub(1, std::memory_order_acq_rel) == 1) loop_->wake_(); } }

} // namespace takclient::transport
