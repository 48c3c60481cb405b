/**
 * \file pipeline/TxWorker.hpp
 * \brief Coroutine that drains the outbound queue into the channel writer.
 * \ingroup pipeline_module
 */
#pragma once

#include "IQueue.hpp"
#include "Pacing.hpp"
#include "WorkerState.hpp"
#include "logger.hpp"
#include "message/EventCodec.hpp"
#include "transport/coro/CoroChannelAdapter.hpp"
#include "transport/coro/CoroTask.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace takclient::pipeline {

class TxWorker {
public:
    using FrameQueue = IQueue<message::DecodedFrame>;

    /**
     * \param protocol 0 (XML) or 1 (TAK protocol).
     * \param get_timeout Bound on each queue wait; a timeout only re-checks the stop flag.
     */
    TxWorker(std::shared_ptr<FrameQueue> queue, std::shared_ptr<transport::CoroChannelAdapter> channel,
             std::shared_ptr<message::EventCodec> codec, int protocol, Pacing pacing,
             std::shared_ptr<Logger> logger = nullptr,
             std::chrono::milliseconds get_timeout = std::chrono::seconds(1));

    /**
     * \brief Loop: get, encode, write all bytes, pace.
     * \details Runs on the channel's \ref transport::CoroIoContext.
     * \throws ChannelIOError (captured in the task) when a write fails.
     */
    transport::Task<void> run();

    /** \brief Ask the loop to exit at its next iteration boundary (thread-safe). */
    void stop() { stop_requested_.store(true, std::memory_order_relaxed); }

    WorkerState state() const { return state_.load(std::memory_order_acquire); }
    std::uint64_t frames_sent() const { return frames_sent_.load(std::memory_order_relaxed); }
    std::uint64_t bytes_sent() const { return bytes_sent_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<FrameQueue> queue_;
    std::shared_ptr<transport::CoroChannelAdapter> channel_;
    std::shared_ptr<message::EventCodec> codec_;
    int protocol_;
    Pacing pacing_;
    std::shared_ptr<Logger> logger_;
    std::chrono::milliseconds get_timeout_;

    std::atomic<WorkerState> state_{WorkerState::Idle};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::uint64_t> frames_sent_{0};
    std::atomic<std::uint64_t> bytes_sent_{0};
};

} // namespace takclient::pipeline
