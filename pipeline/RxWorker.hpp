/**
 * \file pipeline/RxWorker.hpp
 * \brief Coroutine that reads frames from the channel reader into the inbound queue.
 * \ingroup pipeline_module
 */
#pragma once

#include "IQueue.hpp"
#include "WorkerState.hpp"
#include "logger.hpp"
#include "message/EventCodec.hpp"
#include "message/FrameScanner.hpp"
#include "transport/coro/CoroChannelAdapter.hpp"
#include "transport/coro/CoroTask.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace takclient::pipeline {

class RxWorker {
public:
    using FrameQueue = IQueue<message::DecodedFrame>;

    static constexpr std::size_t kReadBufferBytes = 64 * 1024;

    /**
     * \param max_frame_bytes Scan window for stream channels; ignored for datagrams.
     */
    RxWorker(std::shared_ptr<FrameQueue> queue, std::shared_ptr<transport::CoroChannelAdapter> channel,
             std::shared_ptr<message::EventCodec> codec, int protocol, std::shared_ptr<Logger> logger = nullptr,
             std::size_t max_frame_bytes = config::defaults::MaxFrameBytes);

    /**
     * \brief Loop: read, split into frames, decode, enqueue.
     * \details One datagram is one frame. Stream input goes through a
     * \ref message::FrameScanner; an oversized frame is logged and skipped.
     * \throws ChannelIOError (captured in the task) when a read fails or the peer closes.
     */
    transport::Task<void> run();

    void stop() { stop_requested_.store(true, std::memory_order_relaxed); }

    WorkerState state() const { return state_.load(std::memory_order_acquire); }
    std::uint64_t frames_received() const { return frames_received_.load(std::memory_order_relaxed); }
    std::uint64_t bytes_received() const { return bytes_received_.load(std::memory_order_relaxed); }
    std::uint64_t frames_dropped() const { return frames_dropped_.load(std::memory_order_relaxed); }

private:
    void deliver(std::string_view frame);

    std::shared_ptr<FrameQueue> queue_;
    std::shared_ptr<transport::CoroChannelAdapter> channel_;
    std::shared_ptr<message::EventCodec> codec_;
    int protocol_;
    std::shared_ptr<Logger> logger_;
    message::FrameScanner scanner_;
    std::vector<char> buffer_;

    std::atomic<WorkerState> state_{WorkerState::Idle};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::uint64_t> frames_received_{0};
    std::atomic<std::uint64_t> bytes_received_{0};
    std::atomic<std::uint64_t> frames_dropped_{0};
};

} // namespace takclient::pipeline
