/**
 * \file pipeline/TxWorker.cpp
 * \brief Transmit loop.
 * \ingroup pipeline_module
 */
#include "TxWorker.hpp"
#include "common/Errors.hpp"

#include <system_error>
#include <utility>

namespace takclient::pipeline {

TxWorker::TxWorker(std::shared_ptr<FrameQueue> queue, std::shared_ptr<transport::CoroChannelAdapter> channel,
                   std::shared_ptr<message::EventCodec> codec, int protocol, Pacing pacing,
                   std::shared_ptr<Logger> logger, std::chrono::milliseconds get_timeout)
    : queue_(std::move(queue)),
      channel_(std::move(channel)),
      codec_(std::move(codec)),
      protocol_(protocol),
      pacing_(std::move(pacing)),
      logger_(std::move(logger)),
      get_timeout_(get_timeout) {}

transport::Task<void> TxWorker::run() {
    auto ctx = channel_->context();
    const auto& description = channel_->channel().description;
    state_.store(WorkerState::Running, std::memory_order_release);
    if (logger_) logger_->debug("TX worker started on " + description + ", pacing " + pacing_.describe());

    while (!stop_requested_.load(std::memory_order_relaxed)) {
        auto item = co_await queue_->get(*ctx, get_timeout_);
        if (!item) continue;

        const std::string bytes = codec_->encode(*item, protocol_);
        std::size_t offset = 0;
        std::error_code failure;
        while (offset < bytes.size()) {
            try {
                offset += co_await channel_->async_write(bytes.data() + offset, bytes.size() - offset);
            } catch (const std::system_error& e) {
                failure = e.code();
            }
            if (failure) break;
        }
        if (failure) {
            state_.store(WorkerState::Stopped, std::memory_order_release);
            if (logger_) logger_->error("TX write to " + description + " failed: " + failure.message());
            throw ChannelIOError("Write to " + description, failure);
        }

        frames_sent_.fetch_add(1, std::memory_order_relaxed);
        bytes_sent_.fetch_add(bytes.size(), std::memory_order_relaxed);
        if (logger_) logger_->debug("TX " + std::to_string(bytes.size()) + " bytes to " + description);

        co_await ctx->sleep_for(pacing_.next_delay());
    }

    state_.store(WorkerState::Stopped, std::memory_order_release);
    if (logger_) {
        logger_->debug("TX worker stopped after " + std::to_string(frames_sent()) + " frames");
    }
}

} // namespace takclient::pipeline
