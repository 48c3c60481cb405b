/**
 * \file pipeline/RxWorker.cpp
 * \brief Receive loop.
 * \ingroup pipeline_module
 */
#include "RxWorker.hpp"
#include "Pacing.hpp"
#include "common/Errors.hpp"

#include <system_error>
#include <utility>

namespace takclient::pipeline {

RxWorker::RxWorker(std::shared_ptr<FrameQueue> queue, std::shared_ptr<transport::CoroChannelAdapter> channel,
                   std::shared_ptr<message::EventCodec> codec, int protocol, std::shared_ptr<Logger> logger,
                   std::size_t max_frame_bytes)
    : queue_(std::move(queue)),
      channel_(std::move(channel)),
      codec_(std::move(codec)),
      protocol_(protocol),
      logger_(std::move(logger)),
      scanner_(max_frame_bytes),
      buffer_(kReadBufferBytes) {}

void RxWorker::deliver(std::string_view frame) {
    auto decoded = codec_->decode(frame, protocol_);
    frames_received_.fetch_add(1, std::memory_order_relaxed);
    if (logger_) {
        if (const auto* ev = std::get_if<message::CotEvent>(&decoded)) {
            logger_->debug("RX event type=" + ev->type + " uid=" + ev->uid);
        } else {
            logger_->debug("RX raw frame of " + std::to_string(frame.size()) + " bytes");
        }
    }
    if (queue_->put(std::move(decoded))) {
        frames_dropped_.fetch_add(1, std::memory_order_relaxed);
        if (logger_) {
            logger_->warning("RX queue full (capacity " + std::to_string(queue_->capacity()) +
                             "); dropped oldest frame");
        }
    }
}

transport::Task<void> RxWorker::run() {
    auto ctx = channel_->context();
    const auto& description = channel_->channel().description;
    const bool datagrams = channel_->message_oriented();
    state_.store(WorkerState::Running, std::memory_order_release);
    if (logger_) {
        logger_->debug("RX worker started on " + description + (datagrams ? " (datagrams)" : " (stream)"));
    }

    while (!stop_requested_.load(std::memory_order_relaxed)) {
        std::size_t n = 0;
        std::error_code failure;
        try {
            n = co_await channel_->async_read(buffer_.data(), buffer_.size());
        } catch (const std::system_error& e) {
            failure = e.code();
        }
        if (failure) {
            state_.store(WorkerState::Stopped, std::memory_order_release);
            if (logger_) logger_->error("RX read from " + description + " failed: " + failure.message());
            throw ChannelIOError("Read from " + description, failure);
        }
        bytes_received_.fetch_add(n, std::memory_order_relaxed);

        if (datagrams) {
            if (n > 0) deliver(std::string_view(buffer_.data(), n));
        } else {
            scanner_.feed(buffer_.data(), n);
            for (;;) {
                std::optional<std::string> frame;
                try {
                    frame = scanner_.next_frame();
                } catch (const FrameTooLong& e) {
                    if (logger_) logger_->warning(std::string{"RX discarded oversized frame: "} + e.what());
                    continue;
                }
                if (!frame) break;
                deliver(*frame);
            }
        }

        co_await ctx->sleep_for(Pacing::kMinimumDelay);
    }

    state_.store(WorkerState::Stopped, std::memory_order_release);
    if (logger_) {
        logger_->debug("RX worker stopped after " + std::to_string(frames_received()) + " frames");
    }
}

} // namespace takclient::pipeline
