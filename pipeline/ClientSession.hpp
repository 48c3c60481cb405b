/**
 * \file pipeline/ClientSession.hpp
 * \brief Orchestrates one client connection: channel, queues, workers and application tasks.
 * \ingroup pipeline_module
 */
#pragma once

#include "IQueue.hpp"
#include "RxWorker.hpp"
#include "TxWorker.hpp"
#include "config/Config.hpp"
#include "logger.hpp"
#include "message/EventCodec.hpp"
#include "transport/coro/CoroChannelAdapter.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/coro/coroIoContext.hpp"
#include "transport/socket/ChannelPair.hpp"
#include "transport/tls/PassphraseProvider.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace takclient::pipeline {

/**
 * \brief One-shot session: \ref setup builds everything, \ref run drives it to completion.
 *
 * All tasks (transmit worker, receive worker, application tasks) share one
 * \ref transport::CoroIoContext driven by the thread calling \ref run. The session ends
 * when the first task finishes or fails, or when \ref stop is called. It never reconnects.
 */
class ClientSession {
public:
    using FrameQueue = IQueue<message::DecodedFrame>;
    /** \brief Creates an application coroutine; called once from \ref run. */
    using TaskFactory = std::function<transport::Task<void>(ClientSession&)>;

    explicit ClientSession(config::Config cfg, std::shared_ptr<Logger> logger = nullptr,
                           std::shared_ptr<transport::tls::IPassphraseProvider> passphrases = nullptr);
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // --- Optional collaborators; set before setup() ---
    void set_tx_queue(std::shared_ptr<FrameQueue> queue) { tx_queue_ = std::move(queue); }
    void set_rx_queue(std::shared_ptr<FrameQueue> queue) { rx_queue_ = std::move(queue); }
    void set_payload_codec(std::shared_ptr<message::ITakPayloadCodec> codec) { payload_codec_ = std::move(codec); }
    /** \brief Use an already built channel instead of resolving `COT_URL`. */
    void set_channel(transport::ChannelPair channel) { preset_channel_ = std::move(channel); }
    void add_task(TaskFactory factory) { task_factories_.push_back(std::move(factory)); }

    /**
     * \brief Import the preference package, resolve the channel, create queues and workers,
     * and enqueue the hello event. Idempotent.
     * \throws PackageError, TransportError, TlsError and ConfigError for bad settings.
     */
    void setup();

    /**
     * \brief setup() if needed, then run every task until one ends or \ref stop is called.
     * \throws The first task failure (normally \ref ChannelIOError).
     */
    void run();

    /** \brief Request the session to end (thread-safe, idempotent). */
    void stop();
    bool stop_requested() const { return stop_requested_.load(std::memory_order_acquire); }

    const config::Config& config() const { return cfg_; }
    std::shared_ptr<Logger> logger() const { return logger_; }
    std::shared_ptr<transport::CoroIoContext> context() const { return ctx_; }
    std::shared_ptr<FrameQueue> tx_queue() const { return tx_queue_; }
    std::shared_ptr<FrameQueue> rx_queue() const { return rx_queue_; }
    std::shared_ptr<transport::CoroChannelAdapter> channel() const { return channel_; }
    int protocol() const { return protocol_; }
    const TxWorker* tx_worker() const { return tx_.get(); }
    const RxWorker* rx_worker() const { return rx_.get(); }
    /** \brief Extraction directory of the imported preference package, if any. */
    const std::optional<std::filesystem::path>& package_workdir() const { return package_workdir_; }

private:
    void import_package();
    transport::ChannelPair open_channel(bool& multicast);
    std::size_t queue_size(const char* key, std::size_t fallback) const;
    void teardown(std::vector<transport::Task<void>>& tasks);

    config::Config cfg_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<transport::tls::IPassphraseProvider> passphrases_;
    std::shared_ptr<transport::CoroIoContext> ctx_;

    std::optional<transport::ChannelPair> preset_channel_;
    std::shared_ptr<message::ITakPayloadCodec> payload_codec_;
    std::shared_ptr<message::EventCodec> codec_;
    std::shared_ptr<transport::CoroChannelAdapter> channel_;
    std::shared_ptr<FrameQueue> tx_queue_;
    std::shared_ptr<FrameQueue> rx_queue_;
    std::unique_ptr<TxWorker> tx_;
    std::unique_ptr<RxWorker> rx_;
    std::vector<TaskFactory> task_factories_;
    std::optional<std::filesystem::path> package_workdir_;

    int protocol_{0};
    bool setup_done_{false};
    bool ran_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace takclient::pipeline
