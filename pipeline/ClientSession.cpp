/**
 * \file pipeline/ClientSession.cpp
 * \brief Session setup, run loop and teardown.
 * \ingroup pipeline_module
 */
#include "ClientSession.hpp"
#include "InProcessQueue.hpp"
#include "Pacing.hpp"
#include "common/Errors.hpp"
#include "package/PreferencePackage.hpp"
#include "transport/Destination.hpp"
#include "transport/socket/SocketFactory.hpp"
#include "transport/tls/TlsClientBuilder.hpp"
#include "transport/tls/TlsIdentity.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace takclient::pipeline {

namespace keys = config::keys;
namespace defaults = config::defaults;

ClientSession::ClientSession(config::Config cfg, std::shared_ptr<Logger> logger,
                             std::shared_ptr<transport::tls::IPassphraseProvider> passphrases)
    : cfg_(std::move(cfg)),
      logger_(std::move(logger)),
      passphrases_(std::move(passphrases)),
      ctx_(std::make_shared<transport::CoroIoContext>()) {
    ctx_->set_logger(logger_);
}

ClientSession::~ClientSession() {
    ctx_->cancel_pending();
    if (channel_) channel_->close();
}

void ClientSession::import_package() {
    auto path = cfg_.get_or(keys::PrefPackage, "");
    if (path.empty()) return;
    package::PreferencePackage importer(logger_);
    auto result = importer.import(path);
    auto filled = result.merge_into(cfg_);
    package_workdir_ = result.workdir;
    if (logger_) {
        logger_->info("Imported preference package " + path + " (" + std::to_string(filled) +
                      " setting(s) applied, extracted to " + result.workdir.string() + ")");
    }
}

transport::ChannelPair ClientSession::open_channel(bool& multicast) {
    multicast = false;
    if (preset_channel_) return *preset_channel_;

    auto dest = transport::Destination::parse(cfg_.get_or(keys::CotUrl, defaults::CotUrl));
    multicast = dest.multicast();
    if (logger_) logger_->info("Connecting to " + dest.to_string());

    if (dest.scheme() == transport::Scheme::Tls) {
        auto identity = transport::tls::TlsIdentity::from_config(cfg_);
        auto tcp = transport::SocketFactory::connect_tcp(dest, cfg_, logger_);
        transport::tls::TlsClientBuilder builder(logger_, passphrases_);
        return builder.wrap(std::move(tcp), identity, dest.host());
    }
    return transport::SocketFactory::resolve(dest, cfg_, logger_);
}

std::size_t ClientSession::queue_size(const char* key, std::size_t fallback) const {
    auto value = cfg_.get_int(key, static_cast<std::int64_t>(fallback));
    if (value < 0) throw ConfigError(std::string(key) + " must not be negative");
    return static_cast<std::size_t>(value);
}

void ClientSession::setup() {
    if (setup_done_) return;

    import_package();

    protocol_ = static_cast<int>(cfg_.get_int(keys::TakProto, 0));
    if (protocol_ != 0 && protocol_ != 1) {
        throw ConfigError("TAK_PROTO must be 0 or 1, got " + std::to_string(protocol_));
    }
    auto max_frame = cfg_.get_int(keys::MaxFrameBytes, static_cast<std::int64_t>(defaults::MaxFrameBytes));
    if (max_frame <= 0) throw ConfigError("TAK_MAX_FRAME_BYTES must be positive");
    auto pacing = Pacing::from_config(cfg_);

    bool multicast = false;
    auto pair = open_channel(multicast);
    channel_ = std::make_shared<transport::CoroChannelAdapter>(std::move(pair), ctx_, logger_);

    const auto variant = multicast ? message::TakProtoVariant::Mesh : message::TakProtoVariant::Stream;
    codec_ = std::make_shared<message::EventCodec>(logger_, variant, payload_codec_);

    if (!tx_queue_) {
        tx_queue_ = std::make_shared<InProcessQueue<message::DecodedFrame>>(
            queue_size(keys::MaxOutQueue, defaults::MaxOutQueue));
    }
    if (!rx_queue_) {
        rx_queue_ = std::make_shared<InProcessQueue<message::DecodedFrame>>(
            queue_size(keys::MaxInQueue, defaults::MaxInQueue));
    }

    if (channel_->can_write()) {
        tx_ = std::make_unique<TxWorker>(tx_queue_, channel_, codec_, protocol_, std::move(pacing), logger_);
    }
    if (channel_->can_read()) {
        rx_ = std::make_unique<RxWorker>(rx_queue_, channel_, codec_, protocol_, logger_,
                                         static_cast<std::size_t>(max_frame));
    }

    if (tx_ && !cfg_.get_bool(keys::NoHello)) {
        tx_queue_->put(message::hello_event(cfg_.get_or(keys::CotHostId, "")));
    }

    if (logger_) {
        logger_->info("Session ready on " + channel_->channel().description + " (protocol " +
                      std::to_string(protocol_) + ", " + (tx_ ? "tx" : "no tx") + ", " +
                      (rx_ ? "rx" : "no rx") + ")");
    }
    setup_done_ = true;
}

void ClientSession::run() {
    if (ran_) throw std::logic_error("ClientSession::run may only be called once");
    ran_ = true;
    setup();

    std::vector<transport::Task<void>> tasks;
    if (tx_) tasks.push_back(tx_->run());
    if (rx_) tasks.push_back(rx_->run());
    for (auto& factory : task_factories_) tasks.push_back(factory(*this));

    auto any_done = [&tasks]() {
        return std::any_of(tasks.begin(), tasks.end(), [](const transport::Task<void>& t) { return t.done(); });
    };

    try {
        if (!tasks.empty() && !any_done() && !stop_requested()) ctx_->run_until(any_done);
    } catch (...) {
        teardown(tasks);
        throw;
    }

    std::exception_ptr failure;
    for (const auto& task : tasks) {
        if (task.failed()) {
            failure = task.get_handle().promise().exception_;
            break;
        }
    }
    teardown(tasks);
    if (failure) std::rethrow_exception(failure);
}

void ClientSession::teardown(std::vector<transport::Task<void>>& tasks) {
    if (tx_) tx_->stop();
    if (rx_) rx_->stop();
    // Suspended frames are referenced by pending operations; drop those first.
    ctx_->cancel_pending();
    tasks.clear();
    if (channel_) channel_->close();

    if (logger_) {
        std::string summary = "Session finished:";
        if (tx_) summary += " sent " + std::to_string(tx_->frames_sent()) + " frame(s)";
        if (rx_) summary += std::string(tx_ ? "," : "") + " received " + std::to_string(rx_->frames_received()) +
                            " frame(s)";
        logger_->info(summary);
    }
    ctx_->log_detailed_statistics();
}

void ClientSession::stop() {
    stop_requested_.store(true, std::memory_order_release);
    if (tx_) tx_->stop();
    if (rx_) rx_->stop();
    ctx_->stop();
}

} // namespace takclient::pipeline
