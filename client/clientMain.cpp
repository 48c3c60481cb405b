/**
 * \file client/clientMain.cpp
 * \brief Entrypoint for the tak-client process: configuration, session and signal handling.
 */

#include "ClientOptions.hpp"
#include "common/Errors.hpp"
#include "logger.hpp"
#include "message/CotEvent.hpp"
#include "pipeline/ClientSession.hpp"
#include "transport/tls/PassphraseProvider.hpp"
#include <options/Options.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <variant>

using takclient::pipeline::ClientSession;
using takclient::transport::Task;
namespace keys = takclient::config::keys;

namespace {

std::atomic<int> g_signal{0};

void on_signal(int signo) {
    g_signal.store(signo);
}

/** \brief Turns SIGINT/SIGTERM into a session stop. */
Task<void> watch_signals(ClientSession& session) {
    while (!session.stop_requested()) {
        if (int signo = g_signal.load(); signo != 0) {
            if (auto logger = session.logger()) {
                logger->info("Received signal " + std::to_string(signo) + "; stopping");
            }
            session.stop();
            co_return;
        }
        co_await session.context()->sleep_for(std::chrono::milliseconds(100));
    }
}

/** \brief Drains the inbound queue into the log. */
Task<void> log_received(ClientSession& session) {
    auto logger = session.logger();
    while (!session.stop_requested()) {
        auto frame = co_await session.rx_queue()->get(*session.context(), std::chrono::seconds(1));
        if (!frame || !logger) continue;
        if (const auto* ev = std::get_if<takclient::message::CotEvent>(&*frame)) {
            logger->info("Received " + ev->type + " from " + ev->uid);
        } else {
            logger->info("Received " + std::to_string(std::get<takclient::message::RawFrame>(*frame).bytes.size()) +
                         " byte frame that is not a CoT event");
        }
    }
}

/** \brief Periodic position report. */
Task<void> send_beacon(ClientSession& session, takclient::client::ClientOptions opts) {
    const auto& cfg = session.config();
    const auto uid = cfg.get_or(keys::CotHostId, "takclient");
    const auto stale = std::chrono::seconds(cfg.get_int(keys::CotStale, takclient::config::defaults::CotStaleSeconds));
    const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(opts.beacon_interval_s));
    const auto callsign = opts.callsign.empty() ? uid : opts.callsign;
    while (!session.stop_requested()) {
        auto ev = takclient::message::make_event("a-f-G-U-C", uid, stale, {opts.lat, opts.lon}, callsign);
        if (session.tx_queue()->put(std::move(ev)) && session.logger()) {
            session.logger()->warning("Outbound queue full; dropped oldest event");
        }
        co_await session.context()->sleep_for(interval);
    }
}

} // namespace

/** \brief Entrypoint for the tak-client binary. */
int main(int argc, char* argv[]) {
    std::string opt_err;
    auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opt_err);
    if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
        return 0;
    }
    if (parse_res == shared_opts::Options::ParseResult::Error) {
        std::cerr << "tak-client option parse error: " << opt_err << std::endl;
        return 2;
    }

    namespace client_opts = takclient::client::client_opts;
    try {
        auto cfg = client_opts::build_config();

        // stdout may carry CoT output (log:stdout), so diagnostics go to stderr.
        auto logger = std::make_shared<Logger>("tak-client");
        auto sink = std::make_shared<StderrSink>();
        sink->set_level(cfg.get_bool(keys::Debug) ? LogLevel::Debug : LogLevel::Info);
        logger->add_sink(sink);

        auto passphrases = std::make_shared<takclient::transport::tls::InteractivePassphraseProvider>();
        ClientSession session(cfg, logger, passphrases);

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        session.add_task(watch_signals);
        session.add_task(log_received);
        auto client = client_opts::get_client_options();
        if (client.beacon_interval_s > 0) {
            session.add_task([client](ClientSession& s) { return send_beacon(s, client); });
        }

        session.run();
        return 0;
    } catch (const takclient::Error& e) {
        std::cerr << takclient::to_string(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "tak-client error: " << e.what() << std::endl;
        return 1;
    }
}
