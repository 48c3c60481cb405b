/**
 * \file SocketFactory.hpp
 * \brief Resolves a \ref Destination into a concrete \ref ChannelPair.
 * \ingroup socket_backend
 * \details Centralizes backend construction: socket creation, option setup,
 * binding and connecting. Low-level failures are translated into the
 * transport error taxonomy (`UnsupportedScheme`, `AddressError`, `BindError`).
 */
#pragma once

#include <memory>
#include "ChannelPair.hpp"
#include "config/Config.hpp"
#include "logger.hpp"
#include "transport/Destination.hpp"

namespace takclient::transport {

namespace posix { class TcpSocket; class UdpSocket; }

/** \brief Static factory for channel pairs.
 *  \ingroup socket_backend
 */
class SocketFactory {
public:
    /**
     * \brief Build the channel pair for `dest`.
     * \details `tls` destinations yield the connected TCP leg; wrap it with
     * `tls::TlsClientBuilder` to obtain the encrypted pair.
     * \throws UnsupportedScheme, AddressError, BindError
     */
    static ChannelPair resolve(const Destination& dest, const config::Config& cfg, std::shared_ptr<Logger> logger);

    /** \brief Connected, non-blocking TCP stream to `dest.host():dest.port()`.
     *  \throws AddressError on resolution or connect failure.
     */
    static std::shared_ptr<posix::TcpSocket> connect_tcp(const Destination& dest, const config::Config& cfg,
                                                         std::shared_ptr<Logger> logger);

private:
    // Static-only: prevent instantiation
    SocketFactory() = delete;

    static ChannelPair make_udp(const Destination& dest, const config::Config& cfg, std::shared_ptr<Logger> logger);
    static ChannelPair make_multicast(const Destination& dest, const config::Config& cfg,
                                      std::shared_ptr<Logger> logger);
    static ChannelPair make_log(const Destination& dest, std::shared_ptr<Logger> logger);
};

} // namespace takclient::transport
