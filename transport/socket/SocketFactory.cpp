/**
 * \file SocketFactory.cpp
 * \brief Destination resolution for TCP, UDP (unicast, broadcast, multicast) and log channels.
 * \ingroup socket_backend
 */
#include "SocketFactory.hpp"
#include "common/Errors.hpp"
#include "posix/LogWriter.hpp"
#include "posix/SocketAddress.hpp"
#include "posix/TcpSocket.hpp"
#include "posix/UdpSocket.hpp"

#include <netinet/in.h>

namespace takclient::transport {

using posix::SocketAddress;

namespace {

int ip_family(const config::Config& cfg) {
    return posix::parse_ip_family(cfg.get_or(config::keys::IpFamily, ""));
}

SocketAddress resolve_one(const std::string& host, int port, int family, std::shared_ptr<Logger>& logger) {
    std::error_code ec;
    auto addrs = SocketAddress::resolve(host, port, family, SOCK_DGRAM, ec);
    if (ec) {
        if (logger) logger->error("Cannot resolve " + host + ":" + std::to_string(port) + ": " + ec.message());
        throw AddressError("Cannot resolve '" + host + ":" + std::to_string(port) + "': " + ec.message());
    }
    return addrs.front();
}

SocketAddress wildcard_for(int family, int port) {
    SocketAddress a;
    if (family == AF_INET6) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&a.storage);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_addr = in6addr_any;
        sin6->sin6_port = htons(static_cast<uint16_t>(port));
        a.length = sizeof(sockaddr_in6);
    } else {
        auto* sin = reinterpret_cast<sockaddr_in*>(&a.storage);
        sin->sin_family = AF_INET;
        sin->sin_addr.s_addr = htonl(INADDR_ANY);
        sin->sin_port = htons(static_cast<uint16_t>(port));
        a.length = sizeof(sockaddr_in);
    }
    return a;
}

void check_bind(const std::error_code& ec, const std::string& what) {
    if (ec) throw BindError(what + ": " + ec.message());
}

} // namespace

ChannelPair SocketFactory::resolve(const Destination& dest, const config::Config& cfg,
                                   std::shared_ptr<Logger> logger) {
    switch (dest.scheme()) {
        case Scheme::Tcp:
        case Scheme::Tls: {
            auto tcp = connect_tcp(dest, cfg, logger);
            ChannelPair pair{tcp, tcp, dest.to_string()};
            return pair;
        }
        case Scheme::Udp:
            if (dest.multicast()) return make_multicast(dest, cfg, std::move(logger));
            return make_udp(dest, cfg, std::move(logger));
        case Scheme::Log:
        case Scheme::File:
            return make_log(dest, std::move(logger));
    }
    throw UnsupportedScheme("Unsupported destination '" + dest.to_string() + "'");
}

std::shared_ptr<posix::TcpSocket> SocketFactory::connect_tcp(const Destination& dest, const config::Config& cfg,
                                                             std::shared_ptr<Logger> logger) {
    auto tcp = std::make_shared<posix::TcpSocket>(ip_family(cfg), logger);
    std::error_code ec;
    tcp->connect(dest.host(), dest.port(), ec);
    if (ec) {
        throw AddressError("Cannot connect to " + dest.host() + ":" + std::to_string(dest.port()) + ": " +
                           ec.message());
    }
    if (logger) logger->info("Connected to " + dest.to_string() + " from " + tcp->local_endpoint());
    return tcp;
}

ChannelPair SocketFactory::make_udp(const Destination& dest, const config::Config& cfg,
                                    std::shared_ptr<Logger> logger) {
    const auto peer = resolve_one(dest.host(), dest.port(), ip_family(cfg), logger);
    auto udp = std::make_shared<posix::UdpSocket>(logger);
    std::error_code ec;
    udp->open(peer.family(), ec);
    check_bind(ec, "Cannot create UDP socket");

    if (dest.broadcast()) {
        udp->enable_broadcast(ec);
        check_bind(ec, "Cannot enable SO_BROADCAST");
        udp->set_destination(peer);
        if (dest.write_only()) {
            if (logger) logger->info("UDP broadcast writer to " + peer.to_string());
            return ChannelPair{nullptr, udp, dest.to_string()};
        }
        udp->set_reuse_address(ec);
        check_bind(ec, "Cannot set SO_REUSEADDR");
        udp->bind(wildcard_for(peer.family(), dest.port()), ec);
        check_bind(ec, "Cannot bind broadcast port " + std::to_string(dest.port()));
        if (logger) logger->info("UDP broadcast channel on port " + std::to_string(dest.port()));
        return ChannelPair{udp, udp, dest.to_string()};
    }

    if (!dest.write_only()) {
        const auto local_host = cfg.get_or(config::keys::MulticastLocalAddr, config::defaults::MulticastLocalAddr);
        SocketAddress local = peer.family() == AF_INET ? resolve_one(local_host, 0, AF_INET, logger)
                                                       : wildcard_for(peer.family(), 0);
        udp->bind(local, ec);
        check_bind(ec, "Cannot bind local UDP address " + local.to_string());
    }
    udp->connect(peer, ec);
    if (ec) throw AddressError("Cannot connect UDP socket to " + peer.to_string() + ": " + ec.message());

    if (dest.write_only()) {
        if (logger) logger->info("UDP write-only channel to " + peer.to_string());
        return ChannelPair{nullptr, udp, dest.to_string()};
    }
    if (logger) logger->info("UDP channel " + udp->local_endpoint() + " <-> " + peer.to_string());
    return ChannelPair{udp, udp, dest.to_string()};
}

ChannelPair SocketFactory::make_multicast(const Destination& dest, const config::Config& cfg,
                                          std::shared_ptr<Logger> logger) {
    if (!Destination::is_multicast_address(dest.host()) && logger) {
        logger->warning("'+multicast' is deprecated; use a multicast group address with udp://");
    }
    const auto group = resolve_one(dest.host(), dest.port(), ip_family(cfg), logger);
    const auto local_addr = cfg.get_or(config::keys::MulticastLocalAddr, config::defaults::MulticastLocalAddr);
    const auto ttl_setting = cfg.get_int(config::keys::MulticastTtl, config::defaults::MulticastTtl);
    if (ttl_setting < 0 || ttl_setting > 255) {
        throw ConfigError("TAK_MULTICAST_TTL must be between 0 and 255, got " + std::to_string(ttl_setting));
    }
    const int ttl = static_cast<int>(ttl_setting);

    auto udp = std::make_shared<posix::UdpSocket>(logger);
    std::error_code ec;
    udp->open(group.family(), ec);
    check_bind(ec, "Cannot create multicast socket");
    udp->set_reuse_address(ec);
    check_bind(ec, "Cannot set SO_REUSEADDR");
    udp->set_multicast_ttl(ttl, ec);
    check_bind(ec, "Cannot set multicast TTL " + std::to_string(ttl));

    if (dest.write_only()) {
        udp->set_multicast_interface(local_addr, ec);
        check_bind(ec, "Cannot set multicast interface " + local_addr);
        udp->connect(group, ec);
        if (ec) throw AddressError("Cannot connect multicast socket to " + group.to_string() + ": " + ec.message());
        if (logger) logger->info("Multicast write-only channel to " + group.to_string() + " (ttl " +
                                 std::to_string(ttl) + ")");
        return ChannelPair{nullptr, udp, dest.to_string()};
    }

    udp->bind(wildcard_for(group.family(), dest.port()), ec);
    check_bind(ec, "Cannot bind multicast port " + std::to_string(dest.port()));
    udp->join_group(group, local_addr, ec);
    check_bind(ec, "Cannot join multicast group " + dest.host() + " on " + local_addr);
    udp->set_destination(group);
    if (logger) logger->info("Multicast channel joined " + group.to_string() + " on " + local_addr);
    return ChannelPair{udp, udp, dest.to_string()};
}

ChannelPair SocketFactory::make_log(const Destination& dest, std::shared_ptr<Logger> logger) {
    if (dest.scheme() == Scheme::File) {
        std::error_code ec;
        auto writer = posix::LogWriter::open_file(dest.path(), logger, ec);
        if (!writer) throw BindError("Cannot open output file " + dest.path() + ": " + ec.message());
        return ChannelPair{nullptr, writer, dest.to_string()};
    }
    auto target = dest.host() == "stderr" ? posix::LogWriter::Target::Stderr : posix::LogWriter::Target::Stdout;
    return ChannelPair{nullptr, std::make_shared<posix::LogWriter>(target, logger), dest.to_string()};
}

} // namespace takclient::transport
