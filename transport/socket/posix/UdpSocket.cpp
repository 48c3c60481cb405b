/**
 * \file UdpSocket.cpp
 * \brief Implementation of the POSIX datagram socket.
 * \ingroup socket_backend
 */
#include "UdpSocket.hpp"
#include "logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>

namespace takclient::transport::posix {

namespace {

/**
 * \brief IPv6 interface index for `local`: an interface name, a numeric index, or an
 * address assigned to one of the host's interfaces. Wildcards map to 0 (kernel choice).
 */
bool ipv6_interface_index(const std::string& local, unsigned& index) {
    index = 0;
    if (local.empty() || local == "0.0.0.0" || local == "::") return true;
    if (std::all_of(local.begin(), local.end(), [](unsigned char c) { return std::isdigit(c); })) {
        index = static_cast<unsigned>(std::strtoul(local.c_str(), nullptr, 10));
        return true;
    }
    if (unsigned by_name = ::if_nametoindex(local.c_str()); by_name != 0) {
        index = by_name;
        return true;
    }
    in6_addr wanted{};
    if (::inet_pton(AF_INET6, local.c_str(), &wanted) != 1) return false;
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) return false;
    for (ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET6) continue;
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(it->ifa_addr);
        if (std::memcmp(&sin6->sin6_addr, &wanted, sizeof(wanted)) == 0) {
            index = ::if_nametoindex(it->ifa_name);
            break;
        }
    }
    ::freeifaddrs(list);
    return index != 0;
}

std::error_code set_int_option(int fd, int level, int name, int value) {
    if (::setsockopt(fd, level, name, &value, sizeof(value)) != 0) return last_error();
    return {};
}

} // namespace

UdpSocket::UdpSocket(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

UdpSocket::~UdpSocket() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

void UdpSocket::open(int family, std::error_code& error) {
    error.clear();
    int fd = ::socket(family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_UDP);
    if (fd < 0) {
        error = last_error();
        return;
    }
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (socket_fd_ >= 0) ::close(socket_fd_);
    socket_fd_ = fd;
    family_ = family;
}

void UdpSocket::set_reuse_address(std::error_code& error) {
    error = set_int_option(socket_fd_, SOL_SOCKET, SO_REUSEADDR, 1);
#ifdef SO_REUSEPORT
    if (!error) error = set_int_option(socket_fd_, SOL_SOCKET, SO_REUSEPORT, 1);
#endif
}

void UdpSocket::enable_broadcast(std::error_code& error) {
    error = set_int_option(socket_fd_, SOL_SOCKET, SO_BROADCAST, 1);
}

void UdpSocket::set_multicast_ttl(int ttl, std::error_code& error) {
    if (family_ == AF_INET6) {
        error = set_int_option(socket_fd_, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, ttl);
    } else {
        error = set_int_option(socket_fd_, IPPROTO_IP, IP_MULTICAST_TTL, ttl);
    }
}

void UdpSocket::set_multicast_interface(const std::string& local_address, std::error_code& error) {
    error.clear();
    if (family_ == AF_INET6) {
        unsigned index = 0;
        if (!ipv6_interface_index(local_address, index)) {
            error = std::make_error_code(std::errc::no_such_device);
            return;
        }
        if (::setsockopt(socket_fd_, IPPROTO_IPV6, IPV6_MULTICAST_IF, &index, sizeof(index)) != 0) {
            error = last_error();
        }
        return;
    }
    in_addr iface{};
    if (::inet_pton(AF_INET, local_address.c_str(), &iface) != 1) {
        error = std::make_error_code(std::errc::invalid_argument);
        return;
    }
    if (::setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) != 0) {
        error = last_error();
    }
}

void UdpSocket::join_group(const SocketAddress& group, const std::string& local_address, std::error_code& error) {
    error.clear();
    if (group.family() == AF_INET) {
        ip_mreq mreq{};
        mreq.imr_multiaddr = reinterpret_cast<const sockaddr_in*>(&group.storage)->sin_addr;
        if (::inet_pton(AF_INET, local_address.c_str(), &mreq.imr_interface) != 1) {
            error = std::make_error_code(std::errc::invalid_argument);
            return;
        }
        if (::setsockopt(socket_fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) != 0) {
            error = last_error();
        }
        return;
    }
    ipv6_mreq mreq6{};
    mreq6.ipv6mr_multiaddr = reinterpret_cast<const sockaddr_in6*>(&group.storage)->sin6_addr;
    unsigned index = 0;
    if (!ipv6_interface_index(local_address, index)) {
        error = std::make_error_code(std::errc::no_such_device);
        return;
    }
    mreq6.ipv6mr_interface = index;
    if (::setsockopt(socket_fd_, IPPROTO_IPV6, IPV6_JOIN_GROUP, &mreq6, sizeof(mreq6)) != 0) {
        error = last_error();
    }
}

void UdpSocket::bind(const SocketAddress& local, std::error_code& error) {
    error.clear();
    if (::bind(socket_fd_, local.get(), local.length) != 0) {
        error = last_error();
        return;
    }
    bound_ = true;
    if (logger_) logger_->debug("UdpSocket bound to " + local_endpoint());
}

void UdpSocket::connect(const SocketAddress& peer, std::error_code& error) {
    error.clear();
    if (::connect(socket_fd_, peer.get(), peer.length) != 0) {
        error = last_error();
        return;
    }
    connected_ = true;
    destination_ = peer;
}

bool UdpSocket::try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) {
    bytes_read = 0;
    if (socket_fd_ < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }
    SocketAddress sender;
    sender.length = sizeof(sender.storage);
    ssize_t result = ::recvfrom(socket_fd_, buffer, size, 0, sender.get(), &sender.length);
    if (result >= 0) {
        bytes_read = static_cast<size_t>(result);
        last_sender_ = sender;
        error.clear();
        return true;
    }
    int err = errno;
    // ICMP port-unreachable on a connected socket surfaces here; it is not fatal for datagrams.
    if (is_would_block(err) || err == ECONNREFUSED) return false;
    error = std::error_code(err, std::generic_category());
    return true;
}

bool UdpSocket::try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) {
    bytes_written = 0;
    if (socket_fd_ < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }
    ssize_t result;
    if (connected_) {
        result = ::send(socket_fd_, buffer, size, 0);
    } else if (destination_) {
        result = ::sendto(socket_fd_, buffer, size, 0, destination_->get(), destination_->length);
    } else {
        error = std::make_error_code(std::errc::destination_address_required);
        return true;
    }
    if (result >= 0) {
        bytes_written = static_cast<size_t>(result);
        error.clear();
        return true;
    }
    int err = errno;
    if (is_would_block(err)) return false;
    if (err == ECONNREFUSED) {
        // Stale ICMP error from an earlier datagram; the current one was not sent.
        if (logger_) logger_->debug("UdpSocket: peer " + remote_endpoint() + " refused a datagram");
        return false;
    }
    error = std::error_code(err, std::generic_category());
    return true;
}

void UdpSocket::close() {
    int fd_to_close = -1;
    {
        std::lock_guard<std::mutex> lock(socket_mtx_);
        fd_to_close = socket_fd_;
        socket_fd_ = -1;
    }
    if (fd_to_close >= 0) {
        ::close(fd_to_close);
        if (logger_) logger_->debug("UdpSocket closed fd " + std::to_string(fd_to_close));
    }
}

bool UdpSocket::is_open() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    return socket_fd_ >= 0;
}

std::string UdpSocket::local_endpoint() const {
    return SocketAddress::local_of(socket_fd_).to_string();
}

std::string UdpSocket::remote_endpoint() const {
    return destination_ ? destination_->to_string() : std::string{};
}

} // namespace takclient::transport::posix
