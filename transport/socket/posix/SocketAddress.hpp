/**
 * \file SocketAddress.hpp
 * \brief getaddrinfo wrapper and sockaddr value type for the POSIX backends.
 * \ingroup socket_backend
 */
#pragma once

#include <netdb.h>
#include <sys/socket.h>
#include <string>
#include <system_error>
#include <vector>

namespace takclient::transport::posix {

/** \brief Error category for getaddrinfo() return codes. */
const std::error_category& gai_category() noexcept;

/** \brief Map a `TAK_IP_FAMILY` value (`any`, `ipv4`, `ipv6`) to AF_*; empty means any.
 *  \throws AddressError on an unknown value.
 */
int parse_ip_family(const std::string& value);

struct SocketAddress {
    sockaddr_storage storage{};
    socklen_t length{0};

    int family() const { return storage.ss_family; }
    const sockaddr* get() const { return reinterpret_cast<const sockaddr*>(&storage); }
    sockaddr* get() { return reinterpret_cast<sockaddr*>(&storage); }
    /** \brief "host:port" (IPv6 in brackets). */
    std::string to_string() const;

    /**
     * \brief Resolve `host:port` for `socktype`; empty host resolves the wildcard (AI_PASSIVE).
     * \param family AF_UNSPEC, AF_INET or AF_INET6.
     * \param error Receives a gai_category() code on failure.
     */
    static std::vector<SocketAddress> resolve(const std::string& host, int port, int family, int socktype,
                                              std::error_code& error);

    /** \brief Local address bound to `fd`. */
    static SocketAddress local_of(int fd);
    /** \brief Peer address of a connected `fd`. */
    static SocketAddress peer_of(int fd);
};

/** \brief Set or clear O_NONBLOCK; returns false if fcntl fails. */
bool set_non_blocking(int fd, bool enable);

/** \brief Map errno to std::error_code. */
inline std::error_code last_error() { return std::error_code(errno, std::generic_category()); }

/** \brief True for EAGAIN / EWOULDBLOCK / EINTR. */
bool is_would_block(int err);

} // namespace takclient::transport::posix
