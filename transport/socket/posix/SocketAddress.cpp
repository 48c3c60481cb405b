/**
 * \file SocketAddress.cpp
 * \brief Address resolution helpers shared by the POSIX sockets.
 * \ingroup socket_backend
 */
#include "SocketAddress.hpp"
#include "common/Errors.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>

namespace takclient::transport::posix {

namespace {

class GaiCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "getaddrinfo"; }
    std::string message(int ev) const override { return ::gai_strerror(ev); }
};

} // namespace

const std::error_category& gai_category() noexcept {
    static GaiCategory category;
    return category;
}

int parse_ip_family(const std::string& value) {
    if (value.empty() || value == "any" || value == "ANY") return AF_UNSPEC;
    if (value == "ipv4" || value == "IPV4" || value == "4") return AF_INET;
    if (value == "ipv6" || value == "IPV6" || value == "6") return AF_INET6;
    throw AddressError("Invalid TAK_IP_FAMILY '" + value + "' (expected any, ipv4 or ipv6)");
}

std::string SocketAddress::to_string() const {
    char host[INET6_ADDRSTRLEN] = {0};
    int port = 0;
    if (family() == AF_INET) {
        auto* sin = reinterpret_cast<const sockaddr_in*>(&storage);
        ::inet_ntop(AF_INET, &sin->sin_addr, host, sizeof(host));
        port = ntohs(sin->sin_port);
        return std::string(host) + ":" + std::to_string(port);
    }
    if (family() == AF_INET6) {
        auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&storage);
        ::inet_ntop(AF_INET6, &sin6->sin6_addr, host, sizeof(host));
        port = ntohs(sin6->sin6_port);
        return "[" + std::string(host) + "]:" + std::to_string(port);
    }
    return "unknown";
}

std::vector<SocketAddress> SocketAddress::resolve(const std::string& host, int port, int family, int socktype,
                                                  std::error_code& error) {
    error.clear();
    addrinfo hints{};
    hints.ai_family = family;
    hints.ai_socktype = socktype;
    if (host.empty()) hints.ai_flags |= AI_PASSIVE;

    addrinfo* result = nullptr;
    const std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        error = std::error_code(rc, gai_category());
        return {};
    }

    std::vector<SocketAddress> out;
    for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
        SocketAddress a;
        std::memcpy(&a.storage, ai->ai_addr, ai->ai_addrlen);
        a.length = static_cast<socklen_t>(ai->ai_addrlen);
        out.push_back(a);
    }
    ::freeaddrinfo(result);
    if (out.empty()) error = std::make_error_code(std::errc::address_not_available);
    return out;
}

SocketAddress SocketAddress::local_of(int fd) {
    SocketAddress a;
    a.length = sizeof(a.storage);
    if (fd < 0 || ::getsockname(fd, a.get(), &a.length) != 0) a.length = 0;
    return a;
}

SocketAddress SocketAddress::peer_of(int fd) {
    SocketAddress a;
    a.length = sizeof(a.storage);
    if (fd < 0 || ::getpeername(fd, a.get(), &a.length) != 0) a.length = 0;
    return a;
}

bool set_non_blocking(int fd, bool enable) {
    if (fd < 0) return false;
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, flags) == 0;
}

bool is_would_block(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

} // namespace takclient::transport::posix
