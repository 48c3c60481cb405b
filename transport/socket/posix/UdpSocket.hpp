/**
 * \file UdpSocket.hpp
 * \brief POSIX datagram socket covering unicast, broadcast and multicast channels.
 * \ingroup socket_backend
 * \details The socket is configured step by step by \ref SocketFactory; each setter
 * reports failures through `std::error_code` and never throws. One completed
 * read returns exactly one datagram.
 */
#pragma once

#include "SocketAddress.hpp"
#include "transport/socket/IAsyncStream.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

class Logger;

namespace takclient::transport::posix {

/** \brief Non-blocking UDP socket.
 *  \ingroup socket_backend
 */
class UdpSocket : public virtual IAsyncStream {
public:
    explicit UdpSocket(std::shared_ptr<Logger> logger = nullptr);
    ~UdpSocket() override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /** \brief Create the underlying non-blocking fd for `family`. */
    void open(int family, std::error_code& error);
    /** \brief SO_REUSEADDR, plus SO_REUSEPORT where the platform has it. */
    void set_reuse_address(std::error_code& error);
    /** \brief SO_BROADCAST. */
    void enable_broadcast(std::error_code& error);
    /** \brief IP_MULTICAST_TTL / IPV6_MULTICAST_HOPS. */
    void set_multicast_ttl(int ttl, std::error_code& error);
    /**
     * \brief IP_MULTICAST_IF from a dotted local address, or IPV6_MULTICAST_IF from an
     * interface name, index or assigned IPv6 address. Unknown interfaces give `no_such_device`.
     */
    void set_multicast_interface(const std::string& local_address, std::error_code& error);
    /** \brief IP_ADD_MEMBERSHIP / IPV6_JOIN_GROUP on the given local interface. */
    void join_group(const SocketAddress& group, const std::string& local_address, std::error_code& error);
    void bind(const SocketAddress& local, std::error_code& error);
    /** \brief connect(2): fixes the peer so plain send/recv apply. */
    void connect(const SocketAddress& peer, std::error_code& error);
    /** \brief Target for sendto when the socket is not connected. */
    void set_destination(const SocketAddress& destination) { destination_ = destination; }

    bool try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) override;
    bool try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) override;
    bool message_oriented() const override { return true; }

    /** \brief True once bind() has succeeded. */
    bool is_bound() const { return bound_; }
    /** \brief Sender of the most recent datagram. */
    std::optional<SocketAddress> last_sender() const { return last_sender_; }

    void close() override;
    bool is_open() const override;
    int get_handle() const override { return socket_fd_; }
    std::string local_endpoint() const override;
    std::string remote_endpoint() const override;
    std::string socket_type() const override { return "udp"; }

private:
    int socket_fd_{-1};
    int family_{0};
    bool bound_{false};
    bool connected_{false};
    std::optional<SocketAddress> destination_;
    std::optional<SocketAddress> last_sender_;
    std::shared_ptr<Logger> logger_;
    mutable std::mutex socket_mtx_;
};

} // namespace takclient::transport::posix
