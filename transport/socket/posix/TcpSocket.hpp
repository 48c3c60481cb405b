/**
 * \file TcpSocket.hpp
 * \brief POSIX TCP implementation of IAsyncStream and IClientSocket.
 * \ingroup socket_backend
 * \details Connects in blocking mode, then switches to non-blocking so reads and
 * writes can be polled by the coroutine layer.
 */
#pragma once

#include "transport/socket/IAsyncStream.hpp"
#include "transport/socket/IClientSocket.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

class Logger;

namespace takclient::transport::posix {

/** \brief TCP client stream implementing read, write and connect roles.
 *  \ingroup socket_backend
 */
class TcpSocket : public virtual IAsyncStream, public virtual IClientSocket {
public:
    /** \brief Create an unconnected socket.
     *  \param family AF_UNSPEC, AF_INET or AF_INET6 restricting name resolution.
     *  \param logger Shared logger instance for diagnostics (optional).
     */
    explicit TcpSocket(int family = 0, std::shared_ptr<Logger> logger = nullptr);
    ~TcpSocket() override;

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    /** \brief Resolve `host`, try each address in turn with a blocking connect.
     *  \param error Resolution errors carry gai_category(); connect errors carry errno.
     */
    void connect(const std::string& host, int port, std::error_code& error) override;

    bool try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) override;
    bool try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) override;

    /** \brief Switch between blocking and non-blocking mode (used during the TLS handshake). */
    bool set_non_blocking(bool enable);
    /** \brief Toggle TCP_NODELAY. */
    bool set_no_delay(bool enable);

    void close() override;
    bool is_open() const override;
    int get_handle() const override { return socket_fd_; }
    std::string local_endpoint() const override;
    std::string remote_endpoint() const override;
    std::string socket_type() const override { return "tcp"; }

private:
    int socket_fd_{-1};
    int family_{0};
    std::shared_ptr<Logger> logger_;
    mutable std::mutex socket_mtx_;
};

} // namespace takclient::transport::posix
