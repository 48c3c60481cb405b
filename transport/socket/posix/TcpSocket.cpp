/**
 * \file TcpSocket.cpp
 * \brief Implementation of the POSIX TCP stream.
 * \ingroup socket_backend
 */
#include "TcpSocket.hpp"
#include "SocketAddress.hpp"
#include "logger.hpp"

#include <cerrno>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace takclient::transport::posix {

TcpSocket::TcpSocket(int family, std::shared_ptr<Logger> logger)
    : family_(family), logger_(std::move(logger)) {}

TcpSocket::~TcpSocket() {
    // Avoid virtual dispatch from the destructor
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

void TcpSocket::connect(const std::string& host, int port, std::error_code& error) {
    error.clear();
    auto addresses = SocketAddress::resolve(host, port, family_, SOCK_STREAM, error);
    if (error) {
        if (logger_) logger_->error("TcpSocket::connect: cannot resolve " + host + ": " + error.message());
        return;
    }

    for (const auto& addr : addresses) {
        int fd = ::socket(addr.family(), SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
        if (fd < 0) {
            error = last_error();
            continue;
        }
        if (::connect(fd, addr.get(), addr.length) != 0) {
            error = last_error();
            if (logger_) logger_->debug("TcpSocket::connect: " + addr.to_string() + " failed: " + error.message());
            ::close(fd);
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(socket_mtx_);
            if (socket_fd_ >= 0) ::close(socket_fd_);
            socket_fd_ = fd;
        }
        error.clear();
        set_no_delay(true);
        set_non_blocking(true);
        if (logger_) logger_->debug("TcpSocket connected " + local_endpoint() + " -> " + remote_endpoint());
        return;
    }
    if (!error) error = std::make_error_code(std::errc::host_unreachable);
}

bool TcpSocket::try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) {
    bytes_read = 0;
    if (socket_fd_ < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }
    ssize_t result = ::recv(socket_fd_, buffer, size, 0);
    if (result > 0) {
        bytes_read = static_cast<size_t>(result);
        error.clear();
        return true;
    }
    if (result == 0) {
        // Orderly shutdown by the peer
        error = std::make_error_code(std::errc::not_connected);
        return true;
    }
    int err = errno;
    if (is_would_block(err)) return false;
    error = std::error_code(err, std::generic_category());
    return true;
}

bool TcpSocket::try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) {
    bytes_written = 0;
    if (socket_fd_ < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }
    ssize_t result = ::send(socket_fd_, buffer, size, MSG_NOSIGNAL);
    if (result >= 0) {
        bytes_written = static_cast<size_t>(result);
        error.clear();
        return true;
    }
    int err = errno;
    if (is_would_block(err)) return false;
    error = std::error_code(err, std::generic_category());
    return true;
}

bool TcpSocket::set_non_blocking(bool enable) {
    return posix::set_non_blocking(socket_fd_, enable);
}

bool TcpSocket::set_no_delay(bool enable) {
    if (socket_fd_ < 0) return false;
    int flag = enable ? 1 : 0;
    if (::setsockopt(socket_fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0) return true;
    if (logger_) logger_->warning("Failed to set TCP_NODELAY on fd " + std::to_string(socket_fd_));
    return false;
}

void TcpSocket::close() {
    int fd_to_close = -1;
    {
        std::lock_guard<std::mutex> lock(socket_mtx_);
        fd_to_close = socket_fd_;
        socket_fd_ = -1;
    }
    if (fd_to_close >= 0) {
        ::shutdown(fd_to_close, SHUT_RDWR);
        ::close(fd_to_close);
        if (logger_) logger_->debug("TcpSocket closed fd " + std::to_string(fd_to_close));
    }
}

bool TcpSocket::is_open() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    return socket_fd_ >= 0;
}

std::string TcpSocket::local_endpoint() const {
    return SocketAddress::local_of(socket_fd_).to_string();
}

std::string TcpSocket::remote_endpoint() const {
    return SocketAddress::peer_of(socket_fd_).to_string();
}

} // namespace takclient::transport::posix
