/**
 * \file transport/tls/TlsStream.cpp
 * \ingroup tls_module
 */
#include "TlsStream.hpp"

#include <cerrno>

namespace takclient::transport::tls {

TlsStream::TlsStream(std::shared_ptr<posix::TcpSocket> tcp, SslCtxPtr ctx, SslPtr ssl, std::shared_ptr<Logger> logger)
    : tcp_(std::move(tcp)), ctx_(std::move(ctx)), ssl_(std::move(ssl)), logger_(std::move(logger)) {}

TlsStream::~TlsStream() {
    close();
}

bool TlsStream::translate_error(int ret, const char* op, std::error_code& error) {
    int err = SSL_get_error(ssl_.get(), ret);
    switch (err) {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            error.clear();
            return false;
        case SSL_ERROR_ZERO_RETURN:
            error = std::make_error_code(std::errc::not_connected);
            return true;
        case SSL_ERROR_SYSCALL:
            error = errno ? std::error_code(errno, std::generic_category())
                          : std::make_error_code(std::errc::connection_reset);
            ERR_clear_error();
            return true;
        default:
            if (logger_) logger_->debug(std::string("TLS ") + op + " failed: " + drain_openssl_errors());
            else ERR_clear_error();
            error = std::make_error_code(std::errc::protocol_error);
            return true;
    }
}

bool TlsStream::try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) {
    std::lock_guard<std::mutex> lock(mtx_);
    bytes_read = 0;
    if (closed_ || !ssl_) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }
    errno = 0;
    size_t n = 0;
    int ret = SSL_read_ex(ssl_.get(), buffer, size, &n);
    if (ret == 1) {
        bytes_read = n;
        error.clear();
        return true;
    }
    return translate_error(ret, "read", error);
}

bool TlsStream::try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) {
    std::lock_guard<std::mutex> lock(mtx_);
    bytes_written = 0;
    if (closed_ || !ssl_) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }
    errno = 0;
    size_t n = 0;
    int ret = SSL_write_ex(ssl_.get(), buffer, size, &n);
    if (ret == 1) {
        bytes_written = n;
        error.clear();
        return true;
    }
    return translate_error(ret, "write", error);
}

void TlsStream::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) return;
    closed_ = true;
    if (ssl_ && tcp_ && tcp_->is_open()) {
        // Best effort close_notify; the socket is non-blocking so this never waits.
        SSL_shutdown(ssl_.get());
        ERR_clear_error();
    }
    if (tcp_) tcp_->close();
}

bool TlsStream::is_open() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return !closed_ && tcp_ && tcp_->is_open();
}

std::string TlsStream::protocol_version() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return ssl_ ? SSL_get_version(ssl_.get()) : "";
}

std::string TlsStream::cipher_name() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!ssl_) return {};
    const char* name = SSL_get_cipher_name(ssl_.get());
    return name ? name : "";
}

} // namespace takclient::transport::tls
