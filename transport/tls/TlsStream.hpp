/**
 * \file transport/tls/TlsStream.hpp
 * \brief IAsyncStream over an established OpenSSL session.
 * \ingroup tls_module
 */
#pragma once

#include "OpenSslHandles.hpp"
#include "transport/socket/IAsyncStream.hpp"
#include "transport/socket/posix/TcpSocket.hpp"
#include "logger.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace takclient::transport::tls {

/**
 * \brief Encrypted non-blocking stream.
 * \details Owns the TCP leg. `WANT_READ` / `WANT_WRITE` map to "would block"; a clean
 * close_notify (or EOF) completes a read with `not_connected`.
 */
class TlsStream : public virtual IAsyncStream {
public:
    TlsStream(std::shared_ptr<posix::TcpSocket> tcp, SslCtxPtr ctx, SslPtr ssl, std::shared_ptr<Logger> logger);
    ~TlsStream() override;

    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    bool try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) override;
    bool try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) override;

    void close() override;
    bool is_open() const override;
    int get_handle() const override { return tcp_ ? tcp_->get_handle() : -1; }
    std::string local_endpoint() const override { return tcp_ ? tcp_->local_endpoint() : std::string(); }
    std::string remote_endpoint() const override { return tcp_ ? tcp_->remote_endpoint() : std::string(); }
    std::string socket_type() const override { return "tls"; }

    /** \brief Negotiated protocol, e.g. "TLSv1.3". */
    std::string protocol_version() const;
    std::string cipher_name() const;

private:
    /** \return true if the SSL error completed the operation (and set `error`). */
    bool translate_error(int ret, const char* op, std::error_code& error);

    std::shared_ptr<posix::TcpSocket> tcp_;
    SslCtxPtr ctx_;
    SslPtr ssl_;
    std::shared_ptr<Logger> logger_;
    bool closed_{false};
    mutable std::mutex mtx_;
};

} // namespace takclient::transport::tls
