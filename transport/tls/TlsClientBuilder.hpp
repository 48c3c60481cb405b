/**
 * \file transport/tls/TlsClientBuilder.hpp
 * \brief Builds OpenSSL client contexts from a \ref TlsIdentity and wraps TCP legs.
 * \ingroup tls_module
 */
#pragma once

#include "OpenSslHandles.hpp"
#include "PassphraseProvider.hpp"
#include "TlsIdentity.hpp"
#include "TlsStream.hpp"
#include "transport/socket/ChannelPair.hpp"
#include "logger.hpp"

#include <memory>
#include <optional>
#include <string>

namespace takclient::transport::tls {

class TlsClientBuilder {
public:
    /**
     * \param passphrases Asked for the key passphrase when the key is encrypted and the
     * identity does not carry one.
     */
    explicit TlsClientBuilder(std::shared_ptr<Logger> logger = nullptr,
                              std::shared_ptr<IPassphraseProvider> passphrases = nullptr);

    /**
     * \brief Client context: TLS 1.2 minimum, cipher list, certificate chain, key, trust store.
     * \throws CertificateError for missing or unusable certificate/key material.
     * \throws DependencyMissing for PKCS#12 bundles the crypto library cannot decode.
     * \throws HandshakeError when the cipher list selects nothing.
     */
    SslCtxPtr build_context(const TlsIdentity& identity) const;

    /**
     * \brief Blocking handshake over `tcp`; the returned stream is non-blocking.
     * \param host Connection host, used for SNI and (unless overridden) the name check.
     * \throws HandshakeError on negotiation or verification failure.
     */
    std::shared_ptr<TlsStream> connect(std::shared_ptr<posix::TcpSocket> tcp, const TlsIdentity& identity,
                                       const std::string& host) const;

    /** \brief \ref connect, returned as a pair whose reader and writer are the stream. */
    ChannelPair wrap(std::shared_ptr<posix::TcpSocket> tcp, const TlsIdentity& identity,
                     const std::string& host) const;

private:
    std::string select_key(const TlsIdentity& identity, const std::string& cert_pem, const std::string& key_pem,
                            std::optional<std::string>& passphrase) const;

    std::shared_ptr<Logger> logger_;
    std::shared_ptr<IPassphraseProvider> passphrases_;
};

} // namespace takclient::transport::tls
