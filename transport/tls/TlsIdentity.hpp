/**
 * \defgroup tls_module TLS Client Module
 * \brief OpenSSL client contexts, identities and the encrypted stream.
 */

/**
 * \file transport/tls/TlsIdentity.hpp
 * \brief Client certificate material and verification policy.
 * \ingroup tls_module
 */
#pragma once

#include "config/Config.hpp"

#include <optional>
#include <string>

namespace takclient::transport::tls {

/**
 * \brief Everything needed to build a TLS client context.
 * \details Either `cert` holds PEM (with the key inline or in `key`), or it holds a
 * DER PKCS#12 bundle and `pkcs12` is set. Paths are kept for diagnostics only.
 */
struct TlsIdentity {
    std::string cert;
    std::string key;
    std::optional<std::string> key_passphrase;
    std::optional<std::string> pkcs12_password;
    std::string ca;
    std::string expected_hostname; ///< Empty: check against the connection host
    std::string ciphers{"ALL"};
    bool verify_peer{true};
    bool check_hostname{true};
    bool pkcs12{false};

    std::string cert_path;
    std::string key_path;
    std::string ca_path;

    bool is_pkcs12() const { return pkcs12; }

    /**
     * \brief Load files named by the `TAK_TLS_*` keys.
     * \throws CertificateError if `TAK_TLS_CLIENT_CERT` is unset or a named file cannot be read.
     */
    static TlsIdentity from_config(const config::Config& cfg);
};

/** \brief Whole file as bytes; nullopt if it cannot be opened. */
std::optional<std::string> read_file(const std::string& path);

} // namespace takclient::transport::tls
