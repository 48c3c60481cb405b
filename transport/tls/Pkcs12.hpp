/**
 * \file transport/tls/Pkcs12.hpp
 * \brief PKCS#12 bundle decoding into PEM text.
 * \ingroup tls_module
 */
#pragma once

#include "logger.hpp"

#include <memory>
#include <string>

namespace takclient::transport::tls {

/** \brief PEM text extracted from a PKCS#12 bundle. */
struct PemBundle {
    std::string key_pem;  ///< Unencrypted PKCS#8 private key
    std::string cert_pem; ///< Leaf certificate
    std::string ca_pem;   ///< Additional certificates, concatenated; may be empty
};

/**
 * \brief Decode a DER PKCS#12 bundle.
 * \details On OpenSSL 3 the legacy provider is loaded the first time a bundle fails to
 * decode with the default provider (RC2 / 3DES protected bundles).
 * \throws CertificateError for malformed input, a wrong password, or a bundle without key or certificate.
 * \throws DependencyMissing when the bundle needs an algorithm the crypto library cannot provide.
 */
PemBundle decode_pkcs12(const std::string& der, const std::string& password,
                        const std::shared_ptr<Logger>& logger = nullptr);

/**
 * \brief Decode a certificate-only bundle (a truststore) into concatenated PEM.
 * \throws CertificateError, DependencyMissing as \ref decode_pkcs12; also when the bundle holds no certificate.
 */
std::string decode_pkcs12_certificates(const std::string& der, const std::string& password,
                                       const std::shared_ptr<Logger>& logger = nullptr);

/** \brief True for `.p12` / `.pfx` names, or content that is DER rather than PEM. */
bool looks_like_pkcs12(const std::string& path, const std::string& content);

} // namespace takclient::transport::tls
