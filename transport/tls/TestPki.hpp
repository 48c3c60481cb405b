/**
 * \file transport/tls/TestPki.hpp
 * \brief Test-only helpers: throwaway CA, server and client certificates generated with OpenSSL.
 * \ingroup tls_module
 */
#pragma once

#include "OpenSslHandles.hpp"

#include <openssl/ec.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include <stdexcept>
#include <string>

namespace takclient::transport::tls::testing {

inline EvpPkeyPtr generate_key() {
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    EVP_PKEY* pkey = nullptr;
    if (!pctx || EVP_PKEY_keygen_init(pctx) != 1 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx, NID_X9_62_prime256v1) != 1 ||
        EVP_PKEY_keygen(pctx, &pkey) != 1) {
        EVP_PKEY_CTX_free(pctx);
        throw std::runtime_error("EC key generation failed: " + drain_openssl_errors());
    }
    EVP_PKEY_CTX_free(pctx);
    return EvpPkeyPtr(pkey);
}

inline void add_extension(X509* cert, X509V3_CTX* v3, int nid, const char* value) {
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, v3, nid, value);
    if (!ext) throw std::runtime_error("Bad extension " + std::string(value));
    X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
}

/** \brief Certificate for `key`, self-signed when `issuer` is null. */
inline X509Ptr make_certificate(EVP_PKEY* key, const std::string& common_name, X509* issuer, EVP_PKEY* issuer_key,
                                bool is_ca, const std::string& subject_alt_names = {}) {
    static long serial = 1;
    X509Ptr cert(X509_new());
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), serial++);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -3600);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24 * 3600);
    X509_set_pubkey(cert.get(), key);

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1, 0);
    X509_set_issuer_name(cert.get(), issuer ? X509_get_subject_name(issuer) : name);

    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, issuer ? issuer : cert.get(), cert.get(), nullptr, nullptr, 0);
    add_extension(cert.get(), &v3, NID_basic_constraints, is_ca ? "critical,CA:TRUE" : "CA:FALSE");
    if (is_ca) add_extension(cert.get(), &v3, NID_key_usage, "critical,keyCertSign,cRLSign");
    if (!subject_alt_names.empty()) add_extension(cert.get(), &v3, NID_subject_alt_name, subject_alt_names.c_str());

    if (X509_sign(cert.get(), issuer_key ? issuer_key : key, EVP_sha256()) == 0) {
        throw std::runtime_error("X509_sign failed: " + drain_openssl_errors());
    }
    return cert;
}

inline std::string bio_contents(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<size_t>(len));
}

inline std::string to_pem(X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    PEM_write_bio_X509(bio.get(), cert);
    return bio_contents(bio.get());
}

/** \brief PKCS#8 PEM; encrypted with AES-256-CBC when `passphrase` is non-empty. */
inline std::string to_pem(EVP_PKEY* key, const std::string& passphrase = {}) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (passphrase.empty()) {
        PEM_write_bio_PKCS8PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr);
    } else {
        PEM_write_bio_PKCS8PrivateKey(bio.get(), key, EVP_aes_256_cbc(), const_cast<char*>(passphrase.c_str()),
                                      static_cast<int>(passphrase.size()), nullptr, nullptr);
    }
    return bio_contents(bio.get());
}

/** \brief DER PKCS#12 with the library's default (modern) algorithms. */
inline std::string to_pkcs12(EVP_PKEY* key, X509* cert, X509* extra, const std::string& password) {
    STACK_OF(X509)* ca = sk_X509_new_null();
    if (extra) sk_X509_push(ca, X509_dup(extra));
    X509StackPtr ca_holder(ca);
    Pkcs12Ptr p12(PKCS12_create(password.c_str(), "tak-client", key, cert, ca, 0, 0, 0, 0, 0));
    if (!p12) throw std::runtime_error("PKCS12_create failed: " + drain_openssl_errors());
    BioPtr bio(BIO_new(BIO_s_mem()));
    i2d_PKCS12_bio(bio.get(), p12.get());
    return bio_contents(bio.get());
}

/** \brief CA plus a server certificate for localhost/127.0.0.1 and a client certificate. */
struct TestPki {
    EvpPkeyPtr ca_key;
    X509Ptr ca_cert;
    EvpPkeyPtr server_key;
    X509Ptr server_cert;
    EvpPkeyPtr client_key;
    X509Ptr client_cert;

    static TestPki create() {
        TestPki pki;
        pki.ca_key = generate_key();
        pki.ca_cert = make_certificate(pki.ca_key.get(), "tak-client test CA", nullptr, nullptr, true);
        pki.server_key = generate_key();
        pki.server_cert = make_certificate(pki.server_key.get(), "localhost", pki.ca_cert.get(), pki.ca_key.get(),
                                           false, "DNS:localhost,IP:127.0.0.1");
        pki.client_key = generate_key();
        pki.client_cert = make_certificate(pki.client_key.get(), "tak-client", pki.ca_cert.get(), pki.ca_key.get(),
                                           false);
        return pki;
    }

    std::string ca_pem() const { return to_pem(ca_cert.get()); }
    std::string client_cert_pem() const { return to_pem(client_cert.get()); }
    std::string client_key_pem(const std::string& passphrase = {}) const { return to_pem(client_key.get(), passphrase); }
    std::string client_pkcs12(const std::string& password) const {
        return to_pkcs12(client_key.get(), client_cert.get(), ca_cert.get(), password);
    }
};

} // namespace takclient::transport::tls::testing
