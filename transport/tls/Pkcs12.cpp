/**
 * \file transport/tls/Pkcs12.cpp
 * \ingroup tls_module
 */
#include "Pkcs12.hpp"
#include "OpenSslHandles.hpp"
#include "common/Errors.hpp"

#include <openssl/pem.h>
#include <openssl/opensslv.h>
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
#include <openssl/provider.h>
#endif

#include <algorithm>
#include <cctype>
#include <mutex>

namespace takclient::transport::tls {

namespace {

/** \return true if legacy algorithms are (now) available. */
bool load_legacy_provider(const std::shared_ptr<Logger>& logger) {
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    static std::once_flag once;
    static bool loaded = false;
    std::call_once(once, [&] {
        // Loading any provider explicitly stops default from being loaded implicitly.
        OSSL_PROVIDER* legacy = OSSL_PROVIDER_load(nullptr, "legacy");
        OSSL_PROVIDER* fallback = OSSL_PROVIDER_load(nullptr, "default");
        loaded = legacy != nullptr && fallback != nullptr;
        if (logger) {
            if (loaded) logger->debug("Loaded OpenSSL legacy provider for PKCS#12 decoding");
            else logger->warning("OpenSSL legacy provider is not available: " + drain_openssl_errors());
        }
        ERR_clear_error();
    });
    return loaded;
#else
    (void)logger;
    return false;
#endif
}

std::string to_pem(X509* cert) {
    BioPtr out(BIO_new(BIO_s_mem()));
    if (!out || PEM_write_bio_X509(out.get(), cert) != 1) {
        throw CertificateError("Cannot encode certificate as PEM: " + drain_openssl_errors());
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(out.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

std::string to_pem(EVP_PKEY* key) {
    BioPtr out(BIO_new(BIO_s_mem()));
    if (!out || PEM_write_bio_PrivateKey(out.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw CertificateError("Cannot encode private key as PEM: " + drain_openssl_errors());
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(out.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

bool mac_matches(PKCS12* p12, const std::string& password) {
    if (!PKCS12_mac_present(p12)) return true;
    if (PKCS12_verify_mac(p12, password.c_str(), -1) == 1) return true;
    // An empty password may have been encoded as "no password".
    return password.empty() && PKCS12_verify_mac(p12, nullptr, 0) == 1;
}

struct ParsedPkcs12 {
    EvpPkeyPtr key;
    X509Ptr cert;
    X509StackPtr ca;
};

ParsedPkcs12 parse_pkcs12(const std::string& der, const std::string& password, const std::shared_ptr<Logger>& logger) {
    auto bio = memory_bio(der);
    Pkcs12Ptr p12(bio ? d2i_PKCS12_bio(bio.get(), nullptr) : nullptr);
    if (!p12) throw CertificateError("Malformed PKCS#12 bundle: " + drain_openssl_errors());

    if (!mac_matches(p12.get(), password)) {
        ERR_clear_error();
        throw CertificateError("Wrong PKCS#12 password (MAC verification failed)");
    }

    EVP_PKEY* raw_key = nullptr;
    X509* raw_cert = nullptr;
    STACK_OF(X509)* raw_ca = nullptr;
    if (PKCS12_parse(p12.get(), password.c_str(), &raw_key, &raw_cert, &raw_ca) != 1) {
        auto first_error = drain_openssl_errors();
        if (!load_legacy_provider(logger)) {
            throw DependencyMissing("PKCS#12 bundle uses an algorithm the crypto library cannot decode (" +
                                    first_error + "); the OpenSSL legacy provider is required");
        }
        if (PKCS12_parse(p12.get(), password.c_str(), &raw_key, &raw_cert, &raw_ca) != 1) {
            throw DependencyMissing("PKCS#12 bundle could not be decoded even with the legacy provider: " +
                                    drain_openssl_errors());
        }
    }
    return ParsedPkcs12{EvpPkeyPtr(raw_key), X509Ptr(raw_cert), X509StackPtr(raw_ca)};
}

std::string stack_to_pem(STACK_OF(X509)* stack) {
    std::string out;
    if (!stack) return out;
    for (int i = 0; i < sk_X509_num(stack); ++i) out += to_pem(sk_X509_value(stack, i));
    return out;
}

} // namespace

PemBundle decode_pkcs12(const std::string& der, const std::string& password, const std::shared_ptr<Logger>& logger) {
    auto parsed = parse_pkcs12(der, password, logger);
    if (!parsed.key) throw CertificateError("PKCS#12 bundle contains no private key");
    if (!parsed.cert) throw CertificateError("PKCS#12 bundle contains no certificate");

    PemBundle bundle;
    bundle.key_pem = to_pem(parsed.key.get());
    bundle.cert_pem = to_pem(parsed.cert.get());
    bundle.ca_pem = stack_to_pem(parsed.ca.get());
    if (logger) {
        logger->debug("Decoded PKCS#12 bundle (" + std::to_string(parsed.ca ? sk_X509_num(parsed.ca.get()) : 0) +
                      " additional certificates)");
    }
    return bundle;
}

std::string decode_pkcs12_certificates(const std::string& der, const std::string& password,
                                       const std::shared_ptr<Logger>& logger) {
    auto parsed = parse_pkcs12(der, password, logger);
    std::string pem = parsed.cert ? to_pem(parsed.cert.get()) : std::string();
    pem += stack_to_pem(parsed.ca.get());
    if (pem.empty()) throw CertificateError("PKCS#12 truststore contains no certificate");
    return pem;
}

bool looks_like_pkcs12(const std::string& path, const std::string& content) {
    auto dot = path.rfind('.');
    if (dot != std::string::npos) {
        std::string ext = path.substr(dot + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == "p12" || ext == "pfx") return true;
        if (ext == "pem" || ext == "crt" || ext == "key") return false;
    }
    // DER PKCS#12 is an ASN.1 SEQUENCE; PEM is text with a BEGIN marker.
    return !content.empty() && static_cast<unsigned char>(content[0]) == 0x30 &&
           content.find("-----BEGIN") == std::string::npos;
}

} // namespace takclient::transport::tls
