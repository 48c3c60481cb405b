/**
 * \file transport/tls/TlsIdentity.cpp
 * \ingroup tls_module
 */
#include "TlsIdentity.hpp"
#include "PassphraseProvider.hpp"
#include "Pkcs12.hpp"
#include "common/Errors.hpp"

#include <fstream>
#include <iterator>

namespace takclient::transport::tls {

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

namespace {

std::string load(const std::string& key, const std::string& path) {
    auto content = read_file(path);
    if (!content) throw CertificateError("Resource not found: " + key + "=" + path);
    return *content;
}

} // namespace

TlsIdentity TlsIdentity::from_config(const config::Config& cfg) {
    using namespace config::keys;
    TlsIdentity id;

    id.cert_path = cfg.get_or(TlsClientCert, "");
    if (id.cert_path.empty()) throw CertificateError(std::string("Missing value: ") + TlsClientCert);
    id.cert = load(TlsClientCert, id.cert_path);
    id.pkcs12 = looks_like_pkcs12(id.cert_path, id.cert);

    id.key_path = cfg.get_or(TlsClientKey, "");
    if (!id.key_path.empty()) id.key = load(TlsClientKey, id.key_path);

    id.ca_path = cfg.get_or(TlsClientCaFile, "");
    if (!id.ca_path.empty()) id.ca = load(TlsClientCaFile, id.ca_path);

    if (auto pw = cfg.get(TlsClientPassword)) id.pkcs12_password = *pw;
    id.key_passphrase = ConfigPassphraseProvider(cfg).passphrase("");

    id.expected_hostname = cfg.get_or(TlsExpectedHostname, "");
    id.ciphers = cfg.get_or(TlsClientCiphers, "");
    if (id.ciphers.empty()) id.ciphers = "ALL";
    id.verify_peer = !cfg.get_bool(TlsDontVerify);
    id.check_hostname = id.verify_peer && !cfg.get_bool(TlsDontCheckHostname);
    return id;
}

} // namespace takclient::transport::tls
