/**
 * \file package/PreferencePackage.cpp
 * \brief Package extraction, settings parsing (ini / TAK pref XML) and certificate path fix-ups.
 * \ingroup package_module
 */
#include "PreferencePackage.hpp"
#include "ZipReader.hpp"
#include "common/Errors.hpp"
#include "transport/tls/Pkcs12.hpp"
#include "transport/tls/TlsIdentity.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <sys/stat.h>
#include <stdlib.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>

namespace takclient::package {

namespace fs = std::filesystem;

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

/** \brief Settings keys naming files inside the package. */
constexpr const char* kPathKeys[] = {
    config::keys::TlsClientCert,
    config::keys::TlsClientKey,
    config::keys::TlsClientCaFile,
};

fs::path make_workdir() {
    std::string tmpl = (fs::temp_directory_path() / "takclient_dp_XXXXXX").string();
    if (!::mkdtemp(tmpl.data())) {
        throw PackageError("Cannot create extraction directory " + tmpl + ": " +
                           std::error_code(errno, std::generic_category()).message());
    }
    return tmpl;
}

bool has_extension(const fs::path& p, const char* ext) {
    auto e = p.extension().string();
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return e == ext;
}

std::optional<fs::path> first_with_extension(std::vector<fs::path> files, const char* ext) {
    std::sort(files.begin(), files.end());
    for (const auto& f : files) {
        if (has_extension(f, ext)) return f;
    }
    return std::nullopt;
}

void collect_entries(xmlNode* node, config::Config& out) {
    for (; node; node = node->next) {
        if (node->type != XML_ELEMENT_NODE) continue;
        if (xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>("entry")) == 0) {
            xmlChar* key = xmlGetProp(node, reinterpret_cast<const xmlChar*>("key"));
            xmlChar* text = xmlNodeGetContent(node);
            std::string k = key ? reinterpret_cast<const char*>(key) : "";
            std::string v = text ? reinterpret_cast<const char*>(text) : "";
            if (key) xmlFree(key);
            if (text) xmlFree(text);

            if (k == "connectString0") {
                out.set(config::keys::CotUrl, PreferencePackage::connect_string_to_url(v));
            } else if (k == "clientPassword") {
                out.set(config::keys::TlsClientPassword, v);
            } else if (k == "certificateLocation") {
                out.set(config::keys::TlsClientCert, v);
            } else if (k == "caLocation") {
                out.set(config::keys::TlsClientCaFile, v);
            } else if (k == "caPassword") {
                out.set(config::keys::TlsCaPassword, v);
            }
        }
        collect_entries(node->children, out);
    }
}

void write_private_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) throw PackageError("Cannot write " + path.string());
    out.close();
    ::chmod(path.c_str(), S_IRUSR | S_IWUSR);
}

} // namespace

PreferencePackage::PreferencePackage(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

std::string PreferencePackage::connect_string_to_url(const std::string& connect_string) {
    auto first = connect_string.find(':');
    auto last = connect_string.rfind(':');
    if (first == std::string::npos || first == last || last + 1 >= connect_string.size() || first == 0) {
        throw PackageError("Malformed connectString '" + connect_string + "' (expected host:port:proto)");
    }
    auto host = connect_string.substr(0, first);
    auto port = connect_string.substr(first + 1, last - first - 1);
    auto proto = connect_string.substr(last + 1);
    return proto + "://" + host + ":" + port;
}

config::Config PreferencePackage::parse_pref(const std::string& xml) {
    std::unique_ptr<xmlDoc, XmlDocDeleter> doc(
        xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                      XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) throw PackageError("Preference file is not well-formed XML");
    config::Config out;
    collect_entries(xmlDocGetRootElement(doc.get()), out);
    return out;
}

std::optional<fs::path> PreferencePackage::find_file(const fs::path& root, const std::string& reference) {
    if (reference.empty()) return std::nullopt;
    fs::path ref(reference);
    std::error_code ec;

    if (ref.is_relative() && fs::is_regular_file(root / ref, ec)) return root / ref;

    auto name = ref.filename();
    if (name.empty()) return std::nullopt;
    std::vector<fs::path> matches;
    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().filename() == name) matches.push_back(it->path());
    }
    if (matches.empty()) return std::nullopt;
    std::sort(matches.begin(), matches.end());
    return matches.front();
}

void PreferencePackage::convert_pkcs12(config::Config& settings, const fs::path& workdir) const {
    using namespace config::keys;

    if (auto cert = settings.get(TlsClientCert)) {
        auto content = transport::tls::read_file(*cert);
        if (!content) throw PackageError("Cannot read " + *cert);
        if (transport::tls::looks_like_pkcs12(*cert, *content)) {
            auto bundle = transport::tls::decode_pkcs12(*content, settings.get_or(TlsClientPassword, ""), logger_);
            auto stem = fs::path(*cert).stem().string();
            auto cert_pem = workdir / (stem + "_cert.pem");
            auto key_pem = workdir / (stem + "_key.pem");
            write_private_file(cert_pem, bundle.cert_pem);
            write_private_file(key_pem, bundle.key_pem);
            settings.set(TlsClientCert, cert_pem.string());
            settings.set(TlsClientKey, key_pem.string());
            if (!bundle.ca_pem.empty() && !settings.contains(TlsClientCaFile)) {
                auto ca_pem = workdir / (stem + "_ca.pem");
                write_private_file(ca_pem, bundle.ca_pem);
                settings.set(TlsClientCaFile, ca_pem.string());
            }
            if (logger_) logger_->info("Converted PKCS#12 client certificate " + *cert + " to PEM");
        }
    }

    if (auto ca = settings.get(TlsClientCaFile)) {
        auto content = transport::tls::read_file(*ca);
        if (!content) throw PackageError("Cannot read " + *ca);
        if (transport::tls::looks_like_pkcs12(*ca, *content)) {
            auto password = settings.get_or(TlsCaPassword, settings.get_or(TlsClientPassword, ""));
            auto pem = transport::tls::decode_pkcs12_certificates(*content, password, logger_);
            auto ca_pem = workdir / (fs::path(*ca).stem().string() + "_truststore.pem");
            write_private_file(ca_pem, pem);
            settings.set(TlsClientCaFile, ca_pem.string());
            if (logger_) logger_->info("Converted PKCS#12 truststore " + *ca + " to PEM");
        }
    }
}

ImportResult PreferencePackage::import(const fs::path& path, const std::optional<fs::path>& workdir) const {
    ZipReader zip(path);

    ImportResult result;
    if (workdir) {
        std::error_code ec;
        fs::create_directories(*workdir, ec);
        if (ec) throw PackageError("Cannot create " + workdir->string() + ": " + ec.message());
        result.workdir = *workdir;
    } else {
        result.workdir = make_workdir();
    }
    result.files = zip.extract_all(result.workdir);
    if (logger_) {
        logger_->debug("Extracted " + std::to_string(result.files.size()) + " files from " + path.string() + " to " +
                       result.workdir.string());
    }

    if (auto ini = first_with_extension(result.files, ".ini")) {
        result.settings_file = *ini;
        auto text = transport::tls::read_file(ini->string());
        if (!text) throw PackageError("Cannot read " + ini->string());
        result.settings = config::Config::from_ini(*text);
    } else if (auto pref = first_with_extension(result.files, ".pref")) {
        result.settings_file = *pref;
        auto text = transport::tls::read_file(pref->string());
        if (!text) throw PackageError("Cannot read " + pref->string());
        result.settings = parse_pref(*text);
    } else {
        throw PackageError("No settings document (*.ini or *.pref) in " + path.string());
    }

    for (const char* key : kPathKeys) {
        auto value = result.settings.get(key);
        if (!value || value->empty()) continue;
        // Relative to the package root, then to the settings document, then by file name.
        std::optional<fs::path> found;
        std::error_code ec;
        fs::path ref(*value);
        auto beside_settings = result.settings_file.parent_path() / ref;
        if (ref.is_relative() && fs::is_regular_file(result.workdir / ref, ec)) {
            found = result.workdir / ref;
        } else if (ref.is_relative() && fs::is_regular_file(beside_settings, ec)) {
            found = beside_settings;
        } else {
            found = find_file(result.workdir, *value);
        }
        if (!found) {
            throw PackageError(std::string("Package references missing certificate ") + key + "=" + *value);
        }
        result.settings.set(key, found->string());
    }

    convert_pkcs12(result.settings, result.workdir);

    if (logger_) {
        logger_->info("Imported preference package " + path.string() + " (" + result.settings_file.filename().string() +
                      ", " + std::to_string(result.settings.values().size()) + " settings)");
    }
    return result;
}

} // namespace takclient::package
