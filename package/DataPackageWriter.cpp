/**
 * \file package/DataPackageWriter.cpp
 * \ingroup package_module
 */
#include "DataPackageWriter.hpp"
#include "ZipReader.hpp"
#include "ZipWriter.hpp"
#include "common/Errors.hpp"

#include <libxml/tree.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>

namespace takclient::package {

namespace fs = std::filesystem;

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

const xmlChar* X(const char* s) { return reinterpret_cast<const xmlChar*>(s); }

xmlNode* add_child(xmlNode* parent, const char* name) {
    xmlNode* node = xmlNewChild(parent, nullptr, X(name), nullptr);
    if (!node) throw PackageError(std::string("Cannot create manifest element ") + name);
    return node;
}

void set_attr(xmlNode* node, const char* name, const std::string& value) {
    // xmlSetProp escapes the value.
    if (!xmlSetProp(node, X(name), X(value.c_str()))) {
        throw PackageError(std::string("Cannot set manifest attribute ") + name);
    }
}

void add_parameter(xmlNode* config, const char* name, const std::string& value) {
    xmlNode* param = add_child(config, "Parameter");
    set_attr(param, "name", name);
    set_attr(param, "value", value);
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw PackageError("Cannot read " + path.string());
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

DataPackageWriter::DataPackageWriter(std::string name, std::string uid, bool on_receive_delete,
                                     std::shared_ptr<Logger> logger)
    : name_(std::move(name)), uid_(uid.empty() ? random_uuid() : std::move(uid)),
      on_receive_delete_(on_receive_delete), logger_(std::move(logger)) {}

void DataPackageWriter::add_file(const fs::path& file, bool ignore, std::string zip_entry) {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) throw PackageError("File not found: " + file.string());
    if (zip_entry.empty()) zip_entry = file.filename().string();
    if (!ZipReader::is_safe_name(zip_entry) || zip_entry == kManifestEntry) {
        throw PackageError("Unusable zip entry name '" + zip_entry + "'");
    }
    contents_.push_back({file, std::move(zip_entry), ignore});
}

void DataPackageWriter::add_directory(const fs::path& dir, bool recursive, const std::string& ignore_pattern) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) throw PackageError("Directory not found: " + dir.string());

    std::vector<fs::path> files;
    const auto collect = [&](const fs::directory_entry& entry) {
        if (!entry.is_regular_file()) return;
        if (!ignore_pattern.empty() && entry.path().filename().string().find(ignore_pattern) != std::string::npos) {
            return;
        }
        files.push_back(entry.path());
    };
    try {
        if (recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(dir)) collect(entry);
        } else {
            for (const auto& entry : fs::directory_iterator(dir)) collect(entry);
        }
    } catch (const fs::filesystem_error& e) {
        throw PackageError("Cannot list " + dir.string() + ": " + e.what());
    }
    // Directory iteration order is unspecified.
    std::sort(files.begin(), files.end());
    for (const auto& file : files) add_file(file, false, fs::relative(file, dir).generic_string());
}

std::string DataPackageWriter::manifest_xml() const {
    std::unique_ptr<xmlDoc, XmlDocDeleter> doc(xmlNewDoc(X("1.0")));
    if (!doc) throw PackageError("Cannot create manifest document");
    xmlNode* root = xmlNewNode(nullptr, X("MissionPackageManifest"));
    if (!root) throw PackageError("Cannot create manifest element MissionPackageManifest");
    xmlDocSetRootElement(doc.get(), root);
    set_attr(root, "version", "2");

    xmlNode* config = add_child(root, "Configuration");
    add_parameter(config, "uid", uid_);
    add_parameter(config, "name", name_);
    add_parameter(config, "onReceiveDelete", on_receive_delete_ ? "true" : "false");

    xmlNode* contents = add_child(root, "Contents");
    for (const auto& content : contents_) {
        xmlNode* node = add_child(contents, "Content");
        set_attr(node, "ignore", content.ignore ? "true" : "false");
        set_attr(node, "zipEntry", content.zip_entry);
    }

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc.get(), &buffer, &size, "UTF-8", 1);
    if (!buffer) throw PackageError("Cannot serialise manifest");
    std::string xml(reinterpret_cast<const char*>(buffer), static_cast<size_t>(size));
    xmlFree(buffer);
    return xml;
}

fs::path DataPackageWriter::write(const fs::path& output, bool use_dpk_extension, bool include_manifest) const {
    if (contents_.empty()) throw PackageError("No files added to data package " + name_);

    fs::path target = output;
    target.replace_extension(use_dpk_extension ? ".dpk" : ".zip");

    ZipWriter zip;
    for (const auto& content : contents_) {
        zip.add(content.zip_entry, read_file(content.source), true);
        if (logger_) logger_->debug("Added " + content.zip_entry + " to " + target.string());
    }
    if (include_manifest) zip.add(kManifestEntry, manifest_xml(), true);
    zip.write(target);

    if (logger_) {
        logger_->info("Created data package " + target.string() + " (uid " + uid_ + ", " +
                      std::to_string(contents_.size()) + " files)");
    }
    return target;
}

std::string DataPackageWriter::random_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) throw PackageError("RAND_bytes failed while generating a uid");
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return out;
}

} // namespace takclient::package
