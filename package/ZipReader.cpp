/**
 * \file package/ZipReader.cpp
 * \ingroup package_module
 */
#include "ZipReader.hpp"
#include "common/Errors.hpp"

#include <zlib.h>

#include <fstream>
#include <iterator>

namespace takclient::package {

namespace {

constexpr std::uint32_t kLocalHeaderSig = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr size_t kEndOfCentralDirSize = 22;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kLocalHeaderSize = 30;
// Settings documents and certificates are small; deflate cannot exceed about 1032:1.
constexpr std::uint64_t kMaxEntryBytes = 64ull * 1024 * 1024;
constexpr std::uint64_t kMaxDeflateRatio = 1032;

std::uint16_t le16(const std::string& d, size_t off) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(d[off]) |
                                      (static_cast<unsigned char>(d[off + 1]) << 8));
}

std::uint32_t le32(const std::string& d, size_t off) {
    return static_cast<std::uint32_t>(le16(d, off)) | (static_cast<std::uint32_t>(le16(d, off + 2)) << 16);
}

std::string inflate_raw(const char* data, size_t size, size_t expected, const std::string& name) {
    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) throw PackageError("inflateInit2 failed for " + name);

    std::string out(expected, '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    zs.avail_in = static_cast<uInt>(size);
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    int rc = inflate(&zs, Z_FINISH);
    auto produced = zs.total_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw PackageError("Corrupt deflate data in " + name + " (zlib error " + std::to_string(rc) + ")");
    }
    out.resize(produced);
    return out;
}

} // namespace

ZipReader::ZipReader(const std::filesystem::path& path) : path_(path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw PackageError("Cannot open package " + path.string());
    data_.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    read_central_directory();
}

void ZipReader::read_central_directory() {
    const auto corrupt = [this](const std::string& what) {
        return PackageError("Corrupt package " + path_.string() + ": " + what);
    };

    if (data_.size() < kEndOfCentralDirSize) throw corrupt("too short for a zip archive");

    // The end record sits at the very end unless followed by an archive comment (max 64 KiB).
    size_t eocd = std::string::npos;
    size_t lowest = data_.size() > kEndOfCentralDirSize + 0xffff ? data_.size() - kEndOfCentralDirSize - 0xffff : 0;
    for (size_t pos = data_.size() - kEndOfCentralDirSize + 1; pos-- > lowest;) {
        if (le32(data_, pos) == kEndOfCentralDirSig) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos) throw corrupt("no end of central directory record");

    std::uint16_t disk = le16(data_, eocd + 4);
    std::uint16_t count = le16(data_, eocd + 10);
    std::uint32_t cd_size = le32(data_, eocd + 12);
    std::uint32_t cd_offset = le32(data_, eocd + 16);
    if (disk != 0) throw corrupt("multi-disk archives are not supported");
    if (count == 0xffff || cd_offset == 0xffffffffu) throw corrupt("ZIP64 archives are not supported");
    if (static_cast<std::uint64_t>(cd_offset) + cd_size > eocd) throw corrupt("central directory out of range");

    size_t pos = cd_offset;
    entries_.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
        if (pos + kCentralHeaderSize > eocd || le32(data_, pos) != kCentralHeaderSig) {
            throw corrupt("bad central directory header");
        }
        ZipEntry entry;
        entry.flags = le16(data_, pos + 8);
        entry.method = le16(data_, pos + 10);
        entry.crc32 = le32(data_, pos + 16);
        entry.compressed_size = le32(data_, pos + 20);
        entry.size = le32(data_, pos + 24);
        std::uint16_t name_len = le16(data_, pos + 28);
        std::uint16_t extra_len = le16(data_, pos + 30);
        std::uint16_t comment_len = le16(data_, pos + 32);
        entry.local_header_offset = le32(data_, pos + 42);
        if (pos + kCentralHeaderSize + name_len > eocd) throw corrupt("entry name out of range");
        entry.name = data_.substr(pos + kCentralHeaderSize, name_len);
        entries_.push_back(std::move(entry));
        pos += kCentralHeaderSize + name_len + extra_len + comment_len;
    }
}

std::string ZipReader::read(const ZipEntry& entry) const {
    if (entry.flags & 0x1) throw PackageError("Encrypted entry " + entry.name + " is not supported");

    size_t off = entry.local_header_offset;
    if (off + kLocalHeaderSize > data_.size() || le32(data_, off) != kLocalHeaderSig) {
        throw PackageError("Corrupt local header for " + entry.name);
    }
    size_t start = off + kLocalHeaderSize + le16(data_, off + 26) + le16(data_, off + 28);
    if (start + entry.compressed_size > data_.size()) throw PackageError("Truncated entry " + entry.name);

    if (entry.size > kMaxEntryBytes) {
        throw PackageError("Entry " + entry.name + " claims " + std::to_string(entry.size) +
                           " bytes, above the " + std::to_string(kMaxEntryBytes) + " byte limit");
    }
    if (entry.method == kDeflated && entry.size > entry.compressed_size * kMaxDeflateRatio + 64) {
        throw PackageError("Entry " + entry.name + " claims an implausible uncompressed size of " +
                           std::to_string(entry.size) + " bytes");
    }

    std::string content;
    switch (entry.method) {
        case kStored:
            content = data_.substr(start, entry.compressed_size);
            break;
        case kDeflated:
            content = inflate_raw(data_.data() + start, entry.compressed_size, entry.size, entry.name);
            break;
        default:
            throw PackageError("Unsupported compression method " + std::to_string(entry.method) + " for " +
                               entry.name);
    }

    if (content.size() != entry.size) throw PackageError("Size mismatch for " + entry.name);
    auto crc = ::crc32(0L, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size()));
    if (crc != entry.crc32) throw PackageError("CRC mismatch for " + entry.name);
    return content;
}

bool ZipReader::is_safe_name(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.front() == '\\') return false;
    if (name.size() > 1 && name[1] == ':') return false; // drive letter
    std::filesystem::path p(name);
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return name.find("\\..") == std::string::npos && name.find("..\\") == std::string::npos;
}

std::vector<std::filesystem::path> ZipReader::extract_all(const std::filesystem::path& dest) const {
    namespace fs = std::filesystem;
    std::vector<fs::path> written;
    for (const auto& entry : entries_) {
        if (!is_safe_name(entry.name)) {
            throw PackageError("Entry '" + entry.name + "' escapes the extraction directory");
        }
        fs::path target = dest / fs::path(entry.name).relative_path();
        std::error_code ec;
        if (entry.is_directory()) {
            fs::create_directories(target, ec);
            if (ec) throw PackageError("Cannot create " + target.string() + ": " + ec.message());
            continue;
        }
        fs::create_directories(target.parent_path(), ec);
        if (ec) throw PackageError("Cannot create " + target.parent_path().string() + ": " + ec.message());

        auto content = read(entry);
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) throw PackageError("Cannot write " + target.string());
        written.push_back(target);
    }
    return written;
}

} // namespace takclient::package
