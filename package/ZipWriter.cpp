/**
 * \file package/ZipWriter.cpp
 * \ingroup package_module
 */
#include "ZipWriter.hpp"
#include "common/Errors.hpp"

#include <zlib.h>

#include <fstream>
#include <limits>

namespace takclient::package {

namespace {

constexpr std::uint16_t kVersion = 20;
constexpr std::uint16_t kDosTime = 0;
constexpr std::uint16_t kDosDate = (0 << 9) | (1 << 5) | 1;

void put16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>(v >> 8));
}

void put32(std::string& out, std::uint32_t v) {
    put16(out, static_cast<std::uint16_t>(v & 0xffff));
    put16(out, static_cast<std::uint16_t>(v >> 16));
}

std::string deflate_raw(const std::string& in, const std::string& name) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw PackageError("deflateInit2 failed for " + name);
    }
    std::string out(deflateBound(&zs, static_cast<uLong>(in.size())), '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw PackageError("Cannot compress " + name + " (zlib error " + std::to_string(rc) + ")");
    }
    return out;
}

std::uint32_t checked32(std::uint64_t value, const std::string& what) {
    if (value >= std::numeric_limits<std::uint32_t>::max()) {
        throw PackageError(what + " needs ZIP64, which is not supported");
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

void ZipWriter::add(const std::string& name, std::string content, bool deflate) {
    if (name.empty() || name.size() > 0xffff) throw PackageError("Invalid zip entry name '" + name + "'");
    files_.push_back({name, std::move(content), deflate});
}

std::string ZipWriter::bytes() const {
    if (files_.size() >= 0xffff) throw PackageError("Too many zip entries (" + std::to_string(files_.size()) + ")");

    std::string out;
    std::string central;
    for (const auto& f : files_) {
        const std::string body = f.deflate ? deflate_raw(f.content, f.name) : f.content;
        const auto crc = static_cast<std::uint32_t>(
            ::crc32(0L, reinterpret_cast<const Bytef*>(f.content.data()), static_cast<uInt>(f.content.size())));
        const std::uint16_t method = f.deflate ? 8 : 0;
        const auto offset = checked32(out.size(), "Entry offset of " + f.name);
        const auto compressed = checked32(body.size(), "Entry " + f.name);
        const auto size = checked32(f.content.size(), "Entry " + f.name);
        const auto name_len = static_cast<std::uint16_t>(f.name.size());

        put32(out, 0x04034b50);
        put16(out, kVersion);
        put16(out, 0);
        put16(out, method);
        put16(out, kDosTime);
        put16(out, kDosDate);
        put32(out, crc);
        put32(out, compressed);
        put32(out, size);
        put16(out, name_len);
        put16(out, 0);
        out += f.name;
        out += body;

        put32(central, 0x02014b50);
        put16(central, kVersion);
        put16(central, kVersion);
        put16(central, 0);
        put16(central, method);
        put16(central, kDosTime);
        put16(central, kDosDate);
        put32(central, crc);
        put32(central, compressed);
        put32(central, size);
        put16(central, name_len);
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put32(central, 0);
        put32(central, offset);
        central += f.name;
    }
    const auto cd_offset = checked32(out.size(), "Central directory offset");
    const auto cd_size = checked32(central.size(), "Central directory");
    out += central;
    put32(out, 0x06054b50);
    put16(out, 0);
    put16(out, 0);
    put16(out, static_cast<std::uint16_t>(files_.size()));
    put16(out, static_cast<std::uint16_t>(files_.size()));
    put32(out, cd_size);
    put32(out, cd_offset);
    put16(out, 0);
    return out;
}

void ZipWriter::write(const std::filesystem::path& path) const {
    const auto archive = bytes();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(archive.data(), static_cast<std::streamsize>(archive.size()));
    if (!out) throw PackageError("Cannot write " + path.string());
}

} // namespace takclient::package
