/**
 * \defgroup package_module Preference Package Module
 * \brief Zip extraction and settings import for TAK data/preference packages.
 */

/**
 * \file package/ZipReader.hpp
 * \brief Minimal zip archive reader (stored and deflated entries) on top of zlib.
 * \ingroup package_module
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace takclient::package {

/** \brief One central-directory record. */
struct ZipEntry {
    std::string name;
    std::uint16_t flags{0};
    std::uint16_t method{0};
    std::uint32_t crc32{0};
    std::uint64_t compressed_size{0};
    std::uint64_t size{0};
    std::uint64_t local_header_offset{0};

    bool is_directory() const { return !name.empty() && name.back() == '/'; }
};

/**
 * \brief Reads a whole archive into memory and serves its entries.
 * \details Supports methods 0 (stored) and 8 (deflate). ZIP64, multi-disk archives
 * and encrypted entries are rejected with PackageError.
 */
class ZipReader {
public:
    static constexpr std::uint16_t kStored = 0;
    static constexpr std::uint16_t kDeflated = 8;

    /** \throws PackageError if the file cannot be read or has no valid central directory. */
    explicit ZipReader(const std::filesystem::path& path);

    const std::vector<ZipEntry>& entries() const { return entries_; }

    /** \brief Uncompressed, CRC-checked contents. \throws PackageError */
    std::string read(const ZipEntry& entry) const;

    /**
     * \brief Write every entry below `dest`.
     * \return Paths of the extracted regular files.
     * \throws PackageError for unsafe names or corrupt entries.
     */
    std::vector<std::filesystem::path> extract_all(const std::filesystem::path& dest) const;

    /** \brief False for absolute names and names with `..` components. */
    static bool is_safe_name(const std::string& name);

private:
    void read_central_directory();

    std::filesystem::path path_;
    std::string data_;
    std::vector<ZipEntry> entries_;
};

} // namespace takclient::package
