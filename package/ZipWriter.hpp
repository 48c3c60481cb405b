/**
 * \file package/ZipWriter.hpp
 * \brief In-memory zip archive builder (stored and deflated entries) on top of zlib.
 * \ingroup package_module
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace takclient::package {

/**
 * \brief Collects entries and serialises them as a single-disk, non-ZIP64 archive.
 * \details Every entry gets the fixed DOS timestamp 1980-01-01 00:00 so identical inputs
 * produce identical archives.
 */
class ZipWriter {
public:
    /** \brief Queue an entry. \throws PackageError for an empty name or one above 64 KiB. */
    void add(const std::string& name, std::string content, bool deflate = false);

    std::size_t size() const { return files_.size(); }

    /** \brief The complete archive. \throws PackageError when it would need ZIP64. */
    std::string bytes() const;

    /** \brief Write \ref bytes to `path`, replacing it. \throws PackageError */
    void write(const std::filesystem::path& path) const;

private:
    struct File {
        std::string name;
        std::string content;
        bool deflate;
    };

    std::vector<File> files_;
};

} // namespace takclient::package
