/**
 * \file package/DataPackageWriter.hpp
 * \brief Builds TAK data packages: a zip of files plus `MANIFEST/manifest.xml`.
 * \ingroup package_module
 */
#pragma once

#include "logger.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace takclient::package {

/** \brief One file scheduled for the package. */
struct PackageContent {
    std::filesystem::path source;
    std::string zip_entry;
    bool ignore{false}; ///< Receiver skips this entry on import
};

/**
 * \brief Generator for TAK data package archives.
 * \details The manifest is a version 2 `MissionPackageManifest` carrying the uid, name and
 * onReceiveDelete parameters and one `<Content>` per file. Entries are deflated.
 */
class DataPackageWriter {
public:
    /** \param uid Package uid; a random UUID when empty. */
    explicit DataPackageWriter(std::string name, std::string uid = {}, bool on_receive_delete = false,
                               std::shared_ptr<Logger> logger = nullptr);

    const std::string& name() const { return name_; }
    const std::string& uid() const { return uid_; }
    const std::vector<PackageContent>& contents() const { return contents_; }

    /**
     * \brief Schedule one file.
     * \param zip_entry Name inside the archive; the file name when empty.
     * \throws PackageError when the file does not exist or the entry name is unsafe.
     */
    void add_file(const std::filesystem::path& file, bool ignore = false, std::string zip_entry = {});

    /**
     * \brief Schedule every regular file below `dir`, named by its relative path.
     * \param ignore_pattern Files whose name contains this text are skipped.
     * \throws PackageError when `dir` is not a directory.
     */
    void add_directory(const std::filesystem::path& dir, bool recursive = true,
                       const std::string& ignore_pattern = {});

    /** \brief Indented manifest document with XML declaration. \throws PackageError */
    std::string manifest_xml() const;

    /**
     * \brief Write the archive.
     * \details The extension of `output` is forced to `.zip`, or `.dpk` with `use_dpk_extension`.
     * Without the manifest TAK clients import the files one by one.
     * \return The path actually written.
     * \throws PackageError when nothing was added or a file cannot be read or written.
     */
    std::filesystem::path write(const std::filesystem::path& output, bool use_dpk_extension = false,
                                bool include_manifest = true) const;

    /** \brief Random RFC 4122 version 4 UUID in lower-case hex. \throws PackageError */
    static std::string random_uuid();

    static constexpr const char* kManifestEntry = "MANIFEST/manifest.xml";

private:
    std::string name_;
    std::string uid_;
    bool on_receive_delete_;
    std::vector<PackageContent> contents_;
    std::shared_ptr<Logger> logger_;
};

} // namespace takclient::package
