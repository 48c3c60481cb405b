/**
 * \file package/PreferencePackage.hpp
 * \brief Imports TAK preference/data packages into a \ref config::Config.
 * \ingroup package_module
 */
#pragma once

#include "config/Config.hpp"
#include "logger.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace takclient::package {

/** \brief Outcome of \ref PreferencePackage::import. */
struct ImportResult {
    config::Config settings;                    ///< Values found in the package, paths already rewritten
    std::filesystem::path workdir;              ///< Extraction directory (left in place)
    std::filesystem::path settings_file;        ///< The `.ini` or `.pref` that was read
    std::vector<std::filesystem::path> files;   ///< Every extracted file

    /** \brief Fill keys `target` does not already have. \return Keys filled. */
    std::size_t merge_into(config::Config& target) const { return target.merge_missing(settings); }
};

class PreferencePackage {
public:
    explicit PreferencePackage(std::shared_ptr<Logger> logger = nullptr);

    /**
     * \brief Extract `path` and read its settings.
     * \param workdir Extraction directory; a fresh `takclient_dp_XXXXXX` temp directory when absent.
     * \throws PackageError when the archive cannot be read, holds no settings document, or
     * references a certificate it does not contain.
     * \throws DependencyMissing, CertificateError from PKCS#12 conversion.
     */
    ImportResult import(const std::filesystem::path& path,
                        const std::optional<std::filesystem::path>& workdir = std::nullopt) const;

    /** \brief Map `<entry key=..>` elements of a TAK `.pref` document to configuration keys. */
    static config::Config parse_pref(const std::string& xml);

    /** \brief `host:port:proto` to `proto://host:port`. \throws PackageError */
    static std::string connect_string_to_url(const std::string& connect_string);

    /** \brief Locate `reference` below `root`: relative path first, then by file name anywhere. */
    static std::optional<std::filesystem::path> find_file(const std::filesystem::path& root,
                                                          const std::string& reference);

private:
    void convert_pkcs12(config::Config& settings, const std::filesystem::path& workdir) const;

    std::shared_ptr<Logger> logger_;
};

} // namespace takclient::package
