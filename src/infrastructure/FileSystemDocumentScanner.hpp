/**
 * @file FileSystemDocumentScanner.hpp
 * @brief Finds indexable files under the selected folders.
 */

#pragma once
#include <string>
#include <vector>

namespace localkb::infrastructure {

/**
 * @struct ScannedFile
 * @brief A candidate file found on disk.
 */
struct ScannedFile {
    std::string path;
    std::string filename;
    long long sizeBytes = 0;
};

/**
 * @class FileSystemDocumentScanner
 * @brief Recursively lists files whose extension is in the supported set.
 */
class FileSystemDocumentScanner {
public:
    explicit FileSystemDocumentScanner(std::vector<std::string> supportedExtensions);

    /**
     * @brief Scans one folder recursively.
     * @return Matching files sorted by path; empty if the folder does not exist.
     */
    std::vector<ScannedFile> scan(const std::string& folder) const;

    /** @brief Scans every folder, skipping (and logging) entries that are not directories. */
    std::vector<ScannedFile> scanAll(const std::vector<std::string>& folders) const;

private:
    bool isSupported(const std::string& extension) const;

    std::vector<std::string> m_extensions; ///< Lowercase, with leading dot.
};

} // namespace localkb::infrastructure
