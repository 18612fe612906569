/**
 * @file FileSystemDocumentScanner.cpp
 * @brief Implementation of the FileSystemDocumentScanner.
 */

#include "infrastructure/FileSystemDocumentScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace localkb::infrastructure {

namespace {

std::string Normalize(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    if (!ext.empty() && ext.front() != '.') ext = "." + ext;
    return ext;
}

} // namespace

FileSystemDocumentScanner::FileSystemDocumentScanner(std::vector<std::string> supportedExtensions) {
    for (auto& ext : supportedExtensions) {
        m_extensions.push_back(Normalize(ext));
    }
}

bool FileSystemDocumentScanner::isSupported(const std::string& extension) const {
    return std::find(m_extensions.begin(), m_extensions.end(), Normalize(extension)) != m_extensions.end();
}

std::vector<ScannedFile> FileSystemDocumentScanner::scan(const std::string& folder) const {
    std::vector<ScannedFile> files;
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        std::cerr << "[FileSystemDocumentScanner] Not a directory: " << folder << std::endl;
        return files;
    }

    fs::recursive_directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[FileSystemDocumentScanner] Cannot open " << folder << ": " << ec.message() << std::endl;
        return files;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        const auto& p = entry.path();
        if (!isSupported(p.extension().string())) continue;

        ScannedFile file;
        file.path = p.string();
        file.filename = p.filename().string();
        file.sizeBytes = static_cast<long long>(entry.file_size(ec));
        if (ec) {
            std::cerr << "[FileSystemDocumentScanner] Cannot stat " << file.path << ": " << ec.message() << std::endl;
            continue;
        }
        files.push_back(file);
    }

    std::sort(files.begin(), files.end(), [](const ScannedFile& a, const ScannedFile& b) {
        return a.path < b.path;
    });
    return files;
}

std::vector<ScannedFile> FileSystemDocumentScanner::scanAll(const std::vector<std::string>& folders) const {
    std::vector<ScannedFile> all;
    for (const auto& folder : folders) {
        auto found = scan(folder);
        all.insert(all.end(), found.begin(), found.end());
    }
    return all;
}

} // namespace localkb::infrastructure
