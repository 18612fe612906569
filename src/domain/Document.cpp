/**
 * @file Document.cpp
 * @brief Implementation of Document and its helpers.
 */

#include "domain/Document.hpp"
#include "domain/Errors.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace localkb::domain {

std::string FileTypeToString(FileType type) {
    switch (type) {
        case FileType::Pdf: return "pdf";
        case FileType::Text: return "text";
        case FileType::Markdown: return "markdown";
        case FileType::RichText: return "rich-text";
    }
    return "text";
}

std::optional<FileType> FileTypeFromString(const std::string& tag) {
    if (tag == "pdf") return FileType::Pdf;
    if (tag == "text") return FileType::Text;
    if (tag == "markdown") return FileType::Markdown;
    if (tag == "rich-text") return FileType::RichText;
    return std::nullopt;
}

std::string GenerateUuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> dist(0, 255);

    unsigned char bytes[16];
    for (auto& b : bytes) {
        b = static_cast<unsigned char>(dist(rng));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string ToIsoTimestamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

Document Document::create(const std::string& title,
                          const std::string& content,
                          const std::string& filePath,
                          FileType type) {
    return withId(GenerateUuid(), title, content, filePath, type);
}

Document Document::withId(const std::string& id,
                          const std::string& title,
                          const std::string& content,
                          const std::string& filePath,
                          FileType type) {
    if (content.empty()) {
        throw IngestionError(ErrorCode::EmptyContent, "Document content is empty", {{"file_path", filePath}});
    }
    Document doc;
    doc.m_id = id;
    doc.m_title = title.empty() ? std::filesystem::path(filePath).stem().string() : title;
    doc.m_content = content;
    doc.m_filePath = filePath;
    doc.m_fileType = type;
    doc.m_fileSize = content.size();
    doc.m_createdAt = Clock::now();
    doc.m_updatedAt = doc.m_createdAt;
    return doc;
}

std::string Document::getFilename() const {
    return std::filesystem::path(m_filePath).filename().string();
}

void Document::updateContent(const std::string& newContent) {
    if (newContent.empty()) {
        throw IngestionError(ErrorCode::EmptyContent, "Document content is empty", {{"file_path", m_filePath}});
    }
    m_content = newContent;
    m_fileSize = newContent.size();
    m_updatedAt = Clock::now();
}

std::string Document::contentPreview(size_t maxLength) const {
    if (m_content.size() <= maxLength) return m_content;
    return m_content.substr(0, maxLength) + "...";
}

size_t Document::wordCount() const {
    std::istringstream iss(m_content);
    size_t count = 0;
    std::string word;
    while (iss >> word) ++count;
    return count;
}

} // namespace localkb::domain
