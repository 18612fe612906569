/**
 * @file Document.hpp
 * @brief Domain entity representing one ingested source document.
 */

#pragma once
#include <string>
#include <chrono>
#include <optional>

namespace localkb::domain {

/**
 * @enum FileType
 * @brief The fixed set of document formats the knowledge base accepts.
 */
enum class FileType {
    Pdf,
    Text,
    Markdown,
    RichText
};

/** @brief Serialized tag: "pdf", "text", "markdown" or "rich-text". */
std::string FileTypeToString(FileType type);

/** @brief Inverse of FileTypeToString; nullopt for unknown tags. */
std::optional<FileType> FileTypeFromString(const std::string& tag);

/** @brief Random RFC 4122 version 4 identifier. */
std::string GenerateUuid();

/** @brief UTC ISO-8601 rendering ("2024-01-31T12:00:00Z"). */
std::string ToIsoTimestamp(const std::chrono::system_clock::time_point& tp);

/**
 * @class Document
 * @brief A logical unit of knowledge read from a file on disk.
 *
 * Content is never empty: create() rejects empty text with EmptyContent.
 */
class Document {
public:
    using Clock = std::chrono::system_clock;

    /**
     * @brief Builds a new document with a fresh identifier.
     * @param title Human readable title (usually the file stem).
     * @param content Extracted text; must be non-empty.
     * @param filePath Originating file.
     * @param type Format tag.
     * @throws IngestionError when content is empty.
     */
    static Document create(const std::string& title,
                           const std::string& content,
                           const std::string& filePath,
                           FileType type);

    /** @brief Rehydrates a document with a known identifier (used by update). */
    static Document withId(const std::string& id,
                           const std::string& title,
                           const std::string& content,
                           const std::string& filePath,
                           FileType type);

    const std::string& getId() const { return m_id; }
    const std::string& getTitle() const { return m_title; }
    const std::string& getContent() const { return m_content; }
    const std::string& getFilePath() const { return m_filePath; }
    FileType getFileType() const { return m_fileType; }
    size_t getFileSize() const { return m_fileSize; }
    Clock::time_point getCreatedAt() const { return m_createdAt; }
    Clock::time_point getUpdatedAt() const { return m_updatedAt; }

    /** @brief File name component of the originating path. */
    std::string getFilename() const;

    /** @brief Replaces content, refreshing the update timestamp and size. */
    void updateContent(const std::string& newContent);

    /** @brief First maxLength characters, with "..." appended when truncated. */
    std::string contentPreview(size_t maxLength = 100) const;

    /** @brief Whitespace separated word count. */
    size_t wordCount() const;

private:
    Document() = default;

    std::string m_id;
    std::string m_title;
    std::string m_content;
    std::string m_filePath;
    FileType m_fileType = FileType::Text;
    size_t m_fileSize = 0;              ///< Bytes of UTF-8 content.
    Clock::time_point m_createdAt;
    Clock::time_point m_updatedAt;
};

} // namespace localkb::domain
