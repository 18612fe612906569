/**
 * @file KnowledgeBaseConfig.hpp
 * @brief Settings consumed by the knowledge base core.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace localkb::domain {

/**
 * @enum IndexStatus
 * @brief Lifecycle of the persisted index: not_created -> creating -> created, error from any.
 */
enum class IndexStatus {
    NotCreated,
    Creating,
    Created,
    Error
};

std::string IndexStatusToString(IndexStatus status);
std::optional<IndexStatus> IndexStatusFromString(const std::string& value);

/**
 * @struct Endpoint
 * @brief Host and port split out of a base URL such as "http://localhost:11434".
 */
struct Endpoint {
    std::string scheme = "http";
    std::string host = "localhost";
    int port = 11434;
};

/**
 * @struct KnowledgeBaseConfig
 * @brief Configuration fields; the core updates indexStatus during indexing.
 */
struct KnowledgeBaseConfig {
    std::string ollamaHost = "http://localhost:11434";
    std::string ollamaModel = "llama3:8b";
    std::string embeddingModel = "nomic-embed-text";
    std::string dbPath = "./data/localkb";
    std::string collectionName = "knowledge_base";
    int maxChatHistory = 50;
    int maxFileSizeMb = 50;
    std::vector<std::string> supportedExtensions = {".pdf", ".txt", ".md", ".docx"};
    std::vector<std::string> selectedFolders;
    IndexStatus indexStatus = IndexStatus::NotCreated;
    std::string logLevel = "INFO";
    std::vector<std::string> supportedEmbeddingModels = {
        "nomic-embed-text", "mxbai-embed-large", "all-minilm", "snowflake-arctic-embed"};

    /** @throws ConfigError(ConfigValidation) on the first invalid field. */
    void validate() const;

    /** @brief Adds a folder unless already present. @return true if added. */
    bool addSelectedFolder(const std::string& folder);
    bool removeSelectedFolder(const std::string& folder);
    void clearSelectedFolders() { selectedFolders.clear(); }

    /** @brief Case-insensitive; accepts "md" as well as ".md". */
    bool isExtensionSupported(const std::string& extension) const;

    long long maxFileSizeBytes() const { return static_cast<long long>(maxFileSizeMb) * 1024 * 1024; }

    /** @brief Splits ollamaHost into scheme/host/port (port defaults to 11434). */
    Endpoint ollamaEndpoint() const;
};

/** @brief URL parsing behind KnowledgeBaseConfig::ollamaEndpoint(). */
Endpoint ParseEndpoint(const std::string& url);

} // namespace localkb::domain
