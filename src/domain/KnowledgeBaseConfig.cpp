/**
 * @file KnowledgeBaseConfig.cpp
 * @brief Validation and helpers for KnowledgeBaseConfig.
 */

#include "domain/KnowledgeBaseConfig.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace localkb::domain {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
    return s;
}

} // namespace

std::string IndexStatusToString(IndexStatus status) {
    switch (status) {
        case IndexStatus::NotCreated: return "not_created";
        case IndexStatus::Creating: return "creating";
        case IndexStatus::Created: return "created";
        case IndexStatus::Error: return "error";
    }
    return "not_created";
}

std::optional<IndexStatus> IndexStatusFromString(const std::string& value) {
    if (value == "not_created") return IndexStatus::NotCreated;
    if (value == "creating") return IndexStatus::Creating;
    if (value == "created") return IndexStatus::Created;
    if (value == "error") return IndexStatus::Error;
    return std::nullopt;
}

void KnowledgeBaseConfig::validate() const {
    auto require = [](bool ok, const std::string& field, const std::string& message) {
        if (!ok) {
            throw ConfigError(ErrorCode::ConfigValidation, message, {{"field", field}});
        }
    };
    require(!ollamaHost.empty(), "ollama_host", "ollama_host is required");
    require(!ollamaModel.empty(), "ollama_model", "ollama_model is required");
    require(!embeddingModel.empty(), "embedding_model", "embedding_model is required");
    require(!collectionName.empty(), "collection_name", "collection_name is required");
    require(maxChatHistory >= 1, "max_chat_history", "max_chat_history must be at least 1");
    require(maxFileSizeMb >= 1, "max_file_size_mb", "max_file_size_mb must be at least 1");

    static const std::vector<std::string> kLevels = {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};
    const std::string level = ToUpper(logLevel);
    require(std::find(kLevels.begin(), kLevels.end(), level) != kLevels.end(),
            "log_level", "Invalid log_level: " + logLevel);
}

bool KnowledgeBaseConfig::addSelectedFolder(const std::string& folder) {
    if (folder.empty()) return false;
    if (std::find(selectedFolders.begin(), selectedFolders.end(), folder) != selectedFolders.end()) {
        return false;
    }
    selectedFolders.push_back(folder);
    return true;
}

bool KnowledgeBaseConfig::removeSelectedFolder(const std::string& folder) {
    auto it = std::find(selectedFolders.begin(), selectedFolders.end(), folder);
    if (it == selectedFolders.end()) return false;
    selectedFolders.erase(it);
    return true;
}

bool KnowledgeBaseConfig::isExtensionSupported(const std::string& extension) const {
    std::string ext = ToLower(extension);
    if (!ext.empty() && ext.front() != '.') ext = "." + ext;
    for (const auto& supported : supportedExtensions) {
        if (ToLower(supported) == ext) return true;
    }
    return false;
}

Endpoint KnowledgeBaseConfig::ollamaEndpoint() const {
    return ParseEndpoint(ollamaHost);
}

Endpoint ParseEndpoint(const std::string& url) {
    Endpoint ep;
    std::string rest = url;
    auto schemePos = rest.find("://");
    if (schemePos != std::string::npos) {
        ep.scheme = rest.substr(0, schemePos);
        rest = rest.substr(schemePos + 3);
    }
    auto slash = rest.find('/');
    if (slash != std::string::npos) rest = rest.substr(0, slash);

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        ep.host = rest.substr(0, colon);
        try {
            ep.port = std::stoi(rest.substr(colon + 1));
        } catch (const std::exception&) {
            throw ConfigError(ErrorCode::ConfigValidation, "Invalid port in URL: " + url, {{"field", "ollama_host"}});
        }
    } else if (!rest.empty()) {
        ep.host = rest;
    }
    return ep;
}

} // namespace localkb::domain
