/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/Errors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace localkb::infrastructure {

namespace {

template <typename T>
void ReadKey(const json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        out = j[key].get<T>();
    } catch (const json::exception& e) {
        throw domain::ConfigError(domain::ErrorCode::ConfigValidation,
                                  std::string("Invalid value for '") + key + "'",
                                  {{"key", key}, {"reason", e.what()}});
    }
}

json ReadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw domain::ConfigError(domain::ErrorCode::ConfigFile, "Cannot open configuration file",
                                  {{"path", path}});
    }
    try {
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        throw domain::ConfigError(domain::ErrorCode::ConfigFile, "Configuration file is not valid JSON",
                                  {{"path", path}, {"reason", e.what()}});
    }
}

} // namespace

std::string ConfigLoader::DefaultPath() {
    return PathUtils::GetDefaultConfigPath().string();
}

json ConfigLoader::ToJson(const domain::KnowledgeBaseConfig& config) {
    return {
        {"ollama_host", config.ollamaHost},
        {"ollama_model", config.ollamaModel},
        {"embedding_model", config.embeddingModel},
        {"db_path", config.dbPath},
        {"collection_name", config.collectionName},
        {"max_chat_history", config.maxChatHistory},
        {"max_file_size_mb", config.maxFileSizeMb},
        {"supported_extensions", config.supportedExtensions},
        {"selected_folders", config.selectedFolders},
        {"index_status", domain::IndexStatusToString(config.indexStatus)},
        {"log_level", config.logLevel},
        {"supported_embedding_models", config.supportedEmbeddingModels}
    };
}

domain::KnowledgeBaseConfig ConfigLoader::FromJson(const json& j) {
    domain::KnowledgeBaseConfig config;
    if (!j.is_object()) {
        throw domain::ConfigError(domain::ErrorCode::ConfigValidation, "Configuration must be a JSON object");
    }
    ReadKey(j, "ollama_host", config.ollamaHost);
    ReadKey(j, "ollama_model", config.ollamaModel);
    ReadKey(j, "embedding_model", config.embeddingModel);
    ReadKey(j, "db_path", config.dbPath);
    ReadKey(j, "collection_name", config.collectionName);
    ReadKey(j, "max_chat_history", config.maxChatHistory);
    ReadKey(j, "max_file_size_mb", config.maxFileSizeMb);
    ReadKey(j, "supported_extensions", config.supportedExtensions);
    ReadKey(j, "selected_folders", config.selectedFolders);
    ReadKey(j, "log_level", config.logLevel);
    ReadKey(j, "supported_embedding_models", config.supportedEmbeddingModels);

    std::string status;
    ReadKey(j, "index_status", status);
    if (!status.empty()) {
        auto parsed = domain::IndexStatusFromString(status);
        if (!parsed) {
            throw domain::ConfigError(domain::ErrorCode::ConfigValidation, "Unknown index_status",
                                      {{"key", "index_status"}, {"value", status}});
        }
        config.indexStatus = *parsed;
    }
    return config;
}

domain::KnowledgeBaseConfig ConfigLoader::Load(const std::string& path) {
    if (!fs::exists(path)) {
        throw domain::ConfigError(domain::ErrorCode::ConfigFile, "Configuration file not found",
                                  {{"path", path}});
    }
    auto config = FromJson(ReadFile(path));
    config.validate();
    return config;
}

domain::KnowledgeBaseConfig ConfigLoader::LoadOrDefault(const std::string& path) {
    if (!fs::exists(path)) {
        std::cout << "[ConfigLoader] No configuration at " << path << ", using defaults" << std::endl;
        domain::KnowledgeBaseConfig defaults;
        defaults.dbPath = PathUtils::GetDefaultIndexDir().string();
        return defaults;
    }
    return Load(path);
}

void ConfigLoader::Save(const domain::KnowledgeBaseConfig& config, const std::string& path) {
    config.validate();

    json j = json::object();
    // Try to load existing to preserve other settings
    if (fs::exists(path)) {
        try {
            j = ReadFile(path);
        } catch (const domain::ConfigError& e) {
            std::cerr << "[ConfigLoader] Existing file unreadable, overwriting: " << e.what() << std::endl;
            j = json::object();
        }
        if (!j.is_object()) j = json::object();
    }
    j.update(ToJson(config));

    AtomicWrite(path, j.dump(4, ' ', false, json::error_handler_t::replace));
}

void ConfigLoader::AtomicWrite(const std::string& path, const std::string& content) {
    fs::path finalPath = path;

    // Unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::ConfigError(domain::ErrorCode::ConfigFile, "Cannot create configuration directory",
                                      {{"path", finalPath.parent_path().string()}, {"reason", ec.message()}});
        }
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw domain::ConfigError(domain::ErrorCode::ConfigFile, "Failed to open temp file",
                                      {{"path", tempPath.string()}});
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::ConfigError(domain::ErrorCode::ConfigFile, "Write failed",
                                      {{"path", tempPath.string()}});
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw domain::ConfigError(domain::ErrorCode::ConfigFile, "Rename failed",
                                  {{"path", path}, {"reason", ec.message()}});
    }
}

} // namespace localkb::infrastructure
