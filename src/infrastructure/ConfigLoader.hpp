/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the knowledge base configuration (config.json).
 *
 * Keys the program does not know are kept on save, so a newer or hand-edited
 * file round-trips without loss.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/KnowledgeBaseConfig.hpp"

namespace localkb::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads and validates a configuration file.
     * @throws ConfigError(ConfigFile) when the file is missing, unreadable or not JSON.
     * @throws ConfigError(ConfigValidation) when a field is invalid.
     */
    static domain::KnowledgeBaseConfig Load(const std::string& path);

    /** @brief Load(), or defaults (index under $XDG_DATA_HOME/LocalKB/index) when the file does not exist yet. */
    static domain::KnowledgeBaseConfig LoadOrDefault(const std::string& path);

    /**
     * @brief Validates and writes the configuration atomically (temp file + rename).
     * @throws ConfigError on validation or I/O failure.
     */
    static void Save(const domain::KnowledgeBaseConfig& config, const std::string& path);

    /** @brief $XDG_CONFIG_HOME/LocalKB/config.json */
    static std::string DefaultPath();

    static nlohmann::json ToJson(const domain::KnowledgeBaseConfig& config);

    /** @brief Missing keys take defaults; wrongly typed values raise ConfigError(ConfigValidation). */
    static domain::KnowledgeBaseConfig FromJson(const nlohmann::json& j);

private:
    static void AtomicWrite(const std::string& path, const std::string& content);
};

} // namespace localkb::infrastructure
