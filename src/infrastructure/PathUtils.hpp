// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace localkb::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_CONFIG_HOME/LocalKB/config.json */
    static std::filesystem::path GetDefaultConfigPath();

    /** @brief $XDG_DATA_HOME/LocalKB/index, created on demand. */
    static std::filesystem::path GetDefaultIndexDir();
};

} // namespace localkb::infrastructure
