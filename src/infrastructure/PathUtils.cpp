#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <iostream>

namespace localkb::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDir = "LocalKB";

// $<variable> when set and non-empty, else $HOME/<homeRelative>, else the working directory.
fs::path XdgDirectory(const char* variable, const fs::path& homeRelative) {
    if (const char* value = std::getenv(variable); value && *value) {
        return fs::path(value);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgDirectory("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgDirectory("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetDefaultConfigPath() {
    return GetConfigHome() / kAppDir / "config.json";
}

fs::path PathUtils::GetDefaultIndexDir() {
    const fs::path dir = GetDataHome() / kAppDir / "index";
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot create " << dir << ": " << ec.message() << std::endl;
    }
    return dir;
}

} // namespace localkb::infrastructure
