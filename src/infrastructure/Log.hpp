/**
 * @file Log.hpp
 * @brief Process-wide log level gate for the "[Component] message" console output.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <string>

namespace localkb::infrastructure {

class Log {
public:
    enum class Level { Debug = 0, Info, Warning, Error, Critical };

    /** @brief Accepts "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL" (any case); others map to Info. */
    static void SetLevel(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c){ return std::toupper(c); });
        Level level = Level::Info;
        if (upper == "DEBUG") level = Level::Debug;
        else if (upper == "WARNING") level = Level::Warning;
        else if (upper == "ERROR") level = Level::Error;
        else if (upper == "CRITICAL") level = Level::Critical;
        Threshold().store(static_cast<int>(level));
    }

    static bool Enabled(Level level) {
        return static_cast<int>(level) >= Threshold().load();
    }

private:
    static std::atomic<int>& Threshold() {
        static std::atomic<int> threshold{static_cast<int>(Level::Info)};
        return threshold;
    }
};

} // namespace localkb::infrastructure
