// PathUtils Header
#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

namespace assetbridge::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief Default location of settings.json ($XDG_CONFIG_HOME/AssetBridge). */
    static std::filesystem::path GetSettingsFile();
    /** @brief Default location of the persisted association/selection document. */
    static std::filesystem::path GetStateFile();

    static std::chrono::system_clock::time_point ToSystemTime(std::filesystem::file_time_type ftime);

    /** @brief Case-insensitive glob match supporting '*' and '?'. */
    static bool MatchesPattern(const std::string& filename, const std::string& pattern);
    static bool MatchesAnyPattern(const std::string& filename, const std::vector<std::string>& patterns);

    /** @brief Lexically normalized absolute form used as asset identity. */
    static std::string Canonical(const std::filesystem::path& path);

    static std::string ToLower(std::string value);
};

} // namespace assetbridge::infrastructure
