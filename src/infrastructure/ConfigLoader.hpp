/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine configuration (settings.json).
 *
 * Every key is optional; anything missing or malformed falls back to the
 * defaults below so a broken settings file never prevents the engine from starting.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "infrastructure/DirectoryWatcher.hpp"

namespace assetbridge::infrastructure {

/**
 * @struct EngineConfig
 * @brief Tunables and watched directories of the asset engine.
 */
struct EngineConfig {
    std::string stateFile;                              ///< Persisted association/selection document.
    std::chrono::milliseconds pollInterval{500};
    std::chrono::milliseconds maxBackoff{10000};
    std::size_t channelCapacity = 256;
    std::size_t previewTotalQuota = 50;
    std::size_t previewSessionQuota = 30;
    std::chrono::seconds autoLinkWindow{1800};
    std::vector<WatchRegistration> watches;

    /** @brief images/, 3d_models/ and 3d_models/textured/ under the given root. */
    static EngineConfig Defaults(const std::string& outputRoot);
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json at the given path.
     * @param settingsPath Path to the settings document.
     * @param outputRoot Base directory for default watch locations.
     */
    static EngineConfig Load(const std::string& settingsPath, const std::string& outputRoot);

    /**
     * @brief Writes the configuration, preserving unknown keys already in the file.
     */
    static void Save(const std::string& settingsPath, const EngineConfig& config);
};

} // namespace assetbridge::infrastructure
