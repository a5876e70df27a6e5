/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace assetbridge::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kImagePatterns = {"*.png", "*.jpg", "*.jpeg"};
const std::vector<std::string> kModelPatterns = {"*.glb", "*.gltf", "*.obj", "*.fbx"};
const std::vector<std::string> kTexturedPatterns = {"*.glb", "*.gltf", "*.obj", "*.fbx", "*.dae"};

WatchRegistration ParseWatch(const json& j, const WatchRegistration& fallback) {
    WatchRegistration w = fallback;
    w.name = j.value("name", fallback.name);
    w.directory = j.value("directory", fallback.directory);
    w.recursive = j.value("recursive", fallback.recursive);
    if (j.contains("patterns") && j["patterns"].is_array()) {
        w.patterns = j["patterns"].get<std::vector<std::string>>();
    }
    if (j.contains("kind")) {
        auto kind = domain::AssetKindFromString(j["kind"].get<std::string>());
        if (kind) {
            w.kind = *kind;
        } else {
            std::cerr << "[ConfigLoader] Unknown asset kind for watch '" << w.name << "', keeping "
                      << domain::ToString(w.kind) << std::endl;
        }
    }
    return w;
}

json WatchToJson(const WatchRegistration& w) {
    return {
        {"name", w.name},
        {"directory", w.directory},
        {"patterns", w.patterns},
        {"kind", domain::ToString(w.kind)},
        {"recursive", w.recursive}
    };
}

} // namespace

EngineConfig EngineConfig::Defaults(const std::string& outputRoot) {
    EngineConfig config;
    config.stateFile = PathUtils::GetStateFile().string();

    fs::path root(outputRoot);
    config.watches.push_back({"images", (root / "images").string(), kImagePatterns, domain::AssetKind::Image, false});
    config.watches.push_back({"models", (root / "3d_models").string(), kModelPatterns, domain::AssetKind::Model, false});
    config.watches.push_back({"textured", (root / "3d_models" / "textured").string(), kTexturedPatterns,
                              domain::AssetKind::TexturedModel, false});
    return config;
}

EngineConfig ConfigLoader::Load(const std::string& settingsPath, const std::string& outputRoot) {
    EngineConfig config = EngineConfig::Defaults(outputRoot);
    if (!fs::exists(settingsPath)) {
        return config;
    }

    try {
        std::ifstream f(settingsPath);
        json j;
        f >> j;

        config.stateFile = j.value("state_file", config.stateFile);
        config.pollInterval = std::chrono::milliseconds(j.value("poll_interval_ms", config.pollInterval.count()));
        config.maxBackoff = std::chrono::milliseconds(j.value("max_backoff_ms", config.maxBackoff.count()));
        config.channelCapacity = j.value("channel_capacity", config.channelCapacity);
        config.previewTotalQuota = j.value("preview_total_quota", config.previewTotalQuota);
        config.previewSessionQuota = j.value("preview_session_quota", config.previewSessionQuota);
        config.autoLinkWindow = std::chrono::seconds(j.value("auto_link_window_s", config.autoLinkWindow.count()));

        if (j.contains("watches") && j["watches"].is_array()) {
            std::vector<WatchRegistration> watches;
            for (const auto& entry : j["watches"]) {
                // Entries named like a default inherit its patterns and kind.
                WatchRegistration fallback;
                std::string name = entry.value("name", "");
                for (const auto& d : config.watches) {
                    if (d.name == name) fallback = d;
                }
                watches.push_back(ParseWatch(entry, fallback));
            }
            config.watches = std::move(watches);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
        return EngineConfig::Defaults(outputRoot);
    }

    if (config.channelCapacity == 0) config.channelCapacity = 1;
    if (config.pollInterval < std::chrono::milliseconds(1)) {
        std::cerr << "[ConfigLoader] poll_interval_ms must be positive, using 1 ms." << std::endl;
        config.pollInterval = std::chrono::milliseconds(1);
    }
    if (config.maxBackoff < config.pollInterval) config.maxBackoff = config.pollInterval;
    if (config.previewTotalQuota == 0) {
        std::cerr << "[ConfigLoader] preview_total_quota must be at least 1, clamping." << std::endl;
        config.previewTotalQuota = 1;
    }
    if (config.previewSessionQuota > config.previewTotalQuota) {
        std::cerr << "[ConfigLoader] preview_session_quota exceeds preview_total_quota, clamping." << std::endl;
        config.previewSessionQuota = config.previewTotalQuota;
    }
    return config;
}

void ConfigLoader::Save(const std::string& settingsPath, const EngineConfig& config) {
    json j = json::object();

    // Try to load existing to preserve other settings
    if (fs::exists(settingsPath)) {
        try {
            std::ifstream f(settingsPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings unreadable, rewriting: " << e.what() << std::endl;
            j = json::object();
        }
    }

    j["state_file"] = config.stateFile;
    j["poll_interval_ms"] = config.pollInterval.count();
    j["max_backoff_ms"] = config.maxBackoff.count();
    j["channel_capacity"] = config.channelCapacity;
    j["preview_total_quota"] = config.previewTotalQuota;
    j["preview_session_quota"] = config.previewSessionQuota;
    j["auto_link_window_s"] = config.autoLinkWindow.count();
    j["watches"] = json::array();
    for (const auto& w : config.watches) {
        j["watches"].push_back(WatchToJson(w));
    }

    try {
        fs::path p(settingsPath);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        std::ofstream f(settingsPath);
        f << j.dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << settingsPath << ": " << e.what() << std::endl;
    }
}

} // namespace assetbridge::infrastructure
