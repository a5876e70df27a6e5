#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "application/AssetEngine.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using namespace assetbridge;

namespace {

std::atomic<bool> g_interrupted{false};

void HandleSignal(int) {
    g_interrupted = true;
}

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [output_root] [settings.json]\n"
              << "  output_root    Directory holding images/ and 3d_models/ (default: ./output)\n"
              << "  settings.json  Engine settings (default: " << infrastructure::PathUtils::GetSettingsFile().string() << ")"
              << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        PrintUsage(argv[0]);
        return 0;
    }

    const std::string outputRoot = argc > 1 ? argv[1] : (fs::current_path() / "output").string();
    const std::string settingsPath = argc > 2 ? argv[2] : infrastructure::PathUtils::GetSettingsFile().string();

    infrastructure::EngineConfig config = infrastructure::ConfigLoader::Load(settingsPath, outputRoot);
    if (!fs::exists(settingsPath)) {
        infrastructure::ConfigLoader::Save(settingsPath, config);
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try {
        application::AssetEngine engine(config);

        domain::EngineListener listener;
        listener.onAssetDiscovered = [](const domain::Asset& asset, bool sessionScoped) {
            std::cout << "[Monitor] + " << domain::ToString(asset.kind) << " " << asset.path
                      << (sessionScoped ? " [session]" : "") << std::endl;
        };
        listener.onAssetRemoved = [](const std::string& path) {
            std::cout << "[Monitor] - " << path << std::endl;
        };
        listener.onAssociationChanged = [](const std::string& image, const std::string& model) {
            if (model.empty()) {
                std::cout << "[Monitor] Unlinked " << image << std::endl;
            } else {
                std::cout << "[Monitor] Linked " << image << " -> " << model << std::endl;
            }
        };
        listener.onSelectionChanged = [](const std::vector<domain::UnifiedObject>& objects) {
            std::cout << "[Monitor] Selection now holds " << objects.size() << " objects" << std::endl;
            for (const auto& object : objects) {
                std::cout << "[Monitor]   " << domain::ToString(object.stage) << " " << object.key << std::endl;
            }
        };
        engine.addListener(listener);

        engine.start();
        std::cout << "[Monitor] Watching " << outputRoot << " (Ctrl+C to stop)" << std::endl;

        while (!g_interrupted) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        engine.stop();
    } catch (const std::exception& e) {
        std::cerr << "[Monitor] Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
