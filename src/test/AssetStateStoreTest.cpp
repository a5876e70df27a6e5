#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <nlohmann/json.hpp>

#include "infrastructure/AssetStateStore.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace assetbridge;
namespace fs = std::filesystem;

namespace {

std::string ReadAll(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void TestStateRoundTrip(const fs::path& root) {
    const fs::path document = root / "state" / "asset_state.json";
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    infrastructure::AssetStateStore store(document.string(), persistence);

    // 1. Missing document is an empty state
    auto empty = store.load();
    assert(empty.associations.empty() && empty.selected.empty() && empty.textured.empty());

    // 2. Save and load back
    const auto created = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
    infrastructure::PersistedState state;
    state.associations.push_back(domain::Association{"/out/images/a.png", "/out/3d_models/a.glb", created});
    state.selected["/out/images/a.png"] = true;
    state.selected["/out/images/b.png"] = false;
    state.textured["/out/3d_models/a.glb"] = "/out/3d_models/textured/a_textured.glb";
    state.textured["/out/3d_models/c.glb"] = "";
    store.save(state);
    persistence->flush();

    assert(fs::exists(document));
    auto loaded = store.load();
    assert(loaded.associations.size() == 1);
    assert(loaded.associations[0].imagePath == "/out/images/a.png");
    assert(loaded.associations[0].modelPath == "/out/3d_models/a.glb");
    assert(loaded.associations[0].createdAt == created);
    assert(loaded.selected == state.selected);
    assert(loaded.textured == state.textured);

    auto j = nlohmann::json::parse(ReadAll(document));
    assert(j["associations"]["/out/images/a.png"]["model"] == "/out/3d_models/a.glb");
    assert(j["associations"]["/out/images/a.png"]["created_at"] == 1700000000123LL);
    std::cout << "[PASS] State document round-trip." << std::endl;

    // 3. Writes to the same document coalesce, latest wins
    for (int i = 0; i < 20; ++i) {
        state.selected["/out/images/a.png"] = (i % 2 == 1);
        store.save(state);
    }
    persistence->flush();
    assert(store.load().selected.at("/out/images/a.png") == true);
    assert(persistence->failedWrites() == 0);
    for (const auto& entry : fs::directory_iterator(document.parent_path())) {
        assert(entry.path().extension() != ".tmp");
    }
    std::cout << "[PASS] Coalesced atomic writes." << std::endl;

    // 4. Corrupt document falls back to empty state
    persistence->stop();
    {
        std::ofstream out(document);
        out << "{ not json";
    }
    auto corrupt = store.load();
    assert(corrupt.associations.empty() && corrupt.selected.empty());
    std::cout << "[PASS] Corrupt document tolerated." << std::endl;
}

void TestConfig(const fs::path& root) {
    const fs::path settings = root / "config" / "settings.json";
    const std::string outputRoot = (root / "output").string();

    // 1. Defaults
    auto defaults = infrastructure::ConfigLoader::Load(settings.string(), outputRoot);
    assert(defaults.pollInterval == std::chrono::milliseconds(500));
    assert(defaults.channelCapacity == 256);
    assert(defaults.previewTotalQuota == 50 && defaults.previewSessionQuota == 30);
    assert(defaults.autoLinkWindow == std::chrono::seconds(1800));
    assert(defaults.watches.size() == 3);
    assert(defaults.watches[0].name == "images" && defaults.watches[0].kind == domain::AssetKind::Image);
    assert(defaults.watches[2].kind == domain::AssetKind::TexturedModel);
    assert(fs::path(defaults.watches[1].directory) == fs::path(outputRoot) / "3d_models");

    // 2. Overrides, clamping and named-watch inheritance
    fs::create_directories(settings.parent_path());
    {
        std::ofstream out(settings);
        out << R"({
            "custom_key": "keep me",
            "poll_interval_ms": 50,
            "preview_total_quota": 10,
            "preview_session_quota": 20,
            "channel_capacity": 0,
            "watches": [
                { "name": "images", "directory": "/data/renders" },
                { "name": "scans", "directory": "/data/scans", "patterns": ["*.obj"], "kind": "model", "recursive": true }
            ]
        })";
    }
    auto config = infrastructure::ConfigLoader::Load(settings.string(), outputRoot);
    assert(config.pollInterval == std::chrono::milliseconds(50));
    assert(config.previewTotalQuota == 10);
    assert(config.previewSessionQuota == 10);
    assert(config.channelCapacity == 1);
    assert(config.watches.size() == 2);
    assert(config.watches[0].directory == "/data/renders");
    assert(config.watches[0].patterns.size() == 3); // inherited from the default "images" watch
    assert(config.watches[1].kind == domain::AssetKind::Model && config.watches[1].recursive);
    std::cout << "[PASS] Settings overrides." << std::endl;

    // 3. Save keeps unknown keys
    config.autoLinkWindow = std::chrono::seconds(60);
    infrastructure::ConfigLoader::Save(settings.string(), config);
    auto j = nlohmann::json::parse(ReadAll(settings));
    assert(j["custom_key"] == "keep me");
    assert(j["auto_link_window_s"] == 60);
    assert(j["watches"][1]["kind"] == "model");

    auto reloaded = infrastructure::ConfigLoader::Load(settings.string(), outputRoot);
    assert(reloaded.autoLinkWindow == std::chrono::seconds(60));
    std::cout << "[PASS] Settings save preserves unknown keys." << std::endl;

    // 4. Values that would stall or stop the engine are clamped
    {
        std::ofstream out(settings);
        out << R"({ "poll_interval_ms": 0, "max_backoff_ms": -5, "preview_total_quota": 0, "preview_session_quota": 4 })";
    }
    auto clamped = infrastructure::ConfigLoader::Load(settings.string(), outputRoot);
    assert(clamped.pollInterval == std::chrono::milliseconds(1));
    assert(clamped.maxBackoff >= clamped.pollInterval);
    assert(clamped.previewTotalQuota == 1);
    assert(clamped.previewSessionQuota == 1);
    {
        std::ofstream out(settings);
        out << R"({ "poll_interval_ms": 200, "max_backoff_ms": 50 })";
    }
    clamped = infrastructure::ConfigLoader::Load(settings.string(), outputRoot);
    assert(clamped.pollInterval == std::chrono::milliseconds(200));
    assert(clamped.maxBackoff == std::chrono::milliseconds(200));
    std::cout << "[PASS] Settings clamped to usable values." << std::endl;

    // 5. Unreadable settings fall back to defaults
    {
        std::ofstream out(settings);
        out << "[broken";
    }
    auto fallback = infrastructure::ConfigLoader::Load(settings.string(), outputRoot);
    assert(fallback.watches.size() == 3);
    assert(fallback.pollInterval == std::chrono::milliseconds(500));
    std::cout << "[PASS] Broken settings fall back to defaults." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AssetStateStore Test..." << std::endl;

    fs::path root = fs::temp_directory_path() / "assetbridge_state_test";
    fs::remove_all(root);
    fs::create_directories(root);

    TestStateRoundTrip(root);
    TestConfig(root);

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
