#include <cassert>
#include <chrono>
#include <iostream>

#include "application/LazyViewLoader.hpp"
#include "domain/EngineErrors.hpp"

using namespace assetbridge;
using application::LazyViewLoader;
using domain::AssetKind;

int main() {
    std::cout << "[Test] Starting LazyViewLoader Test..." << std::endl;

    const auto now = std::chrono::system_clock::now();
    LazyViewLoader loader;
    loader.registerView(application::ViewSpec{"images", {"/out/images", {"*.png"}, AssetKind::Image, false}});
    loader.registerView(application::ViewSpec{"models", {"/out/3d_models", {"*.glb"}, AssetKind::Model, false}});

    int scans = 0;
    LazyViewLoader::ScanFunction scan = [&](const application::ViewSpec& spec) {
        ++scans;
        assert(spec.name == "images");
        return std::vector<domain::Asset>{domain::Asset("/out/images/a.png", AssetKind::Image, now)};
    };

    // 1. Cold cache
    assert(loader.state("images") == LazyViewLoader::State::NotLoaded);
    assert(!loader.cached("images").has_value());

    // 2. First activation scans, second one does not
    auto assets = loader.activate("images", scan);
    assert(assets.size() == 1);
    assert(scans == 1);
    assets = loader.activate("images", scan);
    assert(assets.size() == 1);
    assert(scans == 1);
    assert(loader.scanCount("images") == 1);
    std::cout << "[PASS] One scan per activation interval." << std::endl;

    // 3. Incremental discovery
    loader.onDiscovered(domain::Asset("/out/images/b.png", AssetKind::Image, now));
    loader.onDiscovered(domain::Asset("/out/images/b.png", AssetKind::Image, now)); // duplicate
    loader.onDiscovered(domain::Asset("/out/images/c.jpg", AssetKind::Image, now)); // pattern mismatch
    loader.onDiscovered(domain::Asset("/elsewhere/d.png", AssetKind::Image, now));  // other directory
    loader.onDiscovered(domain::Asset("/out/3d_models/a.glb", AssetKind::Model, now)); // view not loaded
    auto cached = loader.cached("images");
    assert(cached && cached->size() == 2);
    assert(cached->back().path == "/out/images/b.png");
    assert(loader.state("models") == LazyViewLoader::State::NotLoaded);

    loader.onRemoved("/out/images/a.png");
    cached = loader.cached("images");
    assert(cached && cached->size() == 1);
    std::cout << "[PASS] Incremental updates." << std::endl;

    // 4. Invalidation forces a rescan
    loader.invalidate("images");
    assert(loader.state("images") == LazyViewLoader::State::NotLoaded);
    loader.activate("images", scan);
    assert(scans == 2);
    assert(loader.scanCount("images") == 2);
    std::cout << "[PASS] Invalidate." << std::endl;

    // 5. Discoveries arriving mid-scan are merged
    assert(loader.beginScan("models"));
    assert(!loader.beginScan("models")); // already in flight
    loader.onDiscovered(domain::Asset("/out/3d_models/new.glb", AssetKind::Model, now));
    const auto& models = loader.completeScan("models", {
        domain::Asset("/out/3d_models/old.glb", AssetKind::Model, now),
        domain::Asset("/out/3d_models/new.glb", AssetKind::Model, now)
    });
    assert(models.size() == 2);
    assert(loader.state("models") == LazyViewLoader::State::Loaded);

    assert(loader.beginScan("images") == false);
    std::cout << "[PASS] Scan merge." << std::endl;

    // 6. Invalidating during a scan still delivers the scan but forces a rescan
    loader.invalidate("models");
    assert(loader.beginScan("models"));
    loader.invalidate("models");
    assert(loader.state("models") == LazyViewLoader::State::Scanning);
    const auto& stale = loader.completeScan("models", {
        domain::Asset("/out/3d_models/old.glb", AssetKind::Model, now)
    });
    assert(stale.size() == 1);
    assert(loader.state("models") == LazyViewLoader::State::NotLoaded);
    assert(!loader.cached("models").has_value());
    assert(loader.beginScan("models"));
    assert(loader.scanCount("models") == 3);
    loader.completeScan("models", {});
    assert(loader.state("models") == LazyViewLoader::State::Loaded);
    std::cout << "[PASS] Invalidate during scan." << std::endl;

    // 7. Unknown view
    bool notFound = false;
    try {
        loader.state("textured");
    } catch (const domain::NotFoundError&) {
        notFound = true;
    }
    assert(notFound);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
