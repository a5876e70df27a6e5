#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <mutex>
#include "application/AssetEngine.hpp"
#include "application/ResourceAdmissionController.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace assetbridge;
namespace fs = std::filesystem;

namespace {

void StressAdmission() {
    std::cout << "[Test] Hammering ResourceAdmissionController from 8 threads..." << std::endl;

    const std::size_t kTotal = 10;
    const std::size_t kSession = 6;
    application::ResourceAdmissionController previews(kTotal, kSession);
    std::atomic<int> evictions{0};
    previews.setEvictionCallback([&](const application::ResourceHandle&, const std::string&) { ++evictions; });

    std::atomic<bool> violated{false};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            std::vector<application::ResourceHandle> mine;
            for (int i = 0; i < 500; ++i) {
                auto handle = previews.acquire((i + t) % 3 == 0, "t" + std::to_string(t));
                if (handle) mine.push_back(*handle);
                if (previews.activeCount() > kTotal || previews.sessionActiveCount() > kSession) {
                    violated = true;
                }
                if (mine.size() > 3) {
                    previews.release(mine.front());
                    mine.erase(mine.begin());
                }
            }
            for (const auto& handle : mine) previews.release(handle);
        });
    }
    for (auto& t : threads) t.join();

    assert(!violated.load());
    assert(previews.activeCount() == 0);
    assert(previews.sessionActiveCount() == 0);
    std::cout << "[PASS] Quotas held under contention (" << evictions.load() << " evictions)." << std::endl;
}

void StressEngineIngest() {
    std::cout << "[Test] Feeding the engine from many producers..." << std::endl;

    // Use a test-specific root to avoid cluttering real user data
    fs::path testRoot = fs::temp_directory_path() / "assetbridge_concurrency_test";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    infrastructure::EngineConfig config = infrastructure::EngineConfig::Defaults(testRoot.string());
    config.stateFile = (testRoot / "state.json").string();
    config.channelCapacity = 8; // small channel so producers hit backpressure
    config.watches.clear();

    const int kProducers = 8;
    const int kPerProducer = 25;
    std::atomic<int> discovered{0};
    {
        application::AssetEngine engine(config);
        domain::EngineListener listener;
        listener.onAssetDiscovered = [&](const domain::Asset&, bool) { ++discovered; };
        engine.addListener(listener);
        engine.start();

        std::vector<std::thread> producers;
        for (int p = 0; p < kProducers; ++p) {
            producers.emplace_back([&engine, &testRoot, p] {
                for (int i = 0; i < kPerProducer; ++i) {
                    domain::DiscoveryEvent event;
                    event.path = (testRoot / "images" / ("p" + std::to_string(p) + "_" + std::to_string(i) + ".png")).string();
                    event.kind = domain::AssetKind::Image;
                    event.modifiedAt = std::chrono::system_clock::now();
                    engine.ingest(event);
                    engine.ingest(event); // duplicate discovery must stay silent
                }
            });
        }

        // Concurrent readers and writers going through the same loop.
        std::thread selector([&] {
            for (int i = 0; i < 100; ++i) {
                for (const auto& asset : engine.assets(domain::AssetKind::Image)) {
                    engine.toggle(asset.path);
                }
                engine.unifiedView();
            }
        });

        for (auto& t : producers) t.join();
        selector.join();
        engine.flush();

        assert(engine.assets(domain::AssetKind::Image).size() == static_cast<size_t>(kProducers * kPerProducer));
        engine.stop();
    }

    assert(discovered.load() == kProducers * kPerProducer);
    std::cout << "[PASS] " << discovered.load() << " unique discoveries, no duplicates or losses." << std::endl;

    fs::remove_all(testRoot);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;
    StressAdmission();
    StressEngineIngest();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
