/**
 * @file AssetStateStore.cpp
 * @brief Implementation of AssetStateStore.
 */

#include "infrastructure/AssetStateStore.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace assetbridge::infrastructure {

AssetStateStore::AssetStateStore(std::string documentPath, std::shared_ptr<PersistenceService> persistence)
    : m_documentPath(std::move(documentPath)), m_persistence(std::move(persistence)) {}

PersistedState AssetStateStore::load() const {
    PersistedState state;
    if (m_documentPath.empty() || !fs::exists(m_documentPath)) {
        std::cout << "[AssetStateStore] No existing state document, starting fresh" << std::endl;
        return state;
    }

    try {
        std::ifstream f(m_documentPath);
        json j = json::parse(f);

        if (j.contains("associations") && j["associations"].is_object()) {
            for (auto it = j["associations"].begin(); it != j["associations"].end(); ++it) {
                if (!it.value().contains("model")) continue;
                domain::Association assoc;
                assoc.imagePath = it.key();
                assoc.modelPath = it.value()["model"].get<std::string>();
                long long ms = it.value().value("created_at", 0LL);
                assoc.createdAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
                state.associations.push_back(assoc);
            }
        }
        if (j.contains("selected") && j["selected"].is_object()) {
            state.selected = j["selected"].get<std::map<std::string, bool>>();
        }
        if (j.contains("textured") && j["textured"].is_object()) {
            state.textured = j["textured"].get<std::map<std::string, std::string>>();
        }
        std::cout << "[AssetStateStore] Loaded " << state.associations.size() << " image-model associations" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[AssetStateStore] Failed to load " << m_documentPath << ": " << e.what() << std::endl;
        return PersistedState{};
    }
    return state;
}

void AssetStateStore::save(const PersistedState& state) {
    if (m_documentPath.empty() || !m_persistence) return;

    json j;
    j["associations"] = json::object();
    for (const auto& assoc : state.associations) {
        j["associations"][assoc.imagePath] = {
            {"model", assoc.modelPath},
            {"created_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                assoc.createdAt.time_since_epoch()).count()}
        };
    }
    j["selected"] = state.selected;
    j["textured"] = state.textured;

    m_persistence->saveTextAsync(m_documentPath, j.dump(2));
}

} // namespace assetbridge::infrastructure
