/**
 * @file AssetTracker.cpp
 * @brief Implementation of AssetTracker.
 */

#include "application/AssetTracker.hpp"
#include <algorithm>

namespace assetbridge::application {

std::pair<domain::Asset, bool> AssetTracker::add(const std::string& path, domain::AssetKind kind,
                                                 std::chrono::system_clock::time_point modifiedAt) {
    auto it = m_assets.find(path);
    if (it != m_assets.end()) {
        return {it->second, false};
    }

    domain::Asset asset(path, kind, modifiedAt);
    m_assets.emplace(path, asset);
    m_order.push_back(path);
    return {asset, true};
}

bool AssetTracker::remove(const std::string& path) {
    if (m_assets.erase(path) == 0) {
        return false;
    }
    m_order.erase(std::remove(m_order.begin(), m_order.end(), path), m_order.end());
    return true;
}

std::vector<domain::Asset> AssetTracker::listByKind(domain::AssetKind kind) const {
    std::vector<domain::Asset> result;
    for (const auto& path : m_order) {
        const auto& asset = m_assets.at(path);
        if (asset.kind == kind) {
            result.push_back(asset);
        }
    }
    return result;
}

std::optional<domain::Asset> AssetTracker::find(const std::string& path) const {
    auto it = m_assets.find(path);
    if (it == m_assets.end()) return std::nullopt;
    return it->second;
}

bool AssetTracker::contains(const std::string& path) const {
    return m_assets.count(path) > 0;
}

} // namespace assetbridge::application
