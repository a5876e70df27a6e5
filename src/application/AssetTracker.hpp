/**
 * @file AssetTracker.hpp
 * @brief Authoritative registry of discovered assets.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "domain/Asset.hpp"

namespace assetbridge::application {

/**
 * @class AssetTracker
 * @brief Append-mostly registry of known assets, keyed by path.
 *
 * Owned by the dispatcher loop; not thread-safe on its own.
 */
class AssetTracker {
public:
    /**
     * @brief Inserts the asset if its path is unknown.
     * @return The stored record and true if it was inserted by this call.
     *         A known path returns the existing record unchanged and false.
     */
    std::pair<domain::Asset, bool> add(const std::string& path, domain::AssetKind kind,
                                       std::chrono::system_clock::time_point modifiedAt);

    /** @brief Removes the asset; returns whether it existed. */
    bool remove(const std::string& path);

    /** @brief Assets of one kind in insertion order (most recent last). */
    std::vector<domain::Asset> listByKind(domain::AssetKind kind) const;

    std::optional<domain::Asset> find(const std::string& path) const;
    bool contains(const std::string& path) const;
    std::size_t size() const { return m_assets.size(); }

private:
    std::unordered_map<std::string, domain::Asset> m_assets;
    std::vector<std::string> m_order; ///< Insertion order across all kinds.
};

} // namespace assetbridge::application
