/**
 * @file LazyViewLoader.hpp
 * @brief Per-view asset cache filled by one full scan on first activation.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/Asset.hpp"
#include "infrastructure/DirectoryScanner.hpp"

namespace assetbridge::application {

/**
 * @struct ViewSpec
 * @brief A named presentation grouping backed by one directory.
 */
struct ViewSpec {
    std::string name;
    infrastructure::ScanRequest source;
};

/**
 * @class LazyViewLoader
 * @brief Arena of named view caches.
 *
 * A view goes NotLoaded -> Scanning -> Loaded. Only the NotLoaded -> Scanning
 * transition starts a scan, so each activation-until-invalidation interval
 * performs at most one full enumeration no matter how often it is activated.
 * Owned by the dispatcher loop; the scan itself may run elsewhere.
 */
class LazyViewLoader {
public:
    using ScanFunction = std::function<std::vector<domain::Asset>(const ViewSpec&)>;

    enum class State { NotLoaded, Scanning, Loaded };

    void registerView(const ViewSpec& spec);
    bool hasView(const std::string& name) const;
    std::optional<ViewSpec> spec(const std::string& name) const;
    std::vector<std::string> viewNames() const;

    /**
     * @brief Synchronous activation: scans with the given function if not loaded.
     * @throws domain::NotFoundError for an unknown view.
     */
    const std::vector<domain::Asset>& activate(const std::string& name, const ScanFunction& scan);

    /**
     * @brief Marks the view as scanning.
     * @return True if the caller must now run the scan; false if loaded or already scanning.
     * @throws domain::NotFoundError for an unknown view.
     */
    bool beginScan(const std::string& name);

    /**
     * @brief Installs scan results, merged with discoveries that arrived meanwhile.
     *
     * If the view was invalidated while scanning, the results are returned for the
     * current waiters but the view stays NotLoaded, so the next activation rescans.
     * @return The scanned sequence.
     */
    const std::vector<domain::Asset>& completeScan(const std::string& name, std::vector<domain::Asset> scanned);

    /** @brief Returns a failed scan to NotLoaded so the next activation retries. */
    void abortScan(const std::string& name);

    /** @brief Forces the next activation to rescan, including when a scan is in flight. */
    void invalidate(const std::string& name);

    /** @brief Appends the asset to every loaded (or scanning) view whose source matches it. */
    void onDiscovered(const domain::Asset& asset);
    void onRemoved(const std::string& path);

    /** @brief Cached assets if the view is loaded. */
    std::optional<std::vector<domain::Asset>> cached(const std::string& name) const;
    State state(const std::string& name) const;
    std::size_t scanCount(const std::string& name) const;

private:
    struct ViewCache {
        ViewSpec spec;
        State state = State::NotLoaded;
        std::vector<domain::Asset> assets;
        std::vector<domain::Asset> arrivedWhileScanning;
        std::size_t scans = 0;
        bool invalidatedDuringScan = false;
    };

    ViewCache& cacheFor(const std::string& name);
    const ViewCache& cacheFor(const std::string& name) const;
    static bool belongsTo(const ViewSpec& spec, const domain::Asset& asset);

    std::map<std::string, ViewCache> m_views;
};

} // namespace assetbridge::application
