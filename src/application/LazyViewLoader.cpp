/**
 * @file LazyViewLoader.cpp
 * @brief Implementation of LazyViewLoader.
 */

#include "application/LazyViewLoader.hpp"
#include "domain/EngineErrors.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <unordered_set>

namespace assetbridge::application {

namespace fs = std::filesystem;
using infrastructure::PathUtils;

void LazyViewLoader::registerView(const ViewSpec& spec) {
    ViewCache cache;
    cache.spec = spec;
    m_views[spec.name] = std::move(cache);
}

bool LazyViewLoader::hasView(const std::string& name) const {
    return m_views.count(name) > 0;
}

std::optional<ViewSpec> LazyViewLoader::spec(const std::string& name) const {
    auto it = m_views.find(name);
    if (it == m_views.end()) return std::nullopt;
    return it->second.spec;
}

std::vector<std::string> LazyViewLoader::viewNames() const {
    std::vector<std::string> names;
    for (const auto& entry : m_views) names.push_back(entry.first);
    return names;
}

LazyViewLoader::ViewCache& LazyViewLoader::cacheFor(const std::string& name) {
    auto it = m_views.find(name);
    if (it == m_views.end()) throw domain::NotFoundError("view:" + name);
    return it->second;
}

const LazyViewLoader::ViewCache& LazyViewLoader::cacheFor(const std::string& name) const {
    auto it = m_views.find(name);
    if (it == m_views.end()) throw domain::NotFoundError("view:" + name);
    return it->second;
}

const std::vector<domain::Asset>& LazyViewLoader::activate(const std::string& name, const ScanFunction& scan) {
    if (beginScan(name)) {
        return completeScan(name, scan(cacheFor(name).spec));
    }
    return cacheFor(name).assets;
}

bool LazyViewLoader::beginScan(const std::string& name) {
    ViewCache& cache = cacheFor(name);
    if (cache.state != State::NotLoaded) return false;

    cache.state = State::Scanning;
    cache.invalidatedDuringScan = false;
    cache.arrivedWhileScanning.clear();
    ++cache.scans;
    std::cout << "[LazyViewLoader] Loading view '" << name << "' from " << cache.spec.source.directory << std::endl;
    return true;
}

const std::vector<domain::Asset>& LazyViewLoader::completeScan(const std::string& name,
                                                               std::vector<domain::Asset> scanned) {
    ViewCache& cache = cacheFor(name);

    std::unordered_set<std::string> seen;
    for (const auto& asset : scanned) seen.insert(asset.path);
    for (auto& asset : cache.arrivedWhileScanning) {
        if (seen.insert(asset.path).second) scanned.push_back(std::move(asset));
    }
    cache.arrivedWhileScanning.clear();

    cache.assets = std::move(scanned);
    if (cache.invalidatedDuringScan) {
        cache.invalidatedDuringScan = false;
        cache.state = State::NotLoaded;
        std::cout << "[LazyViewLoader] View '" << name << "' was invalidated while scanning, next activation rescans"
                  << std::endl;
        return cache.assets;
    }
    cache.state = State::Loaded;
    std::cout << "[LazyViewLoader] View '" << name << "' loaded with " << cache.assets.size() << " assets" << std::endl;
    return cache.assets;
}

void LazyViewLoader::abortScan(const std::string& name) {
    ViewCache& cache = cacheFor(name);
    if (cache.state != State::Scanning) return;
    cache.state = State::NotLoaded;
    cache.invalidatedDuringScan = false;
    cache.arrivedWhileScanning.clear();
}

void LazyViewLoader::invalidate(const std::string& name) {
    ViewCache& cache = cacheFor(name);
    if (cache.state == State::Loaded) {
        cache.state = State::NotLoaded;
        cache.assets.clear();
    } else if (cache.state == State::Scanning) {
        // The scan may have listed the directory before this point.
        cache.invalidatedDuringScan = true;
    }
}

void LazyViewLoader::onDiscovered(const domain::Asset& asset) {
    for (auto& entry : m_views) {
        ViewCache& cache = entry.second;
        if (cache.state == State::NotLoaded || !belongsTo(cache.spec, asset)) continue;

        auto& target = cache.state == State::Loaded ? cache.assets : cache.arrivedWhileScanning;
        bool known = std::any_of(target.begin(), target.end(),
            [&](const domain::Asset& a) { return a.path == asset.path; });
        if (!known) target.push_back(asset);
    }
}

void LazyViewLoader::onRemoved(const std::string& path) {
    for (auto& entry : m_views) {
        for (auto* list : {&entry.second.assets, &entry.second.arrivedWhileScanning}) {
            list->erase(std::remove_if(list->begin(), list->end(),
                [&](const domain::Asset& a) { return a.path == path; }), list->end());
        }
    }
}

std::optional<std::vector<domain::Asset>> LazyViewLoader::cached(const std::string& name) const {
    const ViewCache& cache = cacheFor(name);
    if (cache.state != State::Loaded) return std::nullopt;
    return cache.assets;
}

LazyViewLoader::State LazyViewLoader::state(const std::string& name) const {
    return cacheFor(name).state;
}

std::size_t LazyViewLoader::scanCount(const std::string& name) const {
    return cacheFor(name).scans;
}

bool LazyViewLoader::belongsTo(const ViewSpec& spec, const domain::Asset& asset) {
    if (asset.kind != spec.source.kind) return false;

    fs::path assetPath(asset.path);
    if (!PathUtils::MatchesAnyPattern(assetPath.filename().string(), spec.source.patterns)) return false;

    const std::string dir = PathUtils::Canonical(spec.source.directory);
    if (spec.source.recursive) {
        std::string prefix = dir;
        if (!prefix.empty() && prefix.back() != fs::path::preferred_separator) prefix += fs::path::preferred_separator;
        return asset.path.compare(0, prefix.size(), prefix) == 0;
    }
    return PathUtils::Canonical(assetPath.parent_path()) == dir;
}

} // namespace assetbridge::application
