/**
 * @file AssetEngine.cpp
 * @brief Implementation of AssetEngine.
 */

#include "application/AssetEngine.hpp"
#include "domain/EngineErrors.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace assetbridge::application {

namespace fs = std::filesystem;
using infrastructure::PathUtils;

namespace {

std::string Key(const std::string& path) {
    return PathUtils::Canonical(path);
}

std::string FileName(const std::string& path) {
    return fs::path(path).filename().string();
}

} // namespace

AssetEngine::AssetEngine(infrastructure::EngineConfig config, std::chrono::system_clock::time_point sessionStart)
    : m_config(std::move(config)),
      m_classifier(sessionStart),
      m_associations(m_tracker, m_config.autoLinkWindow),
      m_selection(m_tracker, m_associations),
      m_previews(m_config.previewTotalQuota, m_config.previewSessionQuota),
      m_persistence(std::make_shared<infrastructure::PersistenceService>()),
      m_stateStore(m_config.stateFile, m_persistence),
      m_watcher(infrastructure::WatcherOptions{m_config.pollInterval, m_config.maxBackoff}) {
    m_associations.bindSelection(&m_selection);
    m_associations.setMutationHook([this] { persistState(); });
    m_selection.setMutationHook([this] { persistState(); });
    m_selection.setChangeListener([this](const std::vector<domain::UnifiedObject>& view) {
        notifySelection(view);
    });

    for (const auto& watch : m_config.watches) {
        m_views.registerView(ViewSpec{
            watch.name,
            infrastructure::ScanRequest{watch.directory, watch.patterns, watch.kind, watch.recursive}
        });
    }

    m_dispatcher = std::make_unique<EventDispatcher>(m_config.channelCapacity,
        [this](const domain::DiscoveryEvent& event) { applyEvent(event); });
}

AssetEngine::~AssetEngine() {
    stop();
}

void AssetEngine::start() {
    {
        std::lock_guard<std::mutex> lock(m_stopMutex);
        if (m_stopped) {
            throw std::logic_error("AssetEngine cannot be restarted after stop()");
        }
        if (m_started) return;
        m_started = true;
    }

    std::cout << "[AssetEngine] Starting with " << m_config.watches.size() << " watched directories" << std::endl;

    const infrastructure::PersistedState state = m_stateStore.load();
    m_dispatcher->call([this, &state] { reconcile(state); });

    for (const auto& watch : m_config.watches) {
        m_watcher.registerDirectory(watch, [this](const domain::DiscoveryEvent& event) {
            if (!m_dispatcher->post(event)) {
                std::cerr << "[AssetEngine] Dispatcher stopped, dropping event for " << event.path << std::endl;
            }
        });
    }
    m_watcher.start();
}

void AssetEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(m_stopMutex);
        if (m_stopped) return;
        m_stopped = true;
    }
    m_stopCv.notify_all();

    std::cout << "[AssetEngine] Stopping..." << std::endl;
    m_watcher.stop();

    const auto inFlight = m_tasks.GetActiveTasks();
    if (!inFlight.empty()) {
        std::cout << "[AssetEngine] Waiting for " << inFlight.size() << " background scans" << std::endl;
    }
    m_tasks.WaitForAll();
    m_dispatcher->stop();
    m_persistence->flush();
    m_persistence->stop();

    if (m_persistence->failedWrites() > 0) {
        std::cerr << "[AssetEngine] " << m_persistence->failedWrites()
                  << " state writes failed; " << m_stateStore.documentPath() << " may be stale" << std::endl;
    }
    std::cout << "[AssetEngine] Stopped" << std::endl;
}

bool AssetEngine::isRunning() const {
    std::lock_guard<std::mutex> lock(m_stopMutex);
    return m_started && !m_stopped;
}

void AssetEngine::addListener(domain::EngineListener listener) {
    m_dispatcher->call([this, &listener] { m_listeners.push_back(std::move(listener)); });
}

bool AssetEngine::ingest(const domain::DiscoveryEvent& event) {
    domain::DiscoveryEvent normalized = event;
    normalized.path = Key(event.path);
    return m_dispatcher->post(std::move(normalized));
}

void AssetEngine::flush() {
    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(m_stopMutex);
        stopped = m_stopped;
    }
    if (!stopped) {
        m_dispatcher->flush();
    }
    m_persistence->flush();
}

// --- Dispatch ---

void AssetEngine::applyEvent(const domain::DiscoveryEvent& event) {
    if (event.type == domain::FileEventType::Removed) {
        applyRemoval(event.path);
    } else {
        applyDiscovery(event);
    }
}

void AssetEngine::applyDiscovery(const domain::DiscoveryEvent& event) {
    auto [asset, isNew] = m_tracker.add(event.path, event.kind, event.modifiedAt);
    if (!isNew) return;

    const bool sessionScoped = m_classifier.isSessionAsset(asset);

    std::optional<AssociationManager::ImageModelPair> linked;
    if (asset.kind == domain::AssetKind::TexturedModel) {
        m_associations.autoMarkTextured(asset);
    } else {
        linked = m_associations.autoLink(asset);
        if (linked) {
            m_selection.onLinked(linked->first, linked->second);
        }
    }
    m_views.onDiscovered(asset);

    notifyDiscovered(asset, sessionScoped);
    if (linked) {
        notifyAssociation(linked->first, linked->second);
    }
    m_selection.recompute();
}

void AssetEngine::applyRemoval(const std::string& path) {
    if (!m_tracker.remove(path)) return;

    std::cout << "[AssetEngine] Asset removed: " << FileName(path) << std::endl;
    m_selection.onAssetRemoved(path);
    m_associations.cleanupMissing();
    m_views.onRemoved(path);

    notifyRemoved(path);
    m_selection.recompute();
}

// --- Startup reconcile ---

std::optional<domain::AssetKind> AssetEngine::kindForPath(const std::string& path) const {
    const fs::path p(path);
    const std::string parent = PathUtils::Canonical(p.parent_path());

    std::optional<domain::AssetKind> kind;
    std::size_t bestLength = 0;
    for (const auto& watch : m_config.watches) {
        if (!PathUtils::MatchesAnyPattern(p.filename().string(), watch.patterns)) continue;

        const std::string dir = PathUtils::Canonical(watch.directory);
        bool inside = parent == dir;
        if (!inside && watch.recursive) {
            std::string prefix = dir;
            if (!prefix.empty() && prefix.back() != fs::path::preferred_separator) {
                prefix += fs::path::preferred_separator;
            }
            inside = path.compare(0, prefix.size(), prefix) == 0;
        }
        // The most specific watch wins when directories nest.
        if (inside && dir.size() >= bestLength) {
            kind = watch.kind;
            bestLength = dir.size();
        }
    }
    return kind;
}

void AssetEngine::reconcile(const infrastructure::PersistedState& state) {
    std::map<std::string, domain::AssetKind> referenced;
    auto reference = [&](const std::string& path, std::optional<domain::AssetKind> fallback) {
        if (path.empty()) return;
        auto kind = kindForPath(path);
        if (!kind) kind = fallback;
        if (kind) referenced.emplace(path, *kind);
    };

    for (const auto& assoc : state.associations) {
        reference(assoc.imagePath, domain::AssetKind::Image);
        reference(assoc.modelPath, domain::AssetKind::Model);
    }
    for (const auto& entry : state.textured) {
        reference(entry.first, domain::AssetKind::Model);
        reference(entry.second, domain::AssetKind::TexturedModel);
    }
    for (const auto& entry : state.selected) {
        reference(entry.first, std::nullopt);
    }

    std::vector<domain::Asset> rediscovered;
    for (const auto& entry : referenced) {
        std::error_code ec;
        if (!fs::is_regular_file(entry.first, ec)) continue;
        auto mtime = fs::last_write_time(entry.first, ec);
        if (ec) {
            std::cerr << "[AssetEngine] Cannot stat " << entry.first << ": " << ec.message() << std::endl;
            continue;
        }
        auto added = m_tracker.add(entry.first, entry.second, PathUtils::ToSystemTime(mtime));
        if (added.second) rediscovered.push_back(added.first);
    }

    m_associations.restore(state.associations, state.textured);
    m_selection.restore(state.selected);

    const std::size_t stale = m_associations.cleanupMissing();
    std::cout << "[AssetEngine] Restored " << rediscovered.size() << " assets, "
              << m_associations.associations().size() << " associations ("
              << stale << " stale removed)" << std::endl;

    for (const auto& asset : rediscovered) {
        notifyDiscovered(asset, m_classifier.isSessionAsset(asset));
    }
    for (const auto& assoc : m_associations.associations()) {
        notifyAssociation(assoc.imagePath, assoc.modelPath);
    }
    if (!m_selection.recompute() && !m_selection.unifiedView().empty()) {
        notifySelection(m_selection.unifiedView());
    }
}

// --- Session ---

void AssetEngine::resetSession(std::chrono::system_clock::time_point newStart) {
    m_dispatcher->call([this, newStart] {
        m_classifier.resetSession(newStart);
        std::cout << "[AssetEngine] Session reset" << std::endl;
    });
}

std::chrono::system_clock::time_point AssetEngine::sessionStart() {
    return m_dispatcher->call([this] { return m_classifier.sessionStart(); });
}

bool AssetEngine::isSessionAsset(const std::string& path) {
    const std::string key = Key(path);
    return m_dispatcher->call([this, &key] {
        auto asset = m_tracker.find(key);
        if (!asset) throw domain::NotFoundError(key);
        return m_classifier.isSessionAsset(*asset);
    });
}

// --- Assets ---

std::vector<domain::Asset> AssetEngine::assets(domain::AssetKind kind) {
    return m_dispatcher->call([this, kind] { return m_tracker.listByKind(kind); });
}

std::optional<domain::Asset> AssetEngine::findAsset(const std::string& path) {
    const std::string key = Key(path);
    return m_dispatcher->call([this, &key] { return m_tracker.find(key); });
}

// --- Selection ---

bool AssetEngine::toggle(const std::string& path) {
    const std::string key = Key(path);
    return m_dispatcher->call([this, &key] { return m_selection.toggle(key); });
}

void AssetEngine::setSelected(const std::string& path, bool selected) {
    const std::string key = Key(path);
    m_dispatcher->call([this, &key, selected] { m_associations.setSelected(key, selected); });
}

void AssetEngine::clearSelection(std::optional<domain::AssetKind> kind) {
    m_dispatcher->call([this, kind] { m_selection.clearSelection(kind); });
}

bool AssetEngine::isSelected(const std::string& path) {
    const std::string key = Key(path);
    return m_dispatcher->call([this, &key] { return m_selection.isSelected(key); });
}

std::vector<std::string> AssetEngine::selectedPaths(std::optional<domain::AssetKind> kind) {
    return m_dispatcher->call([this, kind] { return m_selection.selectedPaths(kind); });
}

std::vector<domain::UnifiedObject> AssetEngine::unifiedView() {
    return m_dispatcher->call([this] { return m_selection.unifiedView(); });
}

// --- Associations ---

void AssetEngine::link(const std::string& image, const std::string& model) {
    const std::string imageKey = Key(image);
    const std::string modelKey = Key(model);
    m_dispatcher->call([this, &imageKey, &modelKey] {
        m_associations.link(imageKey, modelKey);
        m_selection.onLinked(imageKey, modelKey);
        notifyAssociation(imageKey, modelKey);
        m_selection.recompute();
    });
}

bool AssetEngine::unlink(const std::string& image) {
    const std::string key = Key(image);
    return m_dispatcher->call([this, &key] {
        if (!m_associations.unlink(key)) return false;
        std::cout << "[AssetEngine] Removed association for " << FileName(key) << std::endl;
        notifyAssociation(key, std::string());
        m_selection.recompute();
        return true;
    });
}

std::vector<AssociationManager::ImageModelPair> AssetEngine::autoDetect(const std::string& imagesDir,
                                                                        const std::string& modelsDir) {
    const std::string imagesKey = Key(imagesDir);
    const std::string modelsKey = Key(modelsDir);
    return m_dispatcher->call([this, &imagesKey, &modelsKey] {
        auto created = m_associations.autoDetect(imagesKey, modelsKey);
        for (const auto& pair : created) {
            m_selection.onLinked(pair.first, pair.second);
            notifyAssociation(pair.first, pair.second);
        }
        m_selection.recompute();
        return created;
    });
}

std::size_t AssetEngine::cleanupMissing() {
    return m_dispatcher->call([this] {
        std::size_t removed = m_associations.cleanupMissing();
        m_selection.recompute();
        return removed;
    });
}

std::optional<std::string> AssetEngine::modelForImage(const std::string& image) {
    const std::string key = Key(image);
    return m_dispatcher->call([this, &key] { return m_associations.getModelForImage(key); });
}

std::optional<std::string> AssetEngine::imageForModel(const std::string& model) {
    const std::string key = Key(model);
    return m_dispatcher->call([this, &key] { return m_associations.getImageForModel(key); });
}

void AssetEngine::markTextured(const std::string& model, const std::string& texturedPath) {
    const std::string modelKey = Key(model);
    const std::string texturedKey = texturedPath.empty() ? std::string() : Key(texturedPath);
    m_dispatcher->call([this, &modelKey, &texturedKey] {
        m_associations.markTextured(modelKey, texturedKey);
        m_selection.recompute();
    });
}

bool AssetEngine::isTextured(const std::string& model) {
    const std::string key = Key(model);
    return m_dispatcher->call([this, &key] { return m_associations.isTextured(key); });
}

// --- Views ---

std::vector<std::string> AssetEngine::viewNames() {
    return m_dispatcher->call([this] { return m_views.viewNames(); });
}

LazyViewLoader::State AssetEngine::viewState(const std::string& name) {
    return m_dispatcher->call([this, &name] { return m_views.state(name); });
}

std::size_t AssetEngine::viewScanCount(const std::string& name) {
    return m_dispatcher->call([this, &name] { return m_views.scanCount(name); });
}

void AssetEngine::activateView(const std::string& name, ViewCallback onLoaded) {
    requestView(name, ViewWaiter{
        std::move(onLoaded),
        [name](const std::string& reason) {
            std::cerr << "[AssetEngine] View '" << name << "' could not be loaded: " << reason << std::endl;
        }
    });
}

std::future<std::vector<domain::Asset>> AssetEngine::activateView(const std::string& name) {
    auto promise = std::make_shared<std::promise<std::vector<domain::Asset>>>();
    auto future = promise->get_future();
    requestView(name, ViewWaiter{
        [promise](const std::vector<domain::Asset>& assets) { promise->set_value(assets); },
        [promise](const std::string& reason) {
            promise->set_exception(std::make_exception_ptr(std::runtime_error(reason)));
        }
    });
    return future;
}

void AssetEngine::invalidateView(const std::string& name) {
    m_dispatcher->call([this, &name] {
        m_views.invalidate(name);
        std::cout << "[AssetEngine] View '" << name << "' invalidated" << std::endl;
    });
}

void AssetEngine::requestView(const std::string& name, ViewWaiter waiter) {
    m_dispatcher->call([this, &name, &waiter] {
        if (!m_views.hasView(name)) throw domain::NotFoundError("view:" + name);

        if (m_views.state(name) == LazyViewLoader::State::Loaded) {
            const std::vector<domain::Asset> assets = *m_views.cached(name);
            try {
                if (waiter.onLoaded) waiter.onLoaded(assets);
            } catch (const std::exception& e) {
                std::cerr << "[AssetEngine] View callback for '" << name << "' failed: " << e.what() << std::endl;
            }
            return;
        }

        m_viewWaiters[name].push_back(std::move(waiter));
        if (!m_views.beginScan(name)) return; // already scanning; wait for it

        const ViewSpec spec = *m_views.spec(name);
        m_tasks.SubmitTask(TaskType::DirectoryScan, "Scan view " + name,
            [this, spec](std::shared_ptr<TaskStatus>) { runViewScan(spec); });
    });
}

void AssetEngine::runViewScan(const ViewSpec& spec) {
    std::chrono::milliseconds delay = std::max(m_config.pollInterval, std::chrono::milliseconds(1));

    std::optional<std::vector<domain::Asset>> scanned = m_scanner.scan(spec.source);
    while (!scanned) {
        std::cerr << "[AssetEngine] Scan of view '" << spec.name << "' failed, retrying in "
                  << delay.count() << "ms" << std::endl;
        if (!waitUnlessStopping(delay)) {
            const std::string name = spec.name;
            m_dispatcher->submit([this, name] { failViewScan(name, "engine stopped during scan"); });
            return;
        }
        delay = std::min(delay * 2, m_config.maxBackoff);
        scanned = m_scanner.scan(spec.source);
    }

    // Route every scanned file through the loop so the view never knows an asset the tracker does not.
    for (const auto& asset : *scanned) {
        if (!m_dispatcher->post(domain::DiscoveryEvent{asset.path, asset.kind,
                                                       domain::FileEventType::Created, asset.modifiedAt})) {
            return;
        }
    }

    const std::string name = spec.name;
    std::vector<domain::Asset> assets = std::move(*scanned);
    m_dispatcher->submit([this, name, assets] { finishViewScan(name, assets); });
}

void AssetEngine::finishViewScan(const std::string& name, std::vector<domain::Asset> scanned) {
    const std::vector<domain::Asset> assets = m_views.completeScan(name, std::move(scanned));

    auto waiters = std::move(m_viewWaiters[name]);
    m_viewWaiters.erase(name);
    for (auto& waiter : waiters) {
        try {
            if (waiter.onLoaded) waiter.onLoaded(assets);
        } catch (const std::exception& e) {
            std::cerr << "[AssetEngine] View callback for '" << name << "' failed: " << e.what() << std::endl;
        }
    }
}

void AssetEngine::failViewScan(const std::string& name, const std::string& reason) {
    m_views.abortScan(name);

    auto waiters = std::move(m_viewWaiters[name]);
    m_viewWaiters.erase(name);
    for (auto& waiter : waiters) {
        try {
            if (waiter.onFailed) waiter.onFailed(reason);
        } catch (const std::exception& e) {
            std::cerr << "[AssetEngine] View failure callback for '" << name << "' failed: " << e.what() << std::endl;
        }
    }
}

bool AssetEngine::waitUnlessStopping(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(m_stopMutex);
    return !m_stopCv.wait_for(lock, delay, [this] { return m_stopped; });
}

// --- Previews ---

std::optional<ResourceHandle> AssetEngine::acquirePreview(bool sessionScoped, const std::string& owner) {
    return m_previews.acquire(sessionScoped, owner);
}

std::optional<ResourceHandle> AssetEngine::acquirePreviewFor(const std::string& path) {
    const bool sessionScoped = isSessionAsset(path);
    return m_previews.acquire(sessionScoped, Key(path));
}

bool AssetEngine::releasePreview(const ResourceHandle& handle) {
    return m_previews.release(handle);
}

bool AssetEngine::touchPreview(const ResourceHandle& handle) {
    return m_previews.touch(handle);
}

void AssetEngine::setPreviewEvictionCallback(PreviewEvictionCallback callback) {
    m_previews.setEvictionCallback(std::move(callback));
}

// --- Persistence & notification ---

void AssetEngine::persistState() {
    infrastructure::PersistedState state;
    state.associations = m_associations.associations();
    state.selected = m_selection.flags();
    state.textured = m_associations.texturedFlags();
    m_stateStore.save(state);
}

void AssetEngine::notifyDiscovered(const domain::Asset& asset, bool sessionScoped) {
    std::cout << "[AssetEngine] Discovered " << domain::ToString(asset.kind) << " " << FileName(asset.path)
              << (sessionScoped ? " (session)" : " (historical)") << std::endl;
    for (const auto& listener : m_listeners) {
        if (!listener.onAssetDiscovered) continue;
        try {
            listener.onAssetDiscovered(asset, sessionScoped);
        } catch (const std::exception& e) {
            std::cerr << "[AssetEngine] onAssetDiscovered listener failed: " << e.what() << std::endl;
        }
    }
}

void AssetEngine::notifyAssociation(const std::string& image, const std::string& model) {
    for (const auto& listener : m_listeners) {
        if (!listener.onAssociationChanged) continue;
        try {
            listener.onAssociationChanged(image, model);
        } catch (const std::exception& e) {
            std::cerr << "[AssetEngine] onAssociationChanged listener failed: " << e.what() << std::endl;
        }
    }
}

void AssetEngine::notifyRemoved(const std::string& path) {
    for (const auto& listener : m_listeners) {
        if (!listener.onAssetRemoved) continue;
        try {
            listener.onAssetRemoved(path);
        } catch (const std::exception& e) {
            std::cerr << "[AssetEngine] onAssetRemoved listener failed: " << e.what() << std::endl;
        }
    }
}

void AssetEngine::notifySelection(const std::vector<domain::UnifiedObject>& view) {
    for (const auto& listener : m_listeners) {
        if (!listener.onSelectionChanged) continue;
        try {
            listener.onSelectionChanged(view);
        } catch (const std::exception& e) {
            std::cerr << "[AssetEngine] onSelectionChanged listener failed: " << e.what() << std::endl;
        }
    }
}

} // namespace assetbridge::application
