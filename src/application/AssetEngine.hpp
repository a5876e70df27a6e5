/**
 * @file AssetEngine.hpp
 * @brief Facade owning the asset lifecycle components and their wiring.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "application/AssetTracker.hpp"
#include "application/AssociationManager.hpp"
#include "application/AsyncTaskManager.hpp"
#include "application/EventDispatcher.hpp"
#include "application/LazyViewLoader.hpp"
#include "application/ResourceAdmissionController.hpp"
#include "application/SelectionCoordinator.hpp"
#include "application/SessionClassifier.hpp"
#include "domain/EngineEvents.hpp"
#include "infrastructure/AssetStateStore.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DirectoryScanner.hpp"
#include "infrastructure/DirectoryWatcher.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace assetbridge::application {

/**
 * @class AssetEngine
 * @brief Entry point used by the presentation layer.
 *
 * Watchers feed the dispatcher, whose loop thread is the only writer of the
 * tracker, associations, selection and view caches. Every public operation that
 * touches that state is marshalled onto the loop with EventDispatcher::call, so
 * the facade itself is safe to use from any thread. Listeners run on the loop.
 */
class AssetEngine {
public:
    using ViewCallback = std::function<void(const std::vector<domain::Asset>&)>;
    using PreviewEvictionCallback = ResourceAdmissionController::EvictionCallback;

    explicit AssetEngine(infrastructure::EngineConfig config,
                         std::chrono::system_clock::time_point sessionStart = std::chrono::system_clock::now());
    ~AssetEngine();

    AssetEngine(const AssetEngine&) = delete;
    AssetEngine& operator=(const AssetEngine&) = delete;

    /**
     * @brief Restores persisted state, reconciles it with the disk and starts watching.
     */
    void start();

    /** @brief Stops watchers, waits for scans, drains the dispatcher and flushes state. */
    void stop();

    bool isRunning() const;

    /** @brief Registers presentation callbacks; they run on the dispatcher thread. */
    void addListener(domain::EngineListener listener);

    /** @brief Feeds an externally observed file notification through the dispatcher. */
    bool ingest(const domain::DiscoveryEvent& event);

    /** @brief Waits until all queued events and pending writes have been applied. */
    void flush();

    // --- Session ---
    void resetSession(std::chrono::system_clock::time_point newStart);
    std::chrono::system_clock::time_point sessionStart();
    bool isSessionAsset(const std::string& path);

    // --- Assets ---
    std::vector<domain::Asset> assets(domain::AssetKind kind);
    std::optional<domain::Asset> findAsset(const std::string& path);

    // --- Selection ---
    bool toggle(const std::string& path);
    void setSelected(const std::string& path, bool selected);
    void clearSelection(std::optional<domain::AssetKind> kind = std::nullopt);
    bool isSelected(const std::string& path);
    std::vector<std::string> selectedPaths(std::optional<domain::AssetKind> kind = std::nullopt);
    std::vector<domain::UnifiedObject> unifiedView();

    // --- Associations ---
    void link(const std::string& image, const std::string& model);
    bool unlink(const std::string& image);
    std::vector<AssociationManager::ImageModelPair> autoDetect(const std::string& imagesDir,
                                                               const std::string& modelsDir);
    std::size_t cleanupMissing();
    std::optional<std::string> modelForImage(const std::string& image);
    std::optional<std::string> imageForModel(const std::string& model);
    void markTextured(const std::string& model, const std::string& texturedPath = "");
    bool isTextured(const std::string& model);

    // --- Views ---
    std::vector<std::string> viewNames();
    LazyViewLoader::State viewState(const std::string& name);
    std::size_t viewScanCount(const std::string& name);

    /**
     * @brief Activates a view; the callback runs on the loop once the view is loaded.
     *
     * The first activation enumerates the view's directory in the background;
     * later ones are served from cache.
     * @throws domain::NotFoundError for an unknown view.
     */
    void activateView(const std::string& name, ViewCallback onLoaded);

    /** @brief Future-returning form of activateView. */
    std::future<std::vector<domain::Asset>> activateView(const std::string& name);

    void invalidateView(const std::string& name);

    // --- Previews ---
    std::optional<ResourceHandle> acquirePreview(bool sessionScoped, const std::string& owner = "");
    /** @brief Acquires a preview for a known asset, scoped by its session classification. */
    std::optional<ResourceHandle> acquirePreviewFor(const std::string& path);
    bool releasePreview(const ResourceHandle& handle);
    bool touchPreview(const ResourceHandle& handle);
    void setPreviewEvictionCallback(PreviewEvictionCallback callback);
    const ResourceAdmissionController& previews() const { return m_previews; }

    const infrastructure::EngineConfig& config() const { return m_config; }

private:
    struct ViewWaiter {
        ViewCallback onLoaded;
        std::function<void(const std::string&)> onFailed;
    };

    void applyEvent(const domain::DiscoveryEvent& event);
    void applyDiscovery(const domain::DiscoveryEvent& event);
    void applyRemoval(const std::string& path);

    void reconcile(const infrastructure::PersistedState& state);
    std::optional<domain::AssetKind> kindForPath(const std::string& path) const;

    void requestView(const std::string& name, ViewWaiter waiter);
    void runViewScan(const ViewSpec& spec);
    void finishViewScan(const std::string& name, std::vector<domain::Asset> scanned);
    void failViewScan(const std::string& name, const std::string& reason);

    void persistState();

    void notifyDiscovered(const domain::Asset& asset, bool sessionScoped);
    void notifyAssociation(const std::string& image, const std::string& model);
    void notifyRemoved(const std::string& path);
    void notifySelection(const std::vector<domain::UnifiedObject>& view);

    /** @brief Sleeps for the given delay unless the engine is stopping; false when stopping. */
    bool waitUnlessStopping(std::chrono::milliseconds delay);

    infrastructure::EngineConfig m_config;

    AssetTracker m_tracker;
    SessionClassifier m_classifier;
    AssociationManager m_associations;
    SelectionCoordinator m_selection;
    LazyViewLoader m_views;
    ResourceAdmissionController m_previews;

    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    infrastructure::AssetStateStore m_stateStore;
    infrastructure::DirectoryScanner m_scanner;
    infrastructure::DirectoryWatcher m_watcher;

    std::vector<domain::EngineListener> m_listeners;
    std::map<std::string, std::vector<ViewWaiter>> m_viewWaiters;

    mutable std::mutex m_stopMutex;
    std::condition_variable m_stopCv;
    bool m_started = false;
    bool m_stopped = false;

    // Declared last: destroyed first, so the loop and scans never outlive the state they touch.
    std::unique_ptr<EventDispatcher> m_dispatcher;
    AsyncTaskManager m_tasks;
};

} // namespace assetbridge::application
