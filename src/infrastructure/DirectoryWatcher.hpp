/**
 * @file DirectoryWatcher.hpp
 * @brief Per-directory background watcher reporting created, modified and removed files.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "domain/Asset.hpp"
#include "domain/EngineEvents.hpp"

namespace assetbridge::infrastructure {

struct WatcherOptions {
    std::chrono::milliseconds pollInterval{500};
    std::chrono::milliseconds maxBackoff{10000};
};

/**
 * @struct WatchRegistration
 * @brief One watched output directory.
 */
struct WatchRegistration {
    std::string name;
    std::string directory;
    std::vector<std::string> patterns; ///< Glob patterns such as "*.png".
    domain::AssetKind kind = domain::AssetKind::Image;
    bool recursive = false;
};

/**
 * @class DirectoryWatcher
 * @brief Polls each registered directory on its own thread.
 *
 * A missing directory is created on registration; if that fails the watch
 * keeps retrying with exponential backoff until the directory appears. Files
 * already present when watching starts form a silent baseline. A file is
 * reported once it is non-empty and unchanged across two consecutive polls.
 * Per-path ordering is preserved since every directory has exactly one thread.
 */
class DirectoryWatcher {
public:
    using EventCallback = std::function<void(const domain::DiscoveryEvent&)>;

    explicit DirectoryWatcher(WatcherOptions options = {});
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    /**
     * @brief Adds a directory to watch. Starts its thread immediately if the watcher is running.
     */
    void registerDirectory(const WatchRegistration& registration, EventCallback onEvent);

    void start();

    /**
     * @brief Stops every watch thread and waits for them to exit.
     */
    void stop();

    /**
     * @brief Stops watching and forgets every registration.
     */
    void unregisterAll();

    bool isRunning() const { return m_running; }
    std::vector<std::string> registeredNames() const;

private:
    struct FileRecord {
        std::uintmax_t size = 0;
        std::filesystem::file_time_type mtime;
        bool reported = false;
        bool pendingChange = false;
    };

    struct WatchState {
        WatchRegistration registration;
        EventCallback callback;
        std::thread thread;
        std::unordered_map<std::string, FileRecord> snapshot;
        bool baselineDone = false;
    };

    void launch(WatchState& state);
    void watchLoop(WatchState& state);
    void pollOnce(WatchState& state);
    void emit(WatchState& state, const std::string& path, domain::FileEventType type,
              std::filesystem::file_time_type mtime);

    WatcherOptions m_options;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_running{false};
    std::vector<std::unique_ptr<WatchState>> m_watches;
};

} // namespace assetbridge::infrastructure
