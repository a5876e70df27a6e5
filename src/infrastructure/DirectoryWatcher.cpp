/**
 * @file DirectoryWatcher.cpp
 * @brief Implementation of DirectoryWatcher.
 */

#include "infrastructure/DirectoryWatcher.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <iostream>

namespace assetbridge::infrastructure {

namespace fs = std::filesystem;

DirectoryWatcher::DirectoryWatcher(WatcherOptions options) : m_options(options) {}

DirectoryWatcher::~DirectoryWatcher() {
    stop();
}

void DirectoryWatcher::registerDirectory(const WatchRegistration& registration, EventCallback onEvent) {
    auto state = std::make_unique<WatchState>();
    state->registration = registration;
    state->callback = std::move(onEvent);

    std::error_code ec;
    if (!fs::exists(registration.directory, ec)) {
        // Nothing in a directory that did not exist yet can be historical.
        state->baselineDone = true;
        fs::create_directories(registration.directory, ec);
        if (ec) {
            std::cerr << "[DirectoryWatcher] Could not create " << registration.directory
                      << " (" << ec.message() << "), will retry while polling." << std::endl;
        } else {
            std::cout << "[DirectoryWatcher] Created directory: " << registration.directory << std::endl;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_watches.push_back(std::move(state));
    std::cout << "[DirectoryWatcher] Added monitor for " << registration.name << ": "
              << registration.directory << std::endl;
    if (m_running) {
        launch(*m_watches.back());
    }
}

void DirectoryWatcher::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return;
    m_running = true;
    for (auto& watch : m_watches) {
        launch(*watch);
    }
}

void DirectoryWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    // Threads never touch m_watches itself, so joining outside the lock is safe.
    for (auto& watch : m_watches) {
        if (watch->thread.joinable()) {
            watch->thread.join();
            std::cout << "[DirectoryWatcher] Stopped monitoring " << watch->registration.name << std::endl;
        }
    }
}

void DirectoryWatcher::unregisterAll() {
    stop();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_watches.clear();
}

std::vector<std::string> DirectoryWatcher::registeredNames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_watches.size());
    for (const auto& watch : m_watches) {
        names.push_back(watch->registration.name);
    }
    return names;
}

void DirectoryWatcher::launch(WatchState& state) {
    if (state.thread.joinable()) return;
    state.thread = std::thread(&DirectoryWatcher::watchLoop, this, std::ref(state));
}

void DirectoryWatcher::watchLoop(WatchState& state) {
    auto delay = m_options.pollInterval;

    while (m_running) {
        try {
            pollOnce(state);
            delay = m_options.pollInterval;
        } catch (const std::exception& e) {
            delay = std::min(delay * 2, m_options.maxBackoff);
            std::cerr << "[DirectoryWatcher] Poll of " << state.registration.name << " failed: " << e.what()
                      << " (retrying in " << delay.count() << " ms)" << std::endl;
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, delay, [this] { return !m_running; });
    }
}

void DirectoryWatcher::pollOnce(WatchState& state) {
    const auto& reg = state.registration;

    if (!fs::exists(reg.directory)) {
        fs::create_directories(reg.directory); // throws on failure, caught by watchLoop
        state.baselineDone = true;
        return;
    }

    std::unordered_map<std::string, std::pair<std::uintmax_t, fs::file_time_type>> current;
    auto collect = [&](const fs::directory_entry& entry) {
        if (!entry.is_regular_file()) return;
        if (!PathUtils::MatchesAnyPattern(entry.path().filename().string(), reg.patterns)) return;
        std::error_code ec;
        auto size = entry.file_size(ec);
        if (ec) return; // vanished between listing and stat
        auto mtime = entry.last_write_time(ec);
        if (ec) return;
        current.emplace(PathUtils::Canonical(entry.path()), std::make_pair(size, mtime));
    };

    if (reg.recursive) {
        for (const auto& entry : fs::recursive_directory_iterator(reg.directory)) collect(entry);
    } else {
        for (const auto& entry : fs::directory_iterator(reg.directory)) collect(entry);
    }

    if (!state.baselineDone) {
        for (const auto& [path, info] : current) {
            FileRecord record;
            record.size = info.first;
            record.mtime = info.second;
            record.reported = info.first > 0;
            state.snapshot.emplace(path, record);
        }
        state.baselineDone = true;
        return;
    }

    for (const auto& [path, info] : current) {
        auto it = state.snapshot.find(path);
        if (it == state.snapshot.end()) {
            FileRecord record;
            record.size = info.first;
            record.mtime = info.second;
            record.pendingChange = true;
            state.snapshot.emplace(path, record);
            continue;
        }

        FileRecord& record = it->second;
        if (record.size != info.first || record.mtime != info.second) {
            record.size = info.first;
            record.mtime = info.second;
            record.pendingChange = true;
            continue;
        }

        if (record.pendingChange && record.size > 0) {
            emit(state, path, record.reported ? domain::FileEventType::Modified : domain::FileEventType::Created,
                 record.mtime);
            record.reported = true;
            record.pendingChange = false;
        }
    }

    for (auto it = state.snapshot.begin(); it != state.snapshot.end();) {
        if (current.find(it->first) == current.end()) {
            if (it->second.reported) {
                emit(state, it->first, domain::FileEventType::Removed, it->second.mtime);
            }
            it = state.snapshot.erase(it);
        } else {
            ++it;
        }
    }
}

void DirectoryWatcher::emit(WatchState& state, const std::string& path, domain::FileEventType type,
                            fs::file_time_type mtime) {
    if (!state.callback) return;

    domain::DiscoveryEvent event;
    event.path = path;
    event.kind = state.registration.kind;
    event.type = type;
    event.modifiedAt = PathUtils::ToSystemTime(mtime);

    try {
        state.callback(event);
    } catch (const std::exception& e) {
        std::cerr << "[DirectoryWatcher] Error delivering event for " << path << ": " << e.what() << std::endl;
    }
}

} // namespace assetbridge::infrastructure
