/**
 * @file ResourceAdmissionController.hpp
 * @brief Admission cap for expensive preview instances (3D viewers).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace assetbridge::application {

/**
 * @struct ResourceHandle
 * @brief Token for one materialized preview instance.
 */
struct ResourceHandle {
    std::uint64_t id = 0;
    bool sessionScoped = false;

    bool operator==(const ResourceHandle& other) const { return id == other.id; }
    bool operator!=(const ResourceHandle& other) const { return id != other.id; }
};

/**
 * @class ResourceAdmissionController
 * @brief Caps concurrently active previews, giving session work priority over history.
 *
 * Thread-safe: acquire and release may race with presentation teardown.
 * At capacity a session request evicts the least recently used historical
 * handle; a historical request is rejected and never evicts anything. Session
 * handles never exceed the session quota.
 */
class ResourceAdmissionController {
public:
    using EvictionCallback = std::function<void(const ResourceHandle&, const std::string& owner)>;

    /** @throws std::invalid_argument if totalQuota is 0 or sessionQuota exceeds it. */
    ResourceAdmissionController(std::size_t totalQuota, std::size_t sessionQuota);

    /** @brief Invoked (outside the internal lock) for every evicted handle. */
    void setEvictionCallback(EvictionCallback callback);

    /**
     * @brief Requests a preview slot.
     * @param owner Free-form label (usually the asset path) passed back on eviction.
     * @return The handle, or nullopt if rejected.
     */
    std::optional<ResourceHandle> acquire(bool sessionScoped, const std::string& owner = "");

    /** @brief Frees a slot; returns false if the handle was not active (e.g. already evicted). */
    bool release(const ResourceHandle& handle);

    /** @brief Marks the handle as most recently used. */
    bool touch(const ResourceHandle& handle);

    bool isActive(const ResourceHandle& handle) const;
    std::size_t activeCount() const;
    std::size_t sessionActiveCount() const;
    std::size_t totalQuota() const { return m_totalQuota; }
    std::size_t sessionQuota() const { return m_sessionQuota; }

private:
    struct Entry {
        ResourceHandle handle;
        std::string owner;
    };

    const std::size_t m_totalQuota;
    const std::size_t m_sessionQuota;

    mutable std::mutex m_mutex;
    std::list<Entry> m_lru; ///< Front is least recently used.
    std::unordered_map<std::uint64_t, std::list<Entry>::iterator> m_index;
    std::size_t m_sessionActive = 0;
    std::uint64_t m_nextId = 1;
    EvictionCallback m_onEvicted;
};

} // namespace assetbridge::application
