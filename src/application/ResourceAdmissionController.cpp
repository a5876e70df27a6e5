/**
 * @file ResourceAdmissionController.cpp
 * @brief Implementation of ResourceAdmissionController.
 */

#include "application/ResourceAdmissionController.hpp"

#include <iostream>
#include <iterator>
#include <stdexcept>

namespace assetbridge::application {

ResourceAdmissionController::ResourceAdmissionController(std::size_t totalQuota, std::size_t sessionQuota)
    : m_totalQuota(totalQuota), m_sessionQuota(sessionQuota) {
    if (totalQuota == 0) {
        throw std::invalid_argument("Preview total quota must be positive");
    }
    if (sessionQuota > totalQuota) {
        throw std::invalid_argument("Preview session quota exceeds total quota");
    }
}

void ResourceAdmissionController::setEvictionCallback(EvictionCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_onEvicted = std::move(callback);
}

std::optional<ResourceHandle> ResourceAdmissionController::acquire(bool sessionScoped, const std::string& owner) {
    std::optional<Entry> evicted;
    EvictionCallback onEvicted;
    ResourceHandle granted;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (sessionScoped && m_sessionActive >= m_sessionQuota) {
            std::cout << "[ResourceAdmission] Session preview limit reached ("
                      << m_sessionActive << "/" << m_sessionQuota << ")" << std::endl;
            return std::nullopt;
        }

        if (m_index.size() >= m_totalQuota) {
            if (!sessionScoped) {
                std::cout << "[ResourceAdmission] Total preview limit reached ("
                          << m_index.size() << "/" << m_totalQuota << "), historical request rejected" << std::endl;
                return std::nullopt;
            }

            auto victim = m_lru.begin();
            while (victim != m_lru.end() && victim->handle.sessionScoped) ++victim;
            if (victim == m_lru.end()) {
                std::cout << "[ResourceAdmission] Total preview limit reached and no historical preview to evict" << std::endl;
                return std::nullopt;
            }

            evicted = *victim;
            m_index.erase(victim->handle.id);
            m_lru.erase(victim);
            onEvicted = m_onEvicted;
        }

        granted.id = m_nextId++;
        granted.sessionScoped = sessionScoped;
        m_lru.push_back(Entry{granted, owner});
        m_index[granted.id] = std::prev(m_lru.end());
        if (sessionScoped) ++m_sessionActive;
    }

    if (evicted) {
        std::cout << "[ResourceAdmission] Evicted historical preview " << evicted->handle.id
                  << (evicted->owner.empty() ? "" : " (" + evicted->owner + ")") << std::endl;
        if (onEvicted) {
            try {
                onEvicted(evicted->handle, evicted->owner);
            } catch (const std::exception& e) {
                std::cerr << "[ResourceAdmission] Eviction callback failed: " << e.what() << std::endl;
            }
        }
    }
    return granted;
}

bool ResourceAdmissionController::release(const ResourceHandle& handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(handle.id);
    if (it == m_index.end()) return false;

    if (it->second->handle.sessionScoped) --m_sessionActive;
    m_lru.erase(it->second);
    m_index.erase(it);
    return true;
}

bool ResourceAdmissionController::touch(const ResourceHandle& handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(handle.id);
    if (it == m_index.end()) return false;
    m_lru.splice(m_lru.end(), m_lru, it->second);
    return true;
}

bool ResourceAdmissionController::isActive(const ResourceHandle& handle) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.count(handle.id) > 0;
}

std::size_t ResourceAdmissionController::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.size();
}

std::size_t ResourceAdmissionController::sessionActiveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessionActive;
}

} // namespace assetbridge::application
