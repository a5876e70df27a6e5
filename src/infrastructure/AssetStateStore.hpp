/**
 * @file AssetStateStore.hpp
 * @brief JSON document holding associations, selection flags and textured flags.
 */

#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include "domain/Association.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace assetbridge::infrastructure {

/**
 * @struct PersistedState
 * @brief Flat snapshot of everything the engine keeps across restarts.
 */
struct PersistedState {
    std::vector<domain::Association> associations;
    std::map<std::string, bool> selected;
    std::map<std::string, std::string> textured; ///< model path -> textured variant path (may be empty).
};

/**
 * @class AssetStateStore
 * @brief Reads the state document and writes it whole through the PersistenceService.
 */
class AssetStateStore {
public:
    AssetStateStore(std::string documentPath, std::shared_ptr<PersistenceService> persistence);

    /** @brief Loads the document; a missing or corrupt file yields an empty state. */
    PersistedState load() const;

    /** @brief Queues a full rewrite of the document. */
    void save(const PersistedState& state);

    const std::string& documentPath() const { return m_documentPath; }

private:
    std::string m_documentPath;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace assetbridge::infrastructure
