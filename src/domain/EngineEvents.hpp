/**
 * @file EngineEvents.hpp
 * @brief Discovery events flowing into the dispatcher and listener hooks flowing out.
 */

#pragma once

#include <string>
#include <chrono>
#include <vector>
#include <functional>
#include "Asset.hpp"
#include "UnifiedObject.hpp"

namespace assetbridge::domain {

enum class FileEventType {
    Created,
    Modified,
    Removed
};

/**
 * @struct DiscoveryEvent
 * @brief A file observed by a watcher or a view scan.
 */
struct DiscoveryEvent {
    std::string path;
    AssetKind kind = AssetKind::Image;
    FileEventType type = FileEventType::Created;
    std::chrono::system_clock::time_point modifiedAt;
};

/**
 * @struct EngineListener
 * @brief Presentation-side callbacks. Any member may be left empty.
 *
 * All callbacks run on the dispatcher thread.
 */
struct EngineListener {
    std::function<void(const Asset&, bool isSessionScoped)> onAssetDiscovered;
    std::function<void(const std::vector<UnifiedObject>&)> onSelectionChanged;
    std::function<void(const std::string& image, const std::string& model)> onAssociationChanged;
    std::function<void(const std::string& path)> onAssetRemoved;
};

} // namespace assetbridge::domain
