/**
 * @file SelectionCoordinator.hpp
 * @brief Single source of truth for which assets go to the next pipeline stage.
 */

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/Asset.hpp"
#include "domain/UnifiedObject.hpp"
#include "application/AssetTracker.hpp"
#include "application/AssociationManager.hpp"

namespace assetbridge::application {

/**
 * @class SelectionCoordinator
 * @brief Owns SelectionState (one boolean per path, shared by every view).
 *
 * Every presentation view reads selection from here; there is no per-view copy.
 * After each mutation the unified object view is recomputed: one entry per
 * selected lineage, keyed by its most-derived asset. The progression stage is
 * derived from association and textured state only, so toggling selection can
 * never move a lineage backwards.
 */
class SelectionCoordinator {
public:
    using ChangeListener = std::function<void(const std::vector<domain::UnifiedObject>&)>;

    SelectionCoordinator(const AssetTracker& tracker, const AssociationManager& associations);

    void setChangeListener(ChangeListener listener) { m_listener = std::move(listener); }
    void setMutationHook(std::function<void()> hook) { m_mutationHook = std::move(hook); }

    /**
     * @brief Flips the selection of a known asset.
     * @return The new selection state.
     * @throws domain::NotFoundError if the path was never discovered.
     */
    bool toggle(const std::string& path);

    /** @throws domain::NotFoundError if the path was never discovered. */
    void setSelected(const std::string& path, bool selected);

    /** @brief Deselects everything, or only assets of the given kind. */
    void clearSelection(std::optional<domain::AssetKind> kind = std::nullopt);

    bool isSelected(const std::string& path) const;

    /** @brief Selected known assets in discovery order, optionally filtered by kind. */
    std::vector<std::string> selectedPaths(std::optional<domain::AssetKind> kind = std::nullopt) const;

    const std::vector<domain::UnifiedObject>& unifiedView() const { return m_view; }

    /**
     * @brief Recomputes the unified view after discovery or association changes.
     * @return True if the view changed (listeners were notified).
     */
    bool recompute();

    /** @brief A selected image that gains a model pulls the model into the selection. */
    void onLinked(const std::string& image, const std::string& model);

    /** @brief Drops the selection entry of an asset that no longer exists. */
    void onAssetRemoved(const std::string& path);

    /** @brief Loads persisted flags; entries for undiscovered paths stay dormant until discovery. */
    void restore(const std::map<std::string, bool>& flags);
    std::map<std::string, bool> flags() const;

private:
    std::vector<domain::UnifiedObject> buildView() const;
    domain::UnifiedObject lineageFromModel(const std::string& model, const std::string& image) const;
    void publish();
    void notifyMutation();

    const AssetTracker& m_tracker;
    const AssociationManager& m_associations;
    ChangeListener m_listener;
    std::function<void()> m_mutationHook;

    std::unordered_map<std::string, bool> m_selected;
    std::vector<domain::UnifiedObject> m_view;
};

} // namespace assetbridge::application
