/**
 * @file AssociationManager.hpp
 * @brief Image <-> 3D model associations, auto-linking and stale-entry cleanup.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "domain/Asset.hpp"
#include "domain/Association.hpp"
#include "application/AssetTracker.hpp"

namespace assetbridge::application {

class SelectionCoordinator;

/**
 * @class AssociationManager
 * @brief Owns the generated-from relation between images and models.
 *
 * Two maps (image -> association, model -> image) are kept in sync on every
 * link and unlink so both directions resolve in constant time. Each image has
 * at most one model and each model at most one source image.
 */
class AssociationManager {
public:
    using ImageModelPair = std::pair<std::string, std::string>;

    AssociationManager(const AssetTracker& tracker, std::chrono::seconds correlationWindow);

    /** @brief Selection writes are forwarded here; this class keeps no selection state. */
    void bindSelection(SelectionCoordinator* selection) { m_selection = selection; }

    /** @brief Called after every mutation (used to persist the state document). */
    void setMutationHook(std::function<void()> hook) { m_mutationHook = std::move(hook); }

    /**
     * @brief Records or overwrites the model for an image.
     * @throws domain::NotFoundError if either path is unknown to the tracker.
     * @throws std::invalid_argument if the asset kinds do not fit the relation.
     */
    void link(const std::string& image, const std::string& model);

    /** @brief Removes the association of an image; returns whether there was one. */
    bool unlink(const std::string& image);

    /**
     * @brief Links unambiguous image/model pairs found in the two directories.
     * @return The newly created links.
     */
    std::vector<ImageModelPair> autoDetect(const std::string& imagesDir, const std::string& modelsDir);

    /**
     * @brief Runs the matching heuristic for one newly discovered image or model.
     * @return The link created, if the match was unambiguous.
     */
    std::optional<ImageModelPair> autoLink(const domain::Asset& asset);

    /**
     * @brief Marks the single model matching a discovered textured variant.
     * @return The model that was marked, if exactly one matched.
     */
    std::optional<std::string> autoMarkTextured(const domain::Asset& texturedAsset);

    /** @throws domain::NotFoundError if the path is unknown. */
    void setSelected(const std::string& path, bool selected);

    /**
     * @brief Drops every association with a side missing from the tracker.
     * @return Number of associations removed.
     */
    std::size_t cleanupMissing();

    std::optional<std::string> getModelForImage(const std::string& image) const;
    std::optional<std::string> getImageForModel(const std::string& model) const;

    /**
     * @brief Marks a model as textured, optionally naming its textured variant.
     * @throws domain::NotFoundError if the model is unknown.
     */
    void markTextured(const std::string& model, const std::string& texturedPath = "");
    bool isTextured(const std::string& model) const;
    std::string texturedPathFor(const std::string& model) const;

    /** @brief All associations ordered by image path. */
    std::vector<domain::Association> associations() const;
    std::map<std::string, std::string> texturedFlags() const { return m_textured; }

    /** @brief Loads persisted state without validating against the tracker. */
    void restore(const std::vector<domain::Association>& associations,
                 const std::map<std::string, std::string>& textured);

    /**
     * @brief Lowercase stem with generator prefixes, derived suffixes and digit runs stripped.
     */
    static std::string NameFragment(const std::string& path);
    static bool FragmentsMatch(const std::string& a, const std::string& b);

private:
    bool correlated(const domain::Asset& image, const domain::Asset& model) const;
    void linkUnchecked(const std::string& image, const std::string& model,
                       std::chrono::system_clock::time_point createdAt);
    void notifyMutation();

    const AssetTracker& m_tracker;
    std::chrono::seconds m_window;
    SelectionCoordinator* m_selection = nullptr;
    std::function<void()> m_mutationHook;

    std::unordered_map<std::string, domain::Association> m_byImage;
    std::unordered_map<std::string, std::string> m_imageByModel;
    std::map<std::string, std::string> m_textured;
};

} // namespace assetbridge::application
