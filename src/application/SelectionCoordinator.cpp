/**
 * @file SelectionCoordinator.cpp
 * @brief Implementation of SelectionCoordinator.
 */

#include "application/SelectionCoordinator.hpp"
#include "domain/EngineErrors.hpp"

#include <filesystem>
#include <iostream>
#include <unordered_set>

namespace assetbridge::application {

SelectionCoordinator::SelectionCoordinator(const AssetTracker& tracker, const AssociationManager& associations)
    : m_tracker(tracker), m_associations(associations) {}

bool SelectionCoordinator::toggle(const std::string& path) {
    bool next = !isSelected(path);
    setSelected(path, next);
    return next;
}

void SelectionCoordinator::setSelected(const std::string& path, bool selected) {
    if (!m_tracker.contains(path)) {
        throw domain::NotFoundError(path);
    }

    auto it = m_selected.find(path);
    if (it != m_selected.end() && it->second == selected) return;

    m_selected[path] = selected;
    std::cout << "[SelectionCoordinator] " << (selected ? "Selected " : "Deselected ")
              << std::filesystem::path(path).filename().string() << std::endl;
    notifyMutation();
    publish();
}

void SelectionCoordinator::clearSelection(std::optional<domain::AssetKind> kind) {
    bool changed = false;
    for (auto& entry : m_selected) {
        if (!entry.second) continue;
        if (kind) {
            auto asset = m_tracker.find(entry.first);
            if (!asset || asset->kind != *kind) continue;
        }
        entry.second = false;
        changed = true;
    }
    if (!changed) return;

    std::cout << "[SelectionCoordinator] Cleared " << (kind ? domain::ToString(*kind) : "all") << " selections" << std::endl;
    notifyMutation();
    publish();
}

bool SelectionCoordinator::isSelected(const std::string& path) const {
    auto it = m_selected.find(path);
    return it != m_selected.end() && it->second;
}

std::vector<std::string> SelectionCoordinator::selectedPaths(std::optional<domain::AssetKind> kind) const {
    std::vector<std::string> result;
    auto collect = [&](domain::AssetKind k) {
        for (const auto& asset : m_tracker.listByKind(k)) {
            if (isSelected(asset.path)) result.push_back(asset.path);
        }
    };
    if (kind) {
        collect(*kind);
    } else {
        collect(domain::AssetKind::Image);
        collect(domain::AssetKind::Model);
        collect(domain::AssetKind::TexturedModel);
    }
    return result;
}

bool SelectionCoordinator::recompute() {
    auto next = buildView();
    if (next == m_view) return false;
    m_view = std::move(next);
    if (m_listener) m_listener(m_view);
    return true;
}

void SelectionCoordinator::onLinked(const std::string& image, const std::string& model) {
    if (isSelected(image) && !isSelected(model) && m_tracker.contains(model)) {
        m_selected[model] = true;
        std::cout << "[SelectionCoordinator] Auto-selected model "
                  << std::filesystem::path(model).filename().string() << std::endl;
        notifyMutation();
    }
}

void SelectionCoordinator::onAssetRemoved(const std::string& path) {
    if (m_selected.erase(path) > 0) {
        notifyMutation();
    }
}

void SelectionCoordinator::restore(const std::map<std::string, bool>& flags) {
    m_selected.clear();
    for (const auto& entry : flags) {
        m_selected[entry.first] = entry.second;
    }
    m_view = buildView();
}

std::map<std::string, bool> SelectionCoordinator::flags() const {
    return std::map<std::string, bool>(m_selected.begin(), m_selected.end());
}

domain::UnifiedObject SelectionCoordinator::lineageFromModel(const std::string& model, const std::string& image) const {
    domain::UnifiedObject object;
    object.imagePath = image;
    object.modelPath = model;
    object.key = model;
    object.stage = domain::ProgressionStage::HasModel;

    if (m_associations.isTextured(model)) {
        object.stage = domain::ProgressionStage::Textured;
        object.texturedPath = m_associations.texturedPathFor(model);
        if (!object.texturedPath.empty() && m_tracker.contains(object.texturedPath)) {
            object.key = object.texturedPath;
        }
    }
    return object;
}

std::vector<domain::UnifiedObject> SelectionCoordinator::buildView() const {
    std::vector<domain::UnifiedObject> objects;
    std::unordered_set<std::string> covered;

    for (const auto& image : m_tracker.listByKind(domain::AssetKind::Image)) {
        if (!isSelected(image.path)) continue;

        auto model = m_associations.getModelForImage(image.path);
        if (model && m_tracker.contains(*model)) {
            auto object = lineageFromModel(*model, image.path);
            covered.insert(*model);
            if (!object.texturedPath.empty()) covered.insert(object.texturedPath);
            objects.push_back(std::move(object));
        } else {
            domain::UnifiedObject object;
            object.key = image.path;
            object.imagePath = image.path;
            object.stage = domain::ProgressionStage::ImageOnly;
            objects.push_back(std::move(object));
        }
        covered.insert(image.path);
    }

    for (const auto& model : m_tracker.listByKind(domain::AssetKind::Model)) {
        if (!isSelected(model.path) || covered.count(model.path) > 0) continue;

        auto source = m_associations.getImageForModel(model.path);
        auto object = lineageFromModel(model.path, source ? *source : std::string());
        covered.insert(model.path);
        if (!object.texturedPath.empty()) covered.insert(object.texturedPath);
        objects.push_back(std::move(object));
    }

    for (const auto& textured : m_tracker.listByKind(domain::AssetKind::TexturedModel)) {
        if (!isSelected(textured.path) || covered.count(textured.path) > 0) continue;

        domain::UnifiedObject object;
        object.key = textured.path;
        object.texturedPath = textured.path;
        object.stage = domain::ProgressionStage::Textured;
        objects.push_back(std::move(object));
    }
    return objects;
}

void SelectionCoordinator::publish() {
    m_view = buildView();
    if (m_listener) m_listener(m_view);
}

void SelectionCoordinator::notifyMutation() {
    if (m_mutationHook) m_mutationHook();
}

} // namespace assetbridge::application
