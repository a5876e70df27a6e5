/**
 * @file AssociationManager.cpp
 * @brief Implementation of AssociationManager.
 */

#include "application/AssociationManager.hpp"
#include "application/SelectionCoordinator.hpp"
#include "domain/EngineErrors.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <regex>
#include <stdexcept>

namespace assetbridge::application {

namespace fs = std::filesystem;
using infrastructure::PathUtils;

namespace {

// Generator prefixes and derived-asset suffixes that carry no lineage information.
const char* const kNoiseTokens[] = {
    "comfyui_", "hy3d_", "image_", "model_", "_textured", "_model", "_mesh", "_3d"
};

std::string FileName(const std::string& path) {
    return fs::path(path).filename().string();
}

bool IsUnder(const std::string& path, const std::string& directory) {
    std::string dir = PathUtils::Canonical(directory);
    if (!dir.empty() && dir.back() != fs::path::preferred_separator) {
        dir += fs::path::preferred_separator;
    }
    return path.compare(0, dir.size(), dir) == 0;
}

} // namespace

AssociationManager::AssociationManager(const AssetTracker& tracker, std::chrono::seconds correlationWindow)
    : m_tracker(tracker), m_window(correlationWindow) {}

std::string AssociationManager::NameFragment(const std::string& path) {
    std::string stem = PathUtils::ToLower(fs::path(path).stem().string());

    for (const char* token : kNoiseTokens) {
        std::string t(token);
        for (auto pos = stem.find(t); pos != std::string::npos; pos = stem.find(t)) {
            stem.erase(pos, t.size());
        }
    }

    static const std::regex kDigitRun("[_-]?[0-9]+[_-]?");
    stem = std::regex_replace(stem, kDigitRun, "");

    auto isTrim = [](char c) { return c == '_' || c == '-' || c == ' ' || c == '.'; };
    while (!stem.empty() && isTrim(stem.front())) stem.erase(stem.begin());
    while (!stem.empty() && isTrim(stem.back())) stem.pop_back();
    return stem;
}

bool AssociationManager::FragmentsMatch(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return false;
    if (a == b) return true;
    if (a.size() > 3 && b.size() > 3) {
        return a.find(b) != std::string::npos || b.find(a) != std::string::npos;
    }
    return false;
}

bool AssociationManager::correlated(const domain::Asset& image, const domain::Asset& model) const {
    if (model.modifiedAt < image.modifiedAt) return false;
    if (model.modifiedAt - image.modifiedAt > m_window) return false;
    return FragmentsMatch(NameFragment(image.path), NameFragment(model.path));
}

void AssociationManager::link(const std::string& image, const std::string& model) {
    auto imageAsset = m_tracker.find(image);
    if (!imageAsset) throw domain::NotFoundError(image);
    auto modelAsset = m_tracker.find(model);
    if (!modelAsset) throw domain::NotFoundError(model);

    if (imageAsset->kind != domain::AssetKind::Image) {
        throw std::invalid_argument("Association source is not an image: " + image);
    }
    if (modelAsset->kind != domain::AssetKind::Model) {
        throw std::invalid_argument("Association target is not a model: " + model);
    }

    linkUnchecked(image, model, std::chrono::system_clock::now());
    std::cout << "[AssociationManager] Created association: " << FileName(image) << " -> " << FileName(model) << std::endl;
    notifyMutation();
}

void AssociationManager::linkUnchecked(const std::string& image, const std::string& model,
                                       std::chrono::system_clock::time_point createdAt) {
    auto existing = m_byImage.find(image);
    if (existing != m_byImage.end()) {
        m_imageByModel.erase(existing->second.modelPath);
    }

    auto previousOwner = m_imageByModel.find(model);
    if (previousOwner != m_imageByModel.end() && previousOwner->second != image) {
        m_byImage.erase(previousOwner->second);
    }

    m_byImage[image] = domain::Association{image, model, createdAt};
    m_imageByModel[model] = image;
}

bool AssociationManager::unlink(const std::string& image) {
    auto it = m_byImage.find(image);
    if (it == m_byImage.end()) return false;

    m_imageByModel.erase(it->second.modelPath);
    m_byImage.erase(it);
    notifyMutation();
    return true;
}

std::vector<AssociationManager::ImageModelPair> AssociationManager::autoDetect(const std::string& imagesDir,
                                                                                 const std::string& modelsDir) {
    std::cout << "[AssociationManager] Auto-detecting image-model associations..." << std::endl;

    std::vector<domain::Asset> images;
    for (const auto& asset : m_tracker.listByKind(domain::AssetKind::Image)) {
        if (IsUnder(asset.path, imagesDir) && m_byImage.count(asset.path) == 0) images.push_back(asset);
    }
    std::vector<domain::Asset> models;
    for (const auto& asset : m_tracker.listByKind(domain::AssetKind::Model)) {
        if (IsUnder(asset.path, modelsDir) && m_imageByModel.count(asset.path) == 0) models.push_back(asset);
    }

    std::unordered_map<std::string, std::vector<std::string>> modelsForImage;
    std::unordered_map<std::string, std::vector<std::string>> imagesForModel;
    for (const auto& image : images) {
        for (const auto& model : models) {
            if (correlated(image, model)) {
                modelsForImage[image.path].push_back(model.path);
                imagesForModel[model.path].push_back(image.path);
            }
        }
    }

    std::vector<ImageModelPair> created;
    for (const auto& image : images) {
        auto candidates = modelsForImage.find(image.path);
        if (candidates == modelsForImage.end()) continue;
        if (candidates->second.size() != 1) {
            std::cout << "[AssociationManager] Ambiguous match for " << FileName(image.path)
                      << " (" << candidates->second.size() << " models), left unlinked" << std::endl;
            continue;
        }
        const std::string& model = candidates->second.front();
        if (imagesForModel[model].size() != 1) {
            std::cout << "[AssociationManager] Ambiguous match for " << FileName(model)
                      << " (" << imagesForModel[model].size() << " images), left unlinked" << std::endl;
            continue;
        }
        linkUnchecked(image.path, model, std::chrono::system_clock::now());
        created.emplace_back(image.path, model);
    }

    if (!created.empty()) {
        std::cout << "[AssociationManager] Auto-detected " << created.size() << " new associations" << std::endl;
        notifyMutation();
    } else {
        std::cout << "[AssociationManager] No new associations detected" << std::endl;
    }
    return created;
}

std::optional<AssociationManager::ImageModelPair> AssociationManager::autoLink(const domain::Asset& asset) {
    if (asset.kind == domain::AssetKind::TexturedModel) return std::nullopt;

    const bool isImage = asset.kind == domain::AssetKind::Image;
    if (isImage ? m_byImage.count(asset.path) > 0 : m_imageByModel.count(asset.path) > 0) {
        return std::nullopt;
    }

    // Unlinked counterparts that correlate with the new asset.
    auto candidatesFor = [this](const domain::Asset& subject) {
        std::vector<domain::Asset> found;
        const bool subjectIsImage = subject.kind == domain::AssetKind::Image;
        auto otherKind = subjectIsImage ? domain::AssetKind::Model : domain::AssetKind::Image;
        for (const auto& other : m_tracker.listByKind(otherKind)) {
            bool linked = subjectIsImage ? m_imageByModel.count(other.path) > 0 : m_byImage.count(other.path) > 0;
            if (linked) continue;
            if (subjectIsImage ? correlated(subject, other) : correlated(other, subject)) {
                found.push_back(other);
            }
        }
        return found;
    };

    auto candidates = candidatesFor(asset);
    if (candidates.empty()) return std::nullopt;
    if (candidates.size() > 1) {
        std::cout << "[AssociationManager] Ambiguous match for " << FileName(asset.path)
                  << " (" << candidates.size() << " candidates), left unlinked" << std::endl;
        return std::nullopt;
    }

    const auto& counterpart = candidates.front();
    if (candidatesFor(counterpart).size() != 1) {
        std::cout << "[AssociationManager] Ambiguous match for " << FileName(counterpart.path)
                  << ", left unlinked" << std::endl;
        return std::nullopt;
    }

    ImageModelPair pair = isImage ? ImageModelPair{asset.path, counterpart.path}
                                  : ImageModelPair{counterpart.path, asset.path};
    linkUnchecked(pair.first, pair.second, std::chrono::system_clock::now());
    std::cout << "[AssociationManager] Auto-linked " << FileName(pair.first) << " -> " << FileName(pair.second) << std::endl;
    notifyMutation();
    return pair;
}

std::optional<std::string> AssociationManager::autoMarkTextured(const domain::Asset& texturedAsset) {
    const std::string fragment = NameFragment(texturedAsset.path);

    std::vector<std::string> candidates;
    for (const auto& model : m_tracker.listByKind(domain::AssetKind::Model)) {
        if (!texturedPathFor(model.path).empty()) continue;
        if (texturedAsset.modifiedAt < model.modifiedAt) continue;
        if (texturedAsset.modifiedAt - model.modifiedAt > m_window) continue;
        if (FragmentsMatch(fragment, NameFragment(model.path))) {
            candidates.push_back(model.path);
        }
    }

    if (candidates.size() != 1) {
        if (candidates.size() > 1) {
            std::cout << "[AssociationManager] Textured model " << FileName(texturedAsset.path)
                      << " matches " << candidates.size() << " models, left unassigned" << std::endl;
        }
        return std::nullopt;
    }

    m_textured[candidates.front()] = texturedAsset.path;
    std::cout << "[AssociationManager] Marked " << FileName(candidates.front()) << " as textured by "
              << FileName(texturedAsset.path) << std::endl;
    notifyMutation();
    return candidates.front();
}

void AssociationManager::setSelected(const std::string& path, bool selected) {
    if (!m_selection) {
        throw std::logic_error("AssociationManager has no SelectionCoordinator bound");
    }
    m_selection->setSelected(path, selected);
}

std::size_t AssociationManager::cleanupMissing() {
    std::size_t removed = 0;
    for (auto it = m_byImage.begin(); it != m_byImage.end();) {
        const auto& assoc = it->second;
        if (!m_tracker.contains(assoc.imagePath) || !m_tracker.contains(assoc.modelPath)) {
            std::cout << "[AssociationManager] Removing association for missing files: "
                      << FileName(assoc.imagePath) << " -> " << FileName(assoc.modelPath) << std::endl;
            m_imageByModel.erase(assoc.modelPath);
            it = m_byImage.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    bool texturedChanged = false;
    for (auto it = m_textured.begin(); it != m_textured.end();) {
        if (!m_tracker.contains(it->first)) {
            it = m_textured.erase(it);
            texturedChanged = true;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        std::cout << "[AssociationManager] Cleaned up " << removed << " associations with missing files" << std::endl;
    }
    if (removed > 0 || texturedChanged) {
        notifyMutation();
    }
    return removed;
}

std::optional<std::string> AssociationManager::getModelForImage(const std::string& image) const {
    auto it = m_byImage.find(image);
    if (it == m_byImage.end()) return std::nullopt;
    return it->second.modelPath;
}

std::optional<std::string> AssociationManager::getImageForModel(const std::string& model) const {
    auto it = m_imageByModel.find(model);
    if (it == m_imageByModel.end()) return std::nullopt;
    return it->second;
}

void AssociationManager::markTextured(const std::string& model, const std::string& texturedPath) {
    if (!m_tracker.contains(model)) throw domain::NotFoundError(model);

    auto it = m_textured.find(model);
    if (it != m_textured.end() && (texturedPath.empty() || it->second == texturedPath)) {
        return; // already textured; an empty path never erases a known variant
    }
    m_textured[model] = texturedPath;
    std::cout << "[AssociationManager] Marked " << FileName(model) << " as textured" << std::endl;
    notifyMutation();
}

bool AssociationManager::isTextured(const std::string& model) const {
    return m_textured.count(model) > 0;
}

std::string AssociationManager::texturedPathFor(const std::string& model) const {
    auto it = m_textured.find(model);
    return it == m_textured.end() ? std::string() : it->second;
}

std::vector<domain::Association> AssociationManager::associations() const {
    std::vector<domain::Association> result;
    result.reserve(m_byImage.size());
    for (const auto& entry : m_byImage) {
        result.push_back(entry.second);
    }
    std::sort(result.begin(), result.end(), [](const domain::Association& a, const domain::Association& b) {
        return a.imagePath < b.imagePath;
    });
    return result;
}

void AssociationManager::restore(const std::vector<domain::Association>& associations,
                                 const std::map<std::string, std::string>& textured) {
    m_byImage.clear();
    m_imageByModel.clear();
    for (const auto& assoc : associations) {
        linkUnchecked(assoc.imagePath, assoc.modelPath, assoc.createdAt);
    }
    m_textured = textured;
}

void AssociationManager::notifyMutation() {
    if (m_mutationHook) m_mutationHook();
}

} // namespace assetbridge::application
