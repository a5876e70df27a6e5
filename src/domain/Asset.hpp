/**
 * @file Asset.hpp
 * @brief Domain entity representing a generated file known to the engine.
 */

#pragma once
#include <string>
#include <chrono>
#include <optional>

namespace assetbridge::domain {

/**
 * @enum AssetKind
 * @brief Categorization of generated files.
 */
enum class AssetKind {
    Image,
    Model,
    TexturedModel
};

/**
 * @class Asset
 * @brief A file discovered in one of the watched output directories.
 *
 * The path is the identity. Records are created on first discovery and are
 * never mutated afterwards.
 */
class Asset {
public:
    std::string path;                                ///< Absolute path, unique key.
    AssetKind kind;                                  ///< Kind given by the watch that found it.
    std::chrono::system_clock::time_point modifiedAt; ///< File modification time at discovery.

    Asset() : kind(AssetKind::Image) {}
    Asset(std::string p, AssetKind k, std::chrono::system_clock::time_point mtime)
        : path(std::move(p)), kind(k), modifiedAt(mtime) {}
};

inline const char* ToString(AssetKind kind) {
    switch (kind) {
        case AssetKind::Image: return "image";
        case AssetKind::Model: return "model";
        case AssetKind::TexturedModel: return "textured_model";
    }
    return "image";
}

inline std::optional<AssetKind> AssetKindFromString(const std::string& value) {
    if (value == "image") return AssetKind::Image;
    if (value == "model") return AssetKind::Model;
    if (value == "textured_model") return AssetKind::TexturedModel;
    return std::nullopt;
}

} // namespace assetbridge::domain
