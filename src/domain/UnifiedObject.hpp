/**
 * @file UnifiedObject.hpp
 * @brief One creative lineage (image -> model -> textured model) in the selection summary.
 */

#pragma once
#include <string>

namespace assetbridge::domain {

/**
 * @enum ProgressionStage
 * @brief How far a lineage has progressed. Only ever moves forward.
 */
enum class ProgressionStage {
    ImageOnly,
    HasModel,
    Textured
};

inline const char* ToString(ProgressionStage stage) {
    switch (stage) {
        case ProgressionStage::ImageOnly: return "ImageOnly";
        case ProgressionStage::HasModel: return "HasModel";
        case ProgressionStage::Textured: return "Textured";
    }
    return "ImageOnly";
}

/**
 * @struct UnifiedObject
 * @brief Deduplicated selection entry keyed by the most-derived known asset.
 */
struct UnifiedObject {
    std::string key;          ///< Path of the most-derived asset of the lineage.
    std::string imagePath;    ///< Source image, empty for standalone models.
    std::string modelPath;    ///< Derived model, empty while ImageOnly.
    std::string texturedPath; ///< Textured variant if one was discovered.
    ProgressionStage stage = ProgressionStage::ImageOnly;

    bool operator==(const UnifiedObject& other) const {
        return key == other.key && imagePath == other.imagePath && modelPath == other.modelPath &&
               texturedPath == other.texturedPath && stage == other.stage;
    }
    bool operator!=(const UnifiedObject& other) const { return !(*this == other); }
};

} // namespace assetbridge::domain
