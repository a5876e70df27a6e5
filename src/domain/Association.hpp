/**
 * @file Association.hpp
 * @brief Generated-from relation between a source image and a 3D model.
 */

#pragma once
#include <string>
#include <chrono>

namespace assetbridge::domain {

struct Association {
    std::string imagePath;
    std::string modelPath;
    std::chrono::system_clock::time_point createdAt;
};

} // namespace assetbridge::domain
