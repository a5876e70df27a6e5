/**
 * @file DirectoryScanner.hpp
 * @brief Full enumeration of a generation output directory.
 */

#pragma once
#include <vector>
#include <string>
#include <optional>
#include "domain/Asset.hpp"

namespace assetbridge::infrastructure {

/**
 * @struct ScanRequest
 * @brief What to enumerate and how to classify the results.
 */
struct ScanRequest {
    std::string directory;
    std::vector<std::string> patterns;
    domain::AssetKind kind = domain::AssetKind::Image;
    bool recursive = false;
};

/**
 * @class DirectoryScanner
 * @brief Infrastructure adapter listing matching files of one directory.
 */
class DirectoryScanner {
public:
    /**
     * @brief Enumerates matching, non-empty regular files.
     * @return Assets ordered oldest first; an empty list for a missing directory;
     *         nullopt when enumeration failed part way and should be retried.
     */
    std::optional<std::vector<domain::Asset>> scan(const ScanRequest& request) const;
};

} // namespace assetbridge::infrastructure
