/**
 * @file DirectoryScanner.cpp
 * @brief Implementation of the DirectoryScanner.
 */

#include "infrastructure/DirectoryScanner.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace assetbridge::infrastructure {

std::optional<std::vector<domain::Asset>> DirectoryScanner::scan(const ScanRequest& request) const {
    std::vector<domain::Asset> assets;

    std::error_code ec;
    if (!fs::exists(request.directory, ec)) {
        return assets;
    }

    auto processEntry = [&](const fs::directory_entry& entry) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc)) return;
        if (!PathUtils::MatchesAnyPattern(entry.path().filename().string(), request.patterns)) return;

        auto size = entry.file_size(entryEc);
        if (entryEc || size == 0) return; // still being written

        auto ftime = entry.last_write_time(entryEc);
        if (entryEc) return;

        assets.emplace_back(PathUtils::Canonical(entry.path()), request.kind, PathUtils::ToSystemTime(ftime));
    };

    try {
        if (request.recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(request.directory)) {
                processEntry(entry);
            }
        } else {
            for (const auto& entry : fs::directory_iterator(request.directory)) {
                processEntry(entry);
            }
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[DirectoryScanner] Scan of " << request.directory << " interrupted: " << e.what() << std::endl;
        return std::nullopt;
    }

    std::stable_sort(assets.begin(), assets.end(), [](const domain::Asset& a, const domain::Asset& b) {
        return a.modifiedAt < b.modifiedAt;
    });
    return assets;
}

} // namespace assetbridge::infrastructure
