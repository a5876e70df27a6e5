#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace assetbridge::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / "AssetBridge" / "settings.json";
}

fs::path PathUtils::GetStateFile() {
    return GetDataHome() / "AssetBridge" / "asset_state.json";
}

std::chrono::system_clock::time_point PathUtils::ToSystemTime(fs::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now()
    );
}

bool PathUtils::MatchesPattern(const std::string& filename, const std::string& pattern) {
    const std::string name = ToLower(filename);
    const std::string pat = ToLower(pattern);

    // Iterative wildcard match with single-star backtracking.
    size_t n = 0, p = 0;
    size_t starPos = std::string::npos, matchPos = 0;
    while (n < name.size()) {
        if (p < pat.size() && (pat[p] == '?' || pat[p] == name[n])) {
            ++n;
            ++p;
        } else if (p < pat.size() && pat[p] == '*') {
            starPos = p++;
            matchPos = n;
        } else if (starPos != std::string::npos) {
            p = starPos + 1;
            n = ++matchPos;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

bool PathUtils::MatchesAnyPattern(const std::string& filename, const std::vector<std::string>& patterns) {
    if (patterns.empty()) return true;
    return std::any_of(patterns.begin(), patterns.end(),
        [&](const std::string& pattern) { return MatchesPattern(filename, pattern); });
}

std::string PathUtils::Canonical(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) absolute = path;
    fs::path normal = absolute.lexically_normal();
    // "dir/" and "dir" must produce the same key
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal.string();
}

std::string PathUtils::ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c){ return std::tolower(c); });
    return value;
}

} // namespace assetbridge::infrastructure
