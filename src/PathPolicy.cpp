#include "PathPolicy.hpp"
#include <filesystem>
#include <mutex>

void PathPolicy::setAllowedPaths(const std::vector<std::string>& paths) {
    std::vector<std::string> resolved;
    for (const auto& path : paths) {
        std::error_code ec;
        auto canonical = std::filesystem::canonical(path, ec);
        if (!ec) {
            resolved.push_back(canonical.string());
        }
    }
    std::unique_lock lock(mutex_);
    restricted_ = !paths.empty();
    allowedPaths_ = std::move(resolved);
}

std::vector<std::string> PathPolicy::allowedPaths() const {
    std::shared_lock lock(mutex_);
    return allowedPaths_;
}

bool PathPolicy::isPathAllowed(const std::string& path) const {
    std::shared_lock lock(mutex_);
    if (!restricted_) {
        return true;
    }

    std::error_code ec;
    auto canonical = std::filesystem::canonical(path, ec).string();
    if (ec) {
        return false;
    }

    // Allowed when equal to, or nested under, an allowed directory
    for (const auto& allowed : allowedPaths_) {
        if (allowed == "/" || canonical == allowed ||
            canonical.compare(0, allowed.size() + 1, allowed + "/") == 0) {
            return true;
        }
    }
    return false;
}
