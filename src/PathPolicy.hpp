#pragma once
#include <shared_mutex>
#include <string>
#include <vector>

// Directory allow-list for file access. An empty list allows every path; a
// list whose entries all fail to resolve allows none.
class PathPolicy {
public:
    // Entries that do not resolve to an existing path are skipped.
    void setAllowedPaths(const std::vector<std::string>& paths);
    std::vector<std::string> allowedPaths() const;
    bool isPathAllowed(const std::string& path) const;

private:
    std::vector<std::string> allowedPaths_;
    bool restricted_ = false;
    mutable std::shared_mutex mutex_;
};
