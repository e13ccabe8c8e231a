#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <mediadex/core/types.h>

namespace mediadex::sync {

constexpr const char* kRootFolderKey = "_root_";

/// Lexically normal folder path without a trailing separator
std::filesystem::path normalizedFolder(const std::filesystem::path& path);

struct FolderInfo {
    std::string key;
    std::string displayName;
    std::filesystem::path path; ///< absolute
    std::string relativePath;   ///< '/'-separated, empty for the root
    std::optional<std::string> parentKey;
    std::vector<std::string> children;
    double mtime = 0.0;
    int depth = 0;
};

/// Folder tree of the output directory, root first, then by depth
struct FolderLayout {
    std::vector<FolderInfo> folders;

    const FolderInfo* find(const std::string& key) const;
    const FolderInfo* findByPath(const std::filesystem::path& path) const;
};

/**
 * @brief Lazily scanned, shared view of the output folder tree
 *
 * Safe to use from several request paths; a refresh replaces the snapshot
 * while readers keep the one they hold.
 */
class FolderLayoutCache {
public:
    FolderLayoutCache(std::filesystem::path root, std::vector<std::string> excludedNames);

    std::shared_ptr<const FolderLayout> get(bool forceRefresh = false);
    void invalidate();

    const std::filesystem::path& root() const { return root_; }

    /// URL-safe key for a relative folder path
    static std::string keyFor(const std::string& relativePath);

    /// Relative folder path for a key
    static Result<std::string> relativePathFor(const std::string& key);

private:
    std::shared_ptr<const FolderLayout> scan() const;

    std::filesystem::path root_;
    std::vector<std::string> excluded_;
    std::mutex mutex_;
    std::shared_ptr<const FolderLayout> layout_;
};

} // namespace mediadex::sync
