#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <mediadex/core/bounded_cache.h>
#include <mediadex/core/types.h>
#include <mediadex/metadata/index_store.h>
#include <mediadex/sync/folder_layout.h>

namespace mediadex::app {

struct GalleryServiceConfig {
    BoundedCacheConfig filterOptionsCache{50, std::chrono::seconds(300)};
    BoundedCacheConfig timingLog{500, std::chrono::seconds(600)};
};

/// Per-id outcome of a batch mutation
struct MutationReport {
    std::vector<FileId> succeeded; ///< ids after the mutation
    std::vector<std::pair<FileId, std::string>> failed;
    size_t renamed = 0; ///< moves that needed a "(n)" suffix
};

struct RequestTiming {
    std::string endpoint;
    double durationMs = 0.0;
    TimePoint at;
};

/**
 * @brief Query and mutation surface used by the view layer
 *
 * Filesystem changes always happen before the index is touched. If the
 * index update fails afterwards, rename and move are undone on disk.
 */
class GalleryService {
public:
    GalleryService(metadata::IndexStore& store, sync::FolderLayoutCache& layout,
                   GalleryServiceConfig config = {});

    Result<metadata::Page> queryPage(const metadata::FileQuery& query,
                                     const metadata::PageRequest& page);
    Result<int64_t> countMatching(const metadata::FileQuery& query);

    /// Served from the bounded cache when fresh
    Result<metadata::FilterOptions> filterOptions(const metadata::FolderScope& scope = {});

    Result<std::optional<metadata::FileRecord>> getFile(const FileId& id);
    Result<extraction::SamplerRecords> getSamplers(const FileId& id);
    Result<metadata::IndexStats> stats();

    Result<int64_t> markFavorite(const std::vector<FileId>& ids, bool favorite);

    /**
     * @brief Rename a file within its folder
     *
     * The old extension is kept when `newName` has none.
     * @return the updated record, which carries the new id
     */
    Result<metadata::FileRecord> renamePath(const FileId& id, const std::string& newName);

    Result<MutationReport> movePath(const std::vector<FileId>& ids,
                                    const std::filesystem::path& destFolder);
    Result<MutationReport> deletePath(const std::vector<FileId>& ids);

    /// Drop cached aggregates; also registered as a sync invalidation hook
    void invalidateCaches();

    void recordTiming(const std::string& endpoint, std::chrono::duration<double, std::milli> took);

    BoundedCacheStats filterOptionsCacheStats() const { return filterCache_.stats(); }
    BoundedCacheStats timingLogStats() const { return timingLog_.stats(); }

    /// Validated final file name, or InvalidArgument
    static Result<std::string> resolveNewName(const std::string& oldName,
                                              const std::string& requested);

    /// `folder/name`, or the first free `folder/stem(n).ext`
    static std::filesystem::path uniqueDestination(const std::filesystem::path& folder,
                                                   const std::string& filename);

private:
    Result<void> moveOnDisk(const std::filesystem::path& from, const std::filesystem::path& to);

    metadata::IndexStore& store_;
    sync::FolderLayoutCache& layout_;
    BoundedCache<std::string, metadata::FilterOptions> filterCache_;
    BoundedCache<std::string, RequestTiming> timingLog_;
    std::atomic<uint64_t> timingSequence_{0};
};

} // namespace mediadex::app
