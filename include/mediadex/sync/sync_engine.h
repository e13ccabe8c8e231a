#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include <mediadex/core/types.h>
#include <mediadex/indexing/file_analyzer.h>
#include <mediadex/metadata/index_store.h>
#include <mediadex/sync/folder_layout.h>
#include <mediadex/sync/worker_pool.h>

namespace mediadex::sync {

enum class SyncStatus { Checking, Processing, NoChanges, Complete, Error };

std::string_view syncStatusName(SyncStatus status);

struct SyncProgress {
    std::string message;
    size_t current = 0;
    size_t total = 0;
    SyncStatus status = SyncStatus::Checking;
};

using ProgressCallback = std::function<void(const SyncProgress&)>;

/// path -> modification time in epoch seconds
using MtimeMap = std::unordered_map<std::string, double>;

struct SyncPlan {
    std::vector<std::string> toAdd;
    std::vector<std::string> toUpdate;
    std::vector<std::string> toDelete;

    bool empty() const { return toAdd.empty() && toUpdate.empty() && toDelete.empty(); }
};

struct SyncSummary {
    size_t added = 0;
    size_t updated = 0;
    size_t deleted = 0;
    size_t processed = 0;
    size_t failed = 0;
    size_t withWorkflow = 0;
    size_t withMetadata = 0;
    size_t withoutMetadata = 0;
    size_t totalSamplers = 0;
    std::chrono::milliseconds elapsed{0};
    std::vector<std::pair<std::string, std::string>> failures; ///< first few, path and reason
};

struct SyncEngineConfig {
    size_t batchSize = 500;
    size_t maxReportedFailures = 10;
};

/**
 * @brief Reconciles media files on disk with the index
 *
 * A pass scans, diffs, analyzes changed files on the worker pool, commits
 * the results in batched transactions and then runs the invalidation hooks.
 * Failures of single files or folders are counted, never propagated; store
 * errors are.
 */
class SyncEngine {
public:
    SyncEngine(metadata::IndexStore& store, const indexing::FileAnalyzer& analyzer,
               WorkerPool& pool, FolderLayoutCache& layout, SyncEngineConfig config = {});

    /**
     * @param reanalyzeAll treat every indexed file as changed (after a schema upgrade)
     */
    Result<SyncSummary> runFullSync(const ProgressCallback& progress = {},
                                    bool reanalyzeAll = false);

    /// Reconcile a single folder (not its subfolders), reporting progress per file
    Result<SyncSummary> runFolderSync(const std::filesystem::path& folder,
                                      const ProgressCallback& progress = {});

    /// Called after every pass that changed the index
    void addInvalidationHook(std::function<void()> hook);

    /**
     * @brief Three-way comparison of disk and index state
     *
     * Updates compare whole seconds. Index paths whose folder is listed in
     * `unavailableFolders` are never scheduled for deletion.
     */
    static SyncPlan diff(const MtimeMap& disk, const MtimeMap& index, bool reanalyzeAll = false,
                         const std::unordered_set<std::string>& unavailableFolders = {});

    /// Media files directly inside `folder`
    Result<MtimeMap> listMediaFiles(const std::filesystem::path& folder) const;

private:
    Result<SyncSummary> reconcile(const MtimeMap& disk, const MtimeMap& index, bool reanalyzeAll,
                                  const std::unordered_set<std::string>& unavailableFolders,
                                  const ProgressCallback& progress, bool fullPass);
    std::vector<metadata::IndexEntry> dispatch(const std::vector<std::string>& paths,
                                               const ProgressCallback& progress,
                                               SyncSummary& summary);
    Result<void> commit(const std::vector<metadata::IndexEntry>& entries,
                        const std::vector<std::string>& toDelete);
    void publish(bool fullPass);

    metadata::IndexStore& store_;
    const indexing::FileAnalyzer& analyzer_;
    WorkerPool& pool_;
    FolderLayoutCache& layout_;
    SyncEngineConfig config_;

    std::mutex commitMutex_;
    std::mutex hooksMutex_;
    std::vector<std::function<void()>> hooks_;
};

} // namespace mediadex::sync
