#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <mediadex/core/file_time.h>
#include <mediadex/sync/sync_engine.h>

namespace mediadex::sync {

namespace fs = std::filesystem;

namespace {

struct Completion {
    std::string path;
    Result<metadata::IndexEntry> result;
};

// Shared with in-flight tasks, so it outlives an early return of the collector
struct CompletionQueue {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Completion> items;

    void push(Completion c) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            items.push_back(std::move(c));
        }
        cv.notify_one();
    }
};

void report(const ProgressCallback& progress, SyncStatus status, std::string message,
            size_t current, size_t total) {
    if (!progress)
        return;
    try {
        progress(SyncProgress{std::move(message), current, total, status});
    } catch (const std::exception& e) {
        spdlog::warn("[SyncEngine] progress callback threw: {}", e.what());
    }
}

std::string parentFolder(const std::string& path) {
    return fs::path(path).parent_path().string();
}

} // namespace

std::string_view syncStatusName(SyncStatus status) {
    switch (status) {
        case SyncStatus::Checking:
            return "checking";
        case SyncStatus::Processing:
            return "processing";
        case SyncStatus::NoChanges:
            return "no_changes";
        case SyncStatus::Complete:
            return "complete";
        case SyncStatus::Error:
            return "error";
    }
    return "error";
}

SyncEngine::SyncEngine(metadata::IndexStore& store, const indexing::FileAnalyzer& analyzer,
                       WorkerPool& pool, FolderLayoutCache& layout, SyncEngineConfig config)
    : store_(store), analyzer_(analyzer), pool_(pool), layout_(layout), config_(config) {
    if (config_.batchSize == 0)
        config_.batchSize = 1;
}

void SyncEngine::addInvalidationHook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    hooks_.push_back(std::move(hook));
}

SyncPlan SyncEngine::diff(const MtimeMap& disk, const MtimeMap& index, bool reanalyzeAll,
                          const std::unordered_set<std::string>& unavailableFolders) {
    SyncPlan plan;
    for (const auto& [path, diskMtime] : disk) {
        auto it = index.find(path);
        if (it == index.end()) {
            plan.toAdd.push_back(path);
        } else if (reanalyzeAll || std::trunc(diskMtime) > std::trunc(it->second)) {
            plan.toUpdate.push_back(path);
        }
    }
    for (const auto& [path, indexMtime] : index) {
        (void)indexMtime;
        if (disk.count(path) != 0)
            continue;
        if (!unavailableFolders.empty() && unavailableFolders.count(parentFolder(path)) != 0)
            continue;
        plan.toDelete.push_back(path);
    }
    std::sort(plan.toAdd.begin(), plan.toAdd.end());
    std::sort(plan.toUpdate.begin(), plan.toUpdate.end());
    std::sort(plan.toDelete.begin(), plan.toDelete.end());
    return plan;
}

Result<MtimeMap> SyncEngine::listMediaFiles(const fs::path& folder) const {
    MtimeMap files;
    std::error_code ec;
    fs::directory_iterator it(folder, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory)
            return files;
        return Error{ErrorCode::IOError, "Cannot list " + folder.string() + ": " + ec.message()};
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Listing " + folder.string() + " failed: " + ec.message()};
        }
        std::error_code fec;
        if (!it->is_regular_file(fec) || !analyzer_.isMediaFile(it->path()))
            continue;
        double mtime = mtimeSeconds(it->path(), fec);
        if (fec) {
            spdlog::debug("[SyncEngine] skipping {}: {}", it->path().string(), fec.message());
            continue;
        }
        files.emplace(it->path().lexically_normal().string(), mtime);
    }
    return files;
}

Result<SyncSummary> SyncEngine::runFullSync(const ProgressCallback& progress, bool reanalyzeAll) {
    report(progress, SyncStatus::Checking, "Scanning folders", 0, 0);

    auto layout = layout_.get(true);
    MtimeMap disk;
    std::unordered_set<std::string> unavailable;
    for (const auto& folder : layout->folders) {
        auto listed = listMediaFiles(folder.path);
        if (!listed) {
            spdlog::warn("[SyncEngine] {}", listed.error().message);
            unavailable.insert(folder.path.string());
            continue;
        }
        auto files = std::move(listed).value();
        disk.insert(files.begin(), files.end());
    }

    auto index = store_.listIndexedMtimes({});
    if (!index) {
        report(progress, SyncStatus::Error, index.error().message, 0, 0);
        return index.error();
    }

    spdlog::info("[SyncEngine] full pass: {} files on disk, {} indexed", disk.size(),
                 index.value().size());
    return reconcile(disk, index.value(), reanalyzeAll, unavailable, progress, true);
}

Result<SyncSummary> SyncEngine::runFolderSync(const fs::path& folder,
                                              const ProgressCallback& progress) {
    std::error_code ec;
    auto absolute = fs::absolute(folder, ec);
    if (ec)
        return Error{ErrorCode::InvalidArgument, "Cannot resolve folder " + folder.string()};
    const auto normal = normalizedFolder(absolute);
    report(progress, SyncStatus::Checking, "Checking for changes", 0, 0);

    auto listed = listMediaFiles(normal);
    if (!listed) {
        spdlog::warn("[SyncEngine] {}", listed.error().message);
        report(progress, SyncStatus::Error, listed.error().message, 0, 0);
        return SyncSummary{};
    }

    auto index = store_.listIndexedMtimes({normal.string(), false});
    if (!index) {
        report(progress, SyncStatus::Error, index.error().message, 0, 0);
        return index.error();
    }
    return reconcile(listed.value(), index.value(), false, {}, progress, false);
}

Result<SyncSummary> SyncEngine::reconcile(const MtimeMap& disk, const MtimeMap& index,
                                          bool reanalyzeAll,
                                          const std::unordered_set<std::string>& unavailableFolders,
                                          const ProgressCallback& progress, bool fullPass) {
    const auto started = std::chrono::steady_clock::now();
    SyncSummary summary;

    auto plan = diff(disk, index, reanalyzeAll, unavailableFolders);
    if (plan.empty()) {
        spdlog::info("[SyncEngine] no changes");
        report(progress, SyncStatus::NoChanges, "Folder is up-to-date", 0, 0);
        return summary;
    }

    spdlog::info("[SyncEngine] {} to add, {} to update, {} to delete", plan.toAdd.size(),
                 plan.toUpdate.size(), plan.toDelete.size());

    std::vector<std::string> work;
    work.reserve(plan.toAdd.size() + plan.toUpdate.size());
    work.insert(work.end(), plan.toAdd.begin(), plan.toAdd.end());
    work.insert(work.end(), plan.toUpdate.begin(), plan.toUpdate.end());

    auto entries = dispatch(work, progress, summary);

    auto committed = commit(entries, plan.toDelete);
    if (!committed) {
        report(progress, SyncStatus::Error, committed.error().message, summary.processed,
               work.size());
        return committed.error();
    }

    std::unordered_set<std::string> added(plan.toAdd.begin(), plan.toAdd.end());
    for (const auto& e : entries) {
        if (added.count(e.file.path) != 0)
            ++summary.added;
        else
            ++summary.updated;
    }
    summary.deleted = plan.toDelete.size();

    publish(fullPass);

    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("[SyncEngine] pass done in {}ms: {} processed, {} failed, {} with workflow, "
                 "{} with metadata, {} without, {} samplers, {} deleted",
                 summary.elapsed.count(), summary.processed, summary.failed, summary.withWorkflow,
                 summary.withMetadata, summary.withoutMetadata, summary.totalSamplers,
                 summary.deleted);
    for (const auto& [path, reason] : summary.failures)
        spdlog::warn("[SyncEngine] failed: {}: {}", path, reason);

    report(progress, SyncStatus::Complete, "Sync complete", work.size(), work.size());
    return summary;
}

std::vector<metadata::IndexEntry> SyncEngine::dispatch(const std::vector<std::string>& paths,
                                                       const ProgressCallback& progress,
                                                       SyncSummary& summary) {
    std::vector<metadata::IndexEntry> entries;
    if (paths.empty())
        return entries;
    entries.reserve(paths.size());

    auto recordFailure = [&](const std::string& path, const std::string& reason) {
        ++summary.failed;
        spdlog::debug("[SyncEngine] {} failed: {}", path, reason);
        if (summary.failures.size() < config_.maxReportedFailures)
            summary.failures.emplace_back(path, reason);
    };

    if (pool_.stopped()) {
        for (const auto& p : paths)
            recordFailure(p, "worker pool stopped");
        return entries;
    }

    auto queue = std::make_shared<CompletionQueue>();
    const indexing::FileAnalyzer* analyzer = &analyzer_;
    for (const auto& path : paths) {
        boost::asio::post(pool_.executor(), [queue, analyzer, path]() {
            try {
                queue->push(Completion{path, analyzer->analyze(path)});
            } catch (const std::exception& e) {
                queue->push(Completion{path, Error{ErrorCode::InternalError, e.what()}});
            }
        });
    }

    size_t received = 0;
    const size_t total = paths.size();
    while (received < total) {
        std::deque<Completion> ready;
        {
            std::unique_lock<std::mutex> lock(queue->mutex);
            queue->cv.wait_for(lock, std::chrono::milliseconds(100),
                               [&] { return !queue->items.empty(); });
            ready.swap(queue->items);
        }
        if (ready.empty() && pool_.stopped()) {
            spdlog::warn("[SyncEngine] worker pool stopped with {} files outstanding",
                         total - received);
            summary.failed += total - received;
            break;
        }
        for (auto& c : ready) {
            ++received;
            ++summary.processed;
            if (!c.result) {
                recordFailure(c.path, c.result.error().message);
            } else {
                auto entry = std::move(c.result).value();
                if (entry.file.hasWorkflow)
                    ++summary.withWorkflow;
                if (!entry.samplers.empty()) {
                    ++summary.withMetadata;
                    summary.totalSamplers += entry.samplers.size();
                } else {
                    ++summary.withoutMetadata;
                }
                entries.push_back(std::move(entry));
            }
            report(progress, SyncStatus::Processing,
                   "Processing: " + fs::path(c.path).filename().string(), received, total);
        }
    }
    return entries;
}

Result<void> SyncEngine::commit(const std::vector<metadata::IndexEntry>& entries,
                                const std::vector<std::string>& toDelete) {
    std::lock_guard<std::mutex> lock(commitMutex_);

    for (size_t start = 0; start < entries.size(); start += config_.batchSize) {
        auto end = std::min(entries.size(), start + config_.batchSize);
        std::vector<metadata::IndexEntry> batch(entries.begin() + static_cast<std::ptrdiff_t>(start),
                                                entries.begin() + static_cast<std::ptrdiff_t>(end));
        auto result = store_.commitBatch(batch);
        if (!result) {
            spdlog::error("[SyncEngine] batch commit failed: {}", result.error().message);
            return result;
        }
    }

    if (!toDelete.empty()) {
        auto deleted = store_.deleteByPath(toDelete);
        if (!deleted) {
            spdlog::error("[SyncEngine] delete failed: {}", deleted.error().message);
            return deleted.error();
        }
    }
    return {};
}

void SyncEngine::publish(bool fullPass) {
    if (fullPass)
        layout_.invalidate();
    std::vector<std::function<void()>> hooks;
    {
        std::lock_guard<std::mutex> lock(hooksMutex_);
        hooks = hooks_;
    }
    for (auto& hook : hooks) {
        try {
            hook();
        } catch (const std::exception& e) {
            spdlog::warn("[SyncEngine] invalidation hook threw: {}", e.what());
        }
    }
}

} // namespace mediadex::sync
