#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <mediadex/core/types.h>
#include <mediadex/extraction/sampler_record.h>
#include <mediadex/metadata/connection_pool.h>
#include <mediadex/metadata/index_types.h>

namespace mediadex::metadata {

/**
 * @brief Persisted gallery index: file rows and their sampler rows
 *
 * Reads go through the connection pool and may run concurrently with a
 * write. Writes are serialized by the store. Every operation returns
 * ErrorCode::NotInitialized until initialize() succeeded.
 */
class IndexStore {
public:
    explicit IndexStore(std::string dbPath, const ConnectionPoolConfig& poolConfig = {});
    ~IndexStore();

    IndexStore(const IndexStore&) = delete;
    IndexStore& operator=(const IndexStore&) = delete;

    /**
     * @brief Open the database and apply pending schema migrations
     */
    Result<void> initialize();
    void close();

    [[nodiscard]] bool isInitialized() const { return initialized_.load(); }

    /// True when migrations ran on open, so stored rows should be re-analyzed
    [[nodiscard]] bool needsRescan() const { return needsRescan_.load(); }
    void clearRescanFlag() { needsRescan_ = false; }

    Result<int> schemaVersion();

    // Writes
    Result<void> upsertFiles(const std::vector<FileRecord>& files);
    Result<void> replaceSamplers(const FileId& fileId, const extraction::SamplerRecords& samplers);

    /**
     * @brief Upsert files and replace their samplers in one transaction
     */
    Result<void> commitBatch(const std::vector<IndexEntry>& entries);

    Result<int64_t> deleteByPath(const std::vector<std::string>& paths);
    Result<int64_t> deleteById(const std::vector<FileId>& ids);
    Result<int64_t> setFavorite(const std::vector<FileId>& ids, bool favorite);

    /**
     * @brief Point a row at a new path; the id follows and samplers cascade
     */
    Result<FileRecord> relocate(const FileId& oldId, const std::string& newPath);

    // Reads
    Result<int64_t> countMatching(const FileQuery& query);
    Result<Page> queryPage(const FileQuery& query, const PageRequest& page);
    Result<std::unordered_map<std::string, double>> listIndexedMtimes(const FolderScope& scope);
    Result<std::optional<FileRecord>> getFile(const FileId& id);
    Result<extraction::SamplerRecords> getSamplers(const FileId& id);
    Result<FilterOptions> filterOptions(const FolderScope& scope = {});
    Result<IndexStats> stats();

    [[nodiscard]] const std::string& path() const { return dbPath_; }

private:
    Result<void> requireInitialized() const;

    template <typename Func> auto withRead(Func&& func) -> std::invoke_result_t<Func, Database&> {
        if (auto ready = requireInitialized(); !ready)
            return ready.error();
        return pool_->withConnection(std::forward<Func>(func));
    }

    template <typename Func> auto withWrite(Func&& func) -> std::invoke_result_t<Func, Database&> {
        if (auto ready = requireInitialized(); !ready)
            return ready.error();
        std::lock_guard<std::mutex> lock(writeMutex_);
        return pool_->withConnection(std::forward<Func>(func));
    }

    std::string dbPath_;
    ConnectionPoolConfig poolConfig_;
    std::unique_ptr<ConnectionPool> pool_;
    std::mutex writeMutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> needsRescan_{false};
};

} // namespace mediadex::metadata
