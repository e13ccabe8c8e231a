#pragma once

#include <memory>
#include <mediadex/app/gallery_service.h>
#include <mediadex/config/gallery_config.h>
#include <mediadex/core/types.h>
#include <mediadex/indexing/file_analyzer.h>
#include <mediadex/metadata/index_store.h>
#include <mediadex/sync/folder_layout.h>
#include <mediadex/sync/sync_engine.h>
#include <mediadex/sync/worker_pool.h>

namespace mediadex::app {

/**
 * @brief Owns every long-lived component of a gallery
 *
 * Built once per process from a resolved configuration. Members are
 * declared in dependency order so destruction runs in reverse.
 */
class GalleryContext {
public:
    static Result<std::unique_ptr<GalleryContext>> create(const config::GalleryConfig& config);

    ~GalleryContext();

    GalleryContext(const GalleryContext&) = delete;
    GalleryContext& operator=(const GalleryContext&) = delete;

    /// Full pass; re-analyzes everything once after a schema upgrade
    Result<sync::SyncSummary> startupSync(const sync::ProgressCallback& progress = {});

    /// Stop the workers and close the store. Safe to call more than once.
    void shutdown();

    const config::GalleryConfig& config() const { return config_; }
    metadata::IndexStore& store() { return *store_; }
    sync::SyncEngine& syncEngine() { return *sync_; }
    sync::FolderLayoutCache& layout() { return *layout_; }
    GalleryService& service() { return *service_; }
    const indexing::FileAnalyzer& analyzer() const { return *analyzer_; }

private:
    explicit GalleryContext(config::GalleryConfig config);

    config::GalleryConfig config_;
    std::unique_ptr<metadata::IndexStore> store_;
    std::unique_ptr<sync::WorkerPool> pool_;
    std::unique_ptr<sync::FolderLayoutCache> layout_;
    std::unique_ptr<indexing::FileAnalyzer> analyzer_;
    std::unique_ptr<sync::SyncEngine> sync_;
    std::unique_ptr<GalleryService> service_;
    bool shutdown_ = false;
};

} // namespace mediadex::app
