#include <spdlog/spdlog.h>
#include <algorithm>
#include <mediadex/app/gallery_context.h>
#include <mediadex/extraction/debug_sink.h>
#include <mediadex/extraction/metadata_service.h>
#include <mediadex/indexing/metadata_source.h>
#include <mediadex/indexing/thumbnail_producer.h>

namespace mediadex::app {

GalleryContext::GalleryContext(config::GalleryConfig config) : config_(std::move(config)) {}

GalleryContext::~GalleryContext() {
    shutdown();
}

Result<std::unique_ptr<GalleryContext>>
GalleryContext::create(const config::GalleryConfig& config) {
    std::unique_ptr<GalleryContext> ctx(new GalleryContext(config));
    const auto& cfg = ctx->config_;

    ctx->store_ = std::make_unique<metadata::IndexStore>(cfg.databasePath().string());
    if (auto init = ctx->store_->initialize(); !init) {
        spdlog::error("[Gallery] index store initialization failed: {}", init.error().message);
        return init.error();
    }

    ctx->pool_ = std::make_unique<sync::WorkerPool>(std::max<size_t>(1, cfg.maxWorkers));
    ctx->layout_ = std::make_unique<sync::FolderLayoutCache>(
        cfg.outputPath, std::vector<std::string>{cfg.thumbnailFolder, cfg.databaseFolder});

    auto debugSink = extraction::makeDebugSink(cfg.debugExtraction ? cfg.debugDir
                                                                   : std::filesystem::path{});
    if (cfg.debugExtraction) {
        spdlog::info("[Gallery] extraction debug output in {}", cfg.debugDir.string());
    }

    indexing::AnalyzerOptions options;
    options.videoExtensions = cfg.videoExtensions;
    options.imageExtensions = cfg.imageExtensions;
    options.animatedExtensions = cfg.animatedExtensions;
    options.audioExtensions = cfg.audioExtensions;
    options.webpAnimatedFps = cfg.webpAnimatedFps;

    indexing::EmbeddedMetadataSource::Options sourceOptions;
    sourceOptions.sidecarDir = cfg.sidecarDir();
    sourceOptions.videoExtensions = cfg.videoExtensions;

    indexing::AnalyzerServices services;
    services.metadataSource = std::make_shared<indexing::EmbeddedMetadataSource>(sourceOptions);
    services.metadataService = std::make_shared<extraction::MetadataService>(debugSink);
    services.thumbnails = std::make_shared<indexing::CachedThumbnailLocator>(cfg.thumbnailDir());
    ctx->analyzer_ = std::make_unique<indexing::FileAnalyzer>(options, services);

    sync::SyncEngineConfig syncConfig;
    syncConfig.batchSize = std::max<size_t>(1, cfg.batchSize);
    ctx->sync_ = std::make_unique<sync::SyncEngine>(*ctx->store_, *ctx->analyzer_, *ctx->pool_,
                                                    *ctx->layout_, syncConfig);

    GalleryServiceConfig serviceConfig;
    serviceConfig.filterOptionsCache = {cfg.filterOptionsCacheSize, cfg.filterOptionsTtl};
    serviceConfig.timingLog = {cfg.timingLogSize, cfg.timingLogTtl};
    ctx->service_ = std::make_unique<GalleryService>(*ctx->store_, *ctx->layout_, serviceConfig);

    auto* service = ctx->service_.get();
    ctx->sync_->addInvalidationHook([service] { service->invalidateCaches(); });

    spdlog::info("[Gallery] ready: output={} database={} workers={}", cfg.outputPath.string(),
                 cfg.databasePath().string(), ctx->pool_->threads());
    return ctx;
}

Result<sync::SyncSummary> GalleryContext::startupSync(const sync::ProgressCallback& progress) {
    const bool reanalyze = store_->needsRescan();
    if (reanalyze) {
        spdlog::info("[Gallery] index schema changed, re-analyzing all files");
    }
    auto summary = sync_->runFullSync(progress, reanalyze);
    if (summary && reanalyze) {
        store_->clearRescanFlag();
    }
    return summary;
}

void GalleryContext::shutdown() {
    if (shutdown_) {
        return;
    }
    shutdown_ = true;
    if (pool_) {
        pool_->stop();
    }
    if (store_) {
        store_->close();
    }
    spdlog::debug("[Gallery] shut down");
}

} // namespace mediadex::app
