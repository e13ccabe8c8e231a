#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <mediadex/core/types.h>

namespace mediadex::config {

struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file; ///< empty logs to stderr only
};

/**
 * @brief Resolved gallery settings
 *
 * Each key comes from its MEDIADEX_* variable, the config file, or the
 * built-in default, in that order.
 */
struct GalleryConfig {
    // [gallery]
    std::filesystem::path outputPath;
    std::filesystem::path inputPath;
    std::string workflowFolder = "workflow_logs_success";

    // [sync]
    size_t batchSize = 500;
    size_t maxWorkers = 4;
    size_t pageSize = 100;
    bool debugExtraction = false;
    std::filesystem::path debugDir;

    // [media]
    std::vector<std::string> videoExtensions{".mp4", ".mkv", ".webm", ".mov", ".avi"};
    std::vector<std::string> imageExtensions{".png", ".jpg", ".jpeg"};
    std::vector<std::string> animatedExtensions{".gif", ".webp"};
    std::vector<std::string> audioExtensions{".mp3", ".wav", ".ogg", ".flac"};
    int thumbnailWidth = 300;
    int webpAnimatedFps = 16;

    // [cache]
    size_t filterOptionsCacheSize = 50;
    std::chrono::seconds filterOptionsTtl{300};
    size_t timingLogSize = 500;
    std::chrono::seconds timingLogTtl{600};

    // [storage]
    std::filesystem::path dataDir;
    std::string thumbnailFolder = ".thumbnails_cache";
    std::string databaseFolder = ".sqlite_cache";
    std::string databaseFile = "gallery_cache.sqlite";

    LoggingConfig logging;

    std::filesystem::path databasePath() const { return dataDir / databaseFolder / databaseFile; }
    std::filesystem::path thumbnailDir() const { return dataDir / thumbnailFolder; }

    /// Sidecar workflow logs: `<input>/<workflow folder>`, empty when no input path
    std::filesystem::path sidecarDir() const {
        return inputPath.empty() ? std::filesystem::path{} : inputPath / workflowFolder;
    }
};

/**
 * @brief Load configuration from env, the config file and defaults
 *
 * @param overridePath explicit config file; otherwise MEDIADEX_CONFIG or the XDG location
 * @return InvalidArgument when the output path is missing or not a directory
 */
Result<GalleryConfig> loadGalleryConfig(const std::string& overridePath = "");

} // namespace mediadex::config
