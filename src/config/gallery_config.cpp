#include <spdlog/spdlog.h>
#include <charconv>
#include <mediadex/config/config_helpers.h>
#include <mediadex/config/gallery_config.h>

namespace mediadex::config {

namespace {

// Resolves one key: env variable, then config file
class ValueSource {
public:
    explicit ValueSource(std::filesystem::path configPath) : configPath_(std::move(configPath)) {}

    std::string get(const char* envName, const std::string& section,
                    const std::string& key) const {
        if (auto env = env_value(envName)) {
            return *env;
        }
        if (configPath_.empty()) {
            return {};
        }
        return parse_config_value(configPath_, section, key);
    }

private:
    std::filesystem::path configPath_;
};

template <typename T>
void assignNumber(T& target, const std::string& raw, const char* name, T minimum) {
    if (raw.empty()) {
        return;
    }
    T value{};
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size() || value < minimum) {
        spdlog::warn("[Config] invalid value '{}' for {}, keeping {}", raw, name, target);
        return;
    }
    target = value;
}

void assignBool(bool& target, std::string raw) {
    trim(raw);
    if (raw.empty()) {
        return;
    }
    std::transform(raw.begin(), raw.end(), raw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    target = raw == "1" || raw == "true" || raw == "yes" || raw == "on";
}

void assignList(std::vector<std::string>& target, const std::string& raw) {
    if (raw.empty()) {
        return;
    }
    auto items = parse_string_list(raw);
    for (auto& item : items) {
        std::transform(item.begin(), item.end(), item.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (item.front() != '.') {
            item.insert(item.begin(), '.');
        }
    }
    target = std::move(items);
}

} // namespace

Result<GalleryConfig> loadGalleryConfig(const std::string& overridePath) {
    GalleryConfig cfg;

    auto configPath = get_config_path(overridePath);
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        if (!overridePath.empty()) {
            return Error{ErrorCode::FileNotFound, "Config file not found: " + configPath.string()};
        }
        spdlog::debug("[Config] no config file at {}, using environment and defaults",
                      configPath.string());
        configPath.clear();
    }
    ValueSource src(configPath);

    // [gallery]
    if (auto v = src.get("MEDIADEX_OUTPUT_PATH", "gallery", "output_path"); !v.empty()) {
        cfg.outputPath = expand_tilde(v);
    }
    if (auto v = src.get("MEDIADEX_INPUT_PATH", "gallery", "input_path"); !v.empty()) {
        cfg.inputPath = expand_tilde(v);
    }
    if (auto v = src.get("MEDIADEX_WORKFLOW_FOLDER", "gallery", "workflow_folder"); !v.empty()) {
        cfg.workflowFolder = v;
    }

    if (cfg.outputPath.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "No output path configured (MEDIADEX_OUTPUT_PATH or [gallery] output_path)"};
    }
    cfg.outputPath = std::filesystem::absolute(cfg.outputPath, ec).lexically_normal();
    if (ec || !std::filesystem::is_directory(cfg.outputPath, ec)) {
        return Error{ErrorCode::InvalidArgument,
                     "Output path is not a directory: " + cfg.outputPath.string()};
    }
    if (!cfg.inputPath.empty()) {
        cfg.inputPath = std::filesystem::absolute(cfg.inputPath, ec).lexically_normal();
    }

    // [sync]
    assignNumber(cfg.batchSize, src.get("MEDIADEX_BATCH_SIZE", "sync", "batch_size"),
                 "sync.batch_size", size_t{1});
    assignNumber(cfg.maxWorkers, src.get("MEDIADEX_MAX_WORKERS", "sync", "max_workers"),
                 "sync.max_workers", size_t{0});
    cfg.maxWorkers = std::max<size_t>(cfg.maxWorkers, 1);
    assignNumber(cfg.pageSize, src.get("MEDIADEX_PAGE_SIZE", "sync", "page_size"),
                 "sync.page_size", size_t{1});
    assignBool(cfg.debugExtraction,
               src.get("MEDIADEX_DEBUG_EXTRACTION", "sync", "debug_extraction"));
    if (auto v = src.get("MEDIADEX_DEBUG_DIR", "sync", "debug_dir"); !v.empty()) {
        cfg.debugDir = expand_tilde(v);
    } else {
        cfg.debugDir = cfg.outputPath / "workflow_debug";
    }

    // [media]
    assignList(cfg.videoExtensions, src.get("MEDIADEX_VIDEO_EXTENSIONS", "media", "video_extensions"));
    assignList(cfg.imageExtensions, src.get("MEDIADEX_IMAGE_EXTENSIONS", "media", "image_extensions"));
    assignList(cfg.animatedExtensions,
               src.get("MEDIADEX_ANIMATED_EXTENSIONS", "media", "animated_extensions"));
    assignList(cfg.audioExtensions, src.get("MEDIADEX_AUDIO_EXTENSIONS", "media", "audio_extensions"));
    assignNumber(cfg.thumbnailWidth, src.get("MEDIADEX_THUMBNAIL_WIDTH", "media", "thumbnail_width"),
                 "media.thumbnail_width", 1);
    assignNumber(cfg.webpAnimatedFps,
                 src.get("MEDIADEX_WEBP_ANIMATED_FPS", "media", "webp_animated_fps"),
                 "media.webp_animated_fps", 1);

    // [cache]
    assignNumber(cfg.filterOptionsCacheSize,
                 src.get("MEDIADEX_FILTER_OPTIONS_SIZE", "cache", "filter_options_size"),
                 "cache.filter_options_size", size_t{1});
    int64_t ttl = cfg.filterOptionsTtl.count();
    assignNumber(ttl,
                 src.get("MEDIADEX_FILTER_OPTIONS_TTL", "cache", "filter_options_ttl_seconds"),
                 "cache.filter_options_ttl_seconds", int64_t{1});
    cfg.filterOptionsTtl = std::chrono::seconds(ttl);
    assignNumber(cfg.timingLogSize, src.get("MEDIADEX_TIMING_LOG_SIZE", "cache", "timing_log_size"),
                 "cache.timing_log_size", size_t{1});
    ttl = cfg.timingLogTtl.count();
    assignNumber(ttl, src.get("MEDIADEX_TIMING_LOG_TTL", "cache", "timing_log_ttl_seconds"),
                 "cache.timing_log_ttl_seconds", int64_t{1});
    cfg.timingLogTtl = std::chrono::seconds(ttl);

    // [storage]
    cfg.dataDir = resolve_data_dir_from_config(configPath);
    if (auto v = src.get("MEDIADEX_THUMBNAIL_FOLDER", "storage", "thumbnail_folder"); !v.empty()) {
        cfg.thumbnailFolder = v;
    }
    if (auto v = src.get("MEDIADEX_DATABASE_FOLDER", "storage", "database_folder"); !v.empty()) {
        cfg.databaseFolder = v;
    }
    if (auto v = src.get("MEDIADEX_DATABASE_FILE", "storage", "database_file"); !v.empty()) {
        cfg.databaseFile = v;
    }

    // [logging]
    if (auto v = src.get("MEDIADEX_LOG_LEVEL", "logging", "level"); !v.empty()) {
        cfg.logging.level = v;
    }
    if (auto v = src.get("MEDIADEX_LOG_FILE", "logging", "file"); !v.empty()) {
        cfg.logging.file = expand_tilde(v);
    } else {
        cfg.logging.file = cfg.dataDir / "logs" / "mediadex.log";
    }

    spdlog::debug("[Config] output={} data={} workers={} batch={}", cfg.outputPath.string(),
                  cfg.dataDir.string(), cfg.maxWorkers, cfg.batchSize);
    return cfg;
}

} // namespace mediadex::config
