#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <mediadex/core/types.h>
#include <mediadex/extraction/metadata_service.h>
#include <mediadex/indexing/media_probe.h>
#include <mediadex/indexing/metadata_source.h>
#include <mediadex/indexing/thumbnail_producer.h>
#include <mediadex/metadata/index_types.h>

namespace mediadex::indexing {

/**
 * @brief Immutable per-run settings handed to every analysis task
 */
struct AnalyzerOptions {
    std::vector<std::string> videoExtensions{".mp4", ".mkv", ".webm", ".mov", ".avi"};
    std::vector<std::string> imageExtensions{".png", ".jpg", ".jpeg"};
    std::vector<std::string> animatedExtensions{".gif", ".webp"};
    std::vector<std::string> audioExtensions{".mp3", ".wav", ".ogg", ".flac"};
    int webpAnimatedFps = 16;
    size_t maxAnimationBytes = 64u << 20; ///< frames past this are not counted
    size_t promptPreviewLength = 150;
};

/// Collaborators shared by all analysis tasks
struct AnalyzerServices {
    std::shared_ptr<const IMetadataSource> metadataSource;
    std::shared_ptr<const extraction::MetadataService> metadataService;
    std::shared_ptr<IThumbnailProducer> thumbnails; ///< optional
    std::shared_ptr<const IMediaProbe> probe;       ///< optional
};

/**
 * @brief Turns one media file into its file row and sampler rows
 *
 * Thread-safe; one instance serves all workers.
 */
class FileAnalyzer {
public:
    FileAnalyzer(AnalyzerOptions options, AnalyzerServices services);

    Result<metadata::IndexEntry> analyze(const std::filesystem::path& file) const;

    /// Type from the extension alone (animated WebP needs the file)
    metadata::MediaType classify(const std::filesystem::path& file) const;
    bool isMediaFile(const std::filesystem::path& file) const;

    const AnalyzerOptions& options() const { return options_; }

    static std::string promptPreview(const extraction::SamplerRecords& samplers, size_t maxChars);
    static std::string samplerNames(const extraction::SamplerRecords& samplers);

private:
    void fillMediaDetails(const std::filesystem::path& file, metadata::FileRecord& record) const;

    AnalyzerOptions options_;
    AnalyzerServices services_;
};

} // namespace mediadex::indexing
