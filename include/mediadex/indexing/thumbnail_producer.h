#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <mediadex/metadata/index_types.h>

namespace mediadex::indexing {

/**
 * @brief Produces or locates the cached preview of a media file
 *
 * Called from worker threads; implementations must be thread-safe.
 */
class IThumbnailProducer {
public:
    virtual ~IThumbnailProducer() = default;

    /**
     * @param file media file
     * @param contentKey thumbnail correlation key (path and mtime digest)
     * @return cached preview location, or nullopt when none is available
     */
    virtual std::optional<std::filesystem::path>
    produce(const std::filesystem::path& file, const std::string& contentKey,
            metadata::MediaType type) = 0;
};

/**
 * @brief Finds previews rendered by an external generator
 *
 * Looks for `<cacheDir>/<contentKey>.{webp,jpg,jpeg,png}`.
 */
class CachedThumbnailLocator final : public IThumbnailProducer {
public:
    explicit CachedThumbnailLocator(std::filesystem::path cacheDir)
        : cacheDir_(std::move(cacheDir)) {}

    std::optional<std::filesystem::path> produce(const std::filesystem::path& file,
                                                 const std::string& contentKey,
                                                 metadata::MediaType type) override;

    const std::filesystem::path& cacheDir() const { return cacheDir_; }

private:
    std::filesystem::path cacheDir_;
};

} // namespace mediadex::indexing
