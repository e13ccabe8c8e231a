#include <spdlog/spdlog.h>
#include <array>
#include <mediadex/indexing/thumbnail_producer.h>

namespace mediadex::indexing {

std::optional<std::filesystem::path>
CachedThumbnailLocator::produce(const std::filesystem::path& file, const std::string& contentKey,
                                metadata::MediaType type) {
    if (type == metadata::MediaType::Audio || type == metadata::MediaType::Unknown)
        return std::nullopt;

    static constexpr std::array<const char*, 4> kExtensions = {".webp", ".jpg", ".jpeg", ".png"};
    for (const char* ext : kExtensions) {
        auto candidate = cacheDir_ / (contentKey + ext);
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec))
            return candidate;
    }
    spdlog::trace("[Thumbnail] no cached preview for {}", file.string());
    return std::nullopt;
}

} // namespace mediadex::indexing
