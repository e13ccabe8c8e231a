#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mediadex/core/types.h>

namespace mediadex::media {

enum class ImageFormat { Unknown, Png, Jpeg, Gif, WebP };

struct ImageSize {
    int64_t width = 0;
    int64_t height = 0;

    bool operator==(const ImageSize&) const = default;
};

struct AnimationInfo {
    size_t frameCount = 0;
    std::chrono::milliseconds duration{0}; ///< zero when the container has no timing
    bool animated() const { return frameCount > 1; }
};

using TextChunks = std::vector<std::pair<std::string, std::string>>;

/// Identify a container from its leading signature bytes
ImageFormat sniffFormat(std::string_view bytes);

/// Pixel size from PNG, JPEG, GIF or WebP headers
std::optional<ImageSize> parseImageSize(std::string_view bytes);

/// Frame count and summed frame delays; delays of zero count as 100ms
std::optional<AnimationInfo> parseGifAnimation(std::string_view bytes);

/// Frame count of an animated WebP (ANMF chunks); zero frames for still images
std::optional<AnimationInfo> parseWebpAnimation(std::string_view bytes);

/// Uncompressed tEXt and iTXt entries of a PNG, in file order
TextChunks parsePngTextChunks(std::string_view bytes);

/// Read up to `maxBytes` of a file
Result<std::string> readFileBytes(const std::filesystem::path& path,
                                  size_t maxBytes = static_cast<size_t>(-1));

std::optional<ImageSize> probeImageSize(const std::filesystem::path& path);

/// "h:mm:ss" from one hour up, "mm:ss" below, empty for non-positive input
std::string formatDuration(double seconds);

} // namespace mediadex::media
