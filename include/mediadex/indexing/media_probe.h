#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <mediadex/media/image_info.h>

namespace mediadex::indexing {

/// Container-level facts about a video or audio file
struct ProbeResult {
    std::optional<media::ImageSize> size;
    std::optional<double> durationSeconds;
    std::vector<std::pair<std::string, std::string>> tags; ///< container metadata tags
};

/**
 * @brief Reads container information the built-in header parsers do not cover
 */
class IMediaProbe {
public:
    virtual ~IMediaProbe() = default;
    virtual std::optional<ProbeResult> probe(const std::filesystem::path& file) const = 0;
};

} // namespace mediadex::indexing
