#include <mediadex/metadata/index_types.h>

namespace mediadex::metadata {

std::string_view mediaTypeName(MediaType type) {
    switch (type) {
        case MediaType::Image:
            return "image";
        case MediaType::AnimatedImage:
            return "animated_image";
        case MediaType::Video:
            return "video";
        case MediaType::Audio:
            return "audio";
        case MediaType::Unknown:
            break;
    }
    return "unknown";
}

MediaType parseMediaType(std::string_view name) {
    if (name == "image")
        return MediaType::Image;
    if (name == "animated_image")
        return MediaType::AnimatedImage;
    if (name == "video")
        return MediaType::Video;
    if (name == "audio")
        return MediaType::Audio;
    return MediaType::Unknown;
}

} // namespace mediadex::metadata
