#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>
#include <mediadex/core/file_time.h>
#include <mediadex/crypto/hasher.h>
#include <mediadex/indexing/file_analyzer.h>
#include <mediadex/media/image_info.h>

namespace mediadex::indexing {

using metadata::MediaType;

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

std::string trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
        return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(begin, end - begin + 1));
}

// Byte offset after `count` UTF-8 code points, or npos when the text is shorter
size_t utf8Offset(std::string_view text, size_t count) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (seen == count)
                return i;
            ++seen;
        }
    }
    return std::string_view::npos;
}

std::vector<std::string> lowercased(std::vector<std::string> list) {
    for (auto& s : list)
        s = lowercase(s);
    return list;
}

} // namespace

FileAnalyzer::FileAnalyzer(AnalyzerOptions options, AnalyzerServices services)
    : options_(std::move(options)), services_(std::move(services)) {
    options_.videoExtensions = lowercased(std::move(options_.videoExtensions));
    options_.imageExtensions = lowercased(std::move(options_.imageExtensions));
    options_.animatedExtensions = lowercased(std::move(options_.animatedExtensions));
    options_.audioExtensions = lowercased(std::move(options_.audioExtensions));
    if (options_.webpAnimatedFps <= 0)
        options_.webpAnimatedFps = 16;
}

MediaType FileAnalyzer::classify(const std::filesystem::path& file) const {
    const auto ext = lowercase(file.extension().string());
    if (contains(options_.imageExtensions, ext))
        return MediaType::Image;
    if (contains(options_.animatedExtensions, ext))
        return MediaType::AnimatedImage;
    if (contains(options_.videoExtensions, ext))
        return MediaType::Video;
    if (contains(options_.audioExtensions, ext))
        return MediaType::Audio;
    return MediaType::Unknown;
}

bool FileAnalyzer::isMediaFile(const std::filesystem::path& file) const {
    return classify(file) != MediaType::Unknown;
}

std::string FileAnalyzer::promptPreview(const extraction::SamplerRecords& samplers,
                                        size_t maxChars) {
    if (samplers.empty() || !samplers.front().positivePrompt)
        return {};
    auto text = trim(*samplers.front().positivePrompt);
    auto cut = utf8Offset(text, maxChars);
    if (cut == std::string::npos)
        return text;
    return text.substr(0, cut) + "...";
}

std::string FileAnalyzer::samplerNames(const extraction::SamplerRecords& samplers) {
    std::set<std::string> names;
    for (const auto& s : samplers) {
        if (s.samplerName && !s.samplerName->empty())
            names.insert(*s.samplerName);
    }
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty())
            joined += ", ";
        joined += name;
    }
    return joined;
}

void FileAnalyzer::fillMediaDetails(const std::filesystem::path& file,
                                    metadata::FileRecord& record) const {
    const auto ext = lowercase(file.extension().string());
    double durationSeconds = 0.0;

    if (record.type == MediaType::Image || record.type == MediaType::AnimatedImage) {
        // Animation timing walks the frames; still images only need their header
        auto bytes = media::readFileBytes(file, record.type == MediaType::AnimatedImage
                                                    ? options_.maxAnimationBytes
                                                    : size_t{1} << 20);
        if (!bytes) {
            spdlog::debug("[FileAnalyzer] cannot read {}: {}", file.string(),
                          bytes.error().message);
            return;
        }
        const std::string& data = bytes.value();

        if (auto size = media::parseImageSize(data))
            record.dimensions = fmt::format("{}x{}", size->width, size->height);

        if (record.type == MediaType::AnimatedImage) {
            auto format = media::sniffFormat(data);
            if (format == media::ImageFormat::WebP) {
                auto anim = media::parseWebpAnimation(data);
                if (!anim || !anim->animated()) {
                    if (ext == ".webp")
                        record.type = MediaType::Image;
                } else {
                    durationSeconds = static_cast<double>(anim->frameCount) /
                                      static_cast<double>(options_.webpAnimatedFps);
                }
            } else if (format == media::ImageFormat::Gif) {
                auto anim = media::parseGifAnimation(data);
                if (anim && anim->animated())
                    durationSeconds = std::chrono::duration<double>(anim->duration).count();
            } else if (ext == ".webp") {
                record.type = MediaType::Image;
            }
        }
    } else if (record.type == MediaType::Video && services_.probe) {
        if (auto probed = services_.probe->probe(file)) {
            if (probed->size)
                record.dimensions = fmt::format("{}x{}", probed->size->width, probed->size->height);
            durationSeconds = probed->durationSeconds.value_or(0.0);
        }
    }

    if (durationSeconds > 0.0)
        record.duration = media::formatDuration(durationSeconds);
}

Result<metadata::IndexEntry> FileAnalyzer::analyze(const std::filesystem::path& file) const {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(file, ec).lexically_normal();
    if (ec)
        return Error{ErrorCode::InvalidArgument, "Cannot resolve " + file.string()};
    if (!std::filesystem::is_regular_file(absolute, ec))
        return Error{ErrorCode::FileNotFound, "Not a regular file: " + absolute.string()};

    double mtime = mtimeSeconds(absolute, ec);
    if (ec)
        return Error{ErrorCode::IOError, "Cannot stat " + absolute.string() + ": " + ec.message()};

    metadata::IndexEntry entry;
    auto& record = entry.file;
    record.path = absolute.string();
    record.id = crypto::fileIdForPath(record.path);
    record.name = absolute.filename().string();
    record.folder = absolute.parent_path().string();
    record.mtime = mtime;
    record.type = classify(absolute);

    fillMediaDetails(absolute, record);

    std::optional<std::string> raw;
    if (services_.metadataSource)
        raw = services_.metadataSource->read(absolute);
    record.hasWorkflow = raw.has_value();

    if (raw && services_.metadataService)
        entry.samplers = services_.metadataService->extract(*raw, absolute);

    record.promptPreview = promptPreview(entry.samplers, options_.promptPreviewLength);
    record.samplerNames = samplerNames(entry.samplers);

    if (services_.thumbnails) {
        auto thumb = services_.thumbnails->produce(
            absolute, crypto::thumbnailKey(record.path, mtime), record.type);
        if (thumb)
            record.thumbnailPath = thumb->string();
    }

    spdlog::trace("[FileAnalyzer] {} -> {} samplers", record.path, entry.samplers.size());
    return entry;
}

} // namespace mediadex::indexing
