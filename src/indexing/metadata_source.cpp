#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <mediadex/core/file_time.h>
#include <mediadex/indexing/metadata_source.h>
#include <mediadex/media/image_info.h>

namespace mediadex::indexing {

using json = nlohmann::json;

namespace {

constexpr std::array<std::string_view, 4> kPayloadKeys = {"workflow", "Workflow", "prompt",
                                                          "Prompt"};

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool truthy(const json& value) {
    if (value.is_null())
        return false;
    if (value.is_object() || value.is_array() || value.is_string())
        return !value.empty();
    if (value.is_boolean())
        return value.get<bool>();
    if (value.is_number())
        return value.get<double>() != 0.0;
    return true;
}

std::string_view trimLeft(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    return s;
}

} // namespace

EmbeddedMetadataSource::EmbeddedMetadataSource(Options options,
                                               std::shared_ptr<const IMediaProbe> probe)
    : options_(std::move(options)), probe_(std::move(probe)) {
    for (auto& ext : options_.videoExtensions)
        ext = lowercase(ext);
}

std::optional<std::string> EmbeddedMetadataSource::validatePayload(std::string_view text) {
    auto root = json::parse(text.begin(), text.end(), nullptr, false);
    if (root.is_discarded() || !root.is_object())
        return std::nullopt;

    const json* target = &root;
    for (auto key : kPayloadKeys) {
        auto it = root.find(key);
        if (it != root.end() && truthy(*it)) {
            target = &*it;
            break;
        }
    }

    if (target->is_object()) {
        auto nodes = target->find("nodes");
        if (nodes != target->end() && nodes->is_array())
            return target->dump();
        if (!target->empty())
            return std::string(text);
    }
    return std::nullopt;
}

std::optional<std::string> EmbeddedMetadataSource::scanForJsonObject(std::string_view bytes) {
    auto first = bytes.find('{');
    if (first == std::string_view::npos)
        return std::nullopt;

    int depth = 0;
    for (size_t i = first; i < bytes.size(); ++i) {
        if (bytes[i] == '{') {
            ++depth;
        } else if (bytes[i] == '}') {
            if (--depth == 0) {
                auto candidate = bytes.substr(first, i - first + 1);
                if (!json::accept(candidate.begin(), candidate.end()))
                    return std::nullopt;
                return std::string(candidate);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> EmbeddedMetadataSource::fromPngChunks(std::string_view bytes) {
    auto chunks = media::parsePngTextChunks(bytes);
    for (auto key : kPayloadKeys) {
        for (const auto& [keyword, text] : chunks) {
            if (keyword != key || text.empty())
                continue;
            if (auto payload = validatePayload(text))
                return payload;
        }
    }
    return std::nullopt;
}

std::optional<std::string>
EmbeddedMetadataSource::fromSidecar(const std::filesystem::path& file) const {
    if (options_.sidecarDir.empty())
        return std::nullopt;

    std::error_code ec;
    if (!std::filesystem::is_directory(options_.sidecarDir, ec))
        return std::nullopt;

    const std::string base = file.filename().string();
    std::optional<std::filesystem::path> newest;
    double newestTime = 0.0;

    std::filesystem::directory_iterator it(options_.sidecarDir, ec);
    if (ec) {
        spdlog::debug("[MetadataSource] cannot list {}: {}", options_.sidecarDir.string(),
                      ec.message());
        return std::nullopt;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        const auto name = it->path().filename().string();
        if (name.size() < base.size() + 5 || name.compare(0, base.size(), base) != 0 ||
            it->path().extension() != ".json")
            continue;
        std::error_code tec;
        double t = mtimeSeconds(it->path(), tec);
        if (tec)
            continue;
        if (!newest || t > newestTime) {
            newest = it->path();
            newestTime = t;
        }
    }
    if (!newest)
        return std::nullopt;

    auto text = media::readFileBytes(*newest);
    if (!text) {
        spdlog::debug("[MetadataSource] unreadable sidecar {}: {}", newest->string(),
                      text.error().message);
        return std::nullopt;
    }
    return validatePayload(text.value());
}

bool EmbeddedMetadataSource::isVideo(const std::filesystem::path& file) const {
    auto ext = lowercase(file.extension().string());
    return std::find(options_.videoExtensions.begin(), options_.videoExtensions.end(), ext) !=
           options_.videoExtensions.end();
}

std::optional<std::string> EmbeddedMetadataSource::read(const std::filesystem::path& file) const {
    const bool video = isVideo(file);

    if (video && probe_) {
        if (auto probed = probe_->probe(file)) {
            for (const auto& [tag, value] : probed->tags) {
                if (trimLeft(value).substr(0, 1) != "{")
                    continue;
                if (auto payload = validatePayload(value))
                    return payload;
            }
        }
    }

    auto bytes = media::readFileBytes(file, options_.maxScanBytes);
    if (bytes) {
        if (!video && media::sniffFormat(bytes.value()) == media::ImageFormat::Png) {
            if (auto payload = fromPngChunks(bytes.value()))
                return payload;
        }
        if (auto candidate = scanForJsonObject(bytes.value())) {
            if (auto payload = validatePayload(*candidate))
                return payload;
        }
    } else {
        spdlog::debug("[MetadataSource] cannot read {}: {}", file.string(),
                      bytes.error().message);
    }

    return fromSidecar(file);
}

} // namespace mediadex::indexing
