#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <mediadex/indexing/media_probe.h>

namespace mediadex::indexing {

/**
 * @brief Supplies the raw embedded generation metadata of a media file
 */
class IMetadataSource {
public:
    virtual ~IMetadataSource() = default;

    /// Raw metadata text, or nullopt when the file carries none
    virtual std::optional<std::string> read(const std::filesystem::path& file) const = 0;
};

/**
 * @brief Reads metadata from the file itself, falling back to sidecar logs
 *
 * Order: PNG text chunks, container tags from the probe (videos), a scan of
 * the file bytes for the first balanced JSON object, then the newest
 * `<filename>*.json` in the sidecar directory.
 */
class EmbeddedMetadataSource final : public IMetadataSource {
public:
    struct Options {
        std::filesystem::path sidecarDir; ///< empty disables sidecar lookup
        std::vector<std::string> videoExtensions;
        size_t maxScanBytes = 256u * 1024u * 1024u;
    };

    explicit EmbeddedMetadataSource(Options options,
                                    std::shared_ptr<const IMediaProbe> probe = nullptr);

    std::optional<std::string> read(const std::filesystem::path& file) const override;

    /**
     * @brief Accept a candidate only if it is a usable graph payload
     *
     * A nested `workflow`/`Workflow`/`prompt`/`Prompt` value is unwrapped for
     * the check. Linked graphs are returned unwrapped, other payloads as given.
     */
    static std::optional<std::string> validatePayload(std::string_view text);

    /// First balanced `{...}` span that parses as JSON
    static std::optional<std::string> scanForJsonObject(std::string_view bytes);

    static std::optional<std::string> fromPngChunks(std::string_view bytes);

    std::optional<std::string> fromSidecar(const std::filesystem::path& file) const;

private:
    bool isVideo(const std::filesystem::path& file) const;

    Options options_;
    std::shared_ptr<const IMediaProbe> probe_;
};

} // namespace mediadex::indexing
