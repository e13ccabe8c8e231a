#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <mediadex/extraction/debug_sink.h>
#include <mediadex/extraction/sampler_record.h>

namespace mediadex::extraction {

/// Where the graph was found inside a metadata payload
struct DetectedPayload {
    std::string format = "unknown";
    const nlohmann::json* payload = nullptr; ///< points into the inspected document
};

/**
 * @brief Entry point turning embedded metadata bytes into sampler records
 *
 * Never throws: malformed or unrecognized payloads yield an empty list.
 */
class MetadataService {
public:
    explicit MetadataService(std::shared_ptr<IDebugSink> debugSink = nullptr);

    /**
     * @param rawBytes embedded metadata as found in the media file
     * @param sourceFile media file, used for the pixel-size fallback and debug artifact names
     */
    SamplerRecords extract(std::string_view rawBytes,
                           const std::filesystem::path& sourceFile = {}) const;

    static DetectedPayload detect(const nlohmann::json& root);

private:
    void debug(const std::filesystem::path& file, std::string_view stage, std::string_view info,
               const nlohmann::json& data) const;

    std::shared_ptr<IDebugSink> debugSink_;
};

} // namespace mediadex::extraction
