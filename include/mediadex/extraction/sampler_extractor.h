#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <mediadex/extraction/sampler_record.h>
#include <mediadex/graph/graph_document.h>
#include <mediadex/media/image_info.h>

namespace mediadex::extraction {

/// Supplies the media file's own pixel size when the graph does not resolve one
using DimensionFallback = std::function<std::optional<media::ImageSize>()>;

/**
 * @brief Extracts one SamplerRecord per sampling node of a graph
 *
 * Each field is resolved independently, so a failure in one leaves the
 * others intact. A sampler whose orchestration fails is dropped.
 */
class SamplerExtractor {
public:
    explicit SamplerExtractor(DimensionFallback fallback = {}) : fallback_(std::move(fallback)) {}

    SamplerRecords extractAll(const graph::GraphDocument& doc) const;

    /// Sampler nodes in processing order: numeric ids ascending, then other ids
    static std::vector<const graph::Node*> findSamplerNodes(const graph::GraphDocument& doc);

    /// Path basename with its last extension removed
    static std::string modelBasename(std::string_view value);

    static std::optional<double> toFloat(const nlohmann::json& value);
    static std::optional<int64_t> toInt(const nlohmann::json& value);

private:
    SamplerRecord extractOne(const graph::GraphDocument& doc, const graph::Node& sampler) const;

    DimensionFallback fallback_;
};

/// Dimension fallback reading the pixel size of raster files
DimensionFallback fileDimensionFallback(const std::filesystem::path& file);

} // namespace mediadex::extraction
