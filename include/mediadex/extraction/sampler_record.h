#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mediadex::extraction {

/**
 * @brief Generation parameters of one sampling pass
 *
 * `samplerIndex` is the 0-based position within the owning file and is
 * unique per file.
 */
struct SamplerRecord {
    int samplerIndex = 0;
    std::optional<std::string> modelName;
    std::optional<std::string> samplerName;
    std::optional<std::string> scheduler;
    std::optional<std::string> positivePrompt;
    std::optional<std::string> negativePrompt;
    std::optional<int64_t> width;
    std::optional<int64_t> height;
    std::optional<double> cfg;
    std::optional<int64_t> steps;

    bool operator==(const SamplerRecord&) const = default;
};

using SamplerRecords = std::vector<SamplerRecord>;

} // namespace mediadex::extraction
