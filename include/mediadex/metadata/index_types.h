#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mediadex/core/types.h>
#include <mediadex/extraction/sampler_record.h>

namespace mediadex::metadata {

enum class MediaType { Image, AnimatedImage, Video, Audio, Unknown };

std::string_view mediaTypeName(MediaType type);
MediaType parseMediaType(std::string_view name);

/**
 * @brief One indexed media file
 *
 * `id` is derived from `path`; both change together.
 */
struct FileRecord {
    FileId id;
    std::string path;
    double mtime = 0.0;
    std::string name;
    MediaType type = MediaType::Unknown;
    std::string duration;
    std::string dimensions;
    bool hasWorkflow = false;
    bool isFavorite = false;
    std::string promptPreview;
    std::string samplerNames;
    std::optional<std::string> thumbnailPath;
    std::string folder; ///< parent directory of `path`
};

/// A file row as returned by page queries
struct FileRow {
    FileRecord file;
    int64_t samplerCount = 0;
};

/// File record together with the sampler rows that replace its stored ones
struct IndexEntry {
    FileRecord file;
    extraction::SamplerRecords samplers;
};

/// How several metadata criteria are combined
enum class SamplerMatch {
    EachCriterion, ///< every criterion is met by some sampler of the file
    SameSampler    ///< one sampler meets all criteria
};

struct MetadataFilter {
    std::optional<std::string> model;
    std::optional<std::string> sampler;
    std::optional<std::string> scheduler;
    std::optional<double> cfgMin;
    std::optional<double> cfgMax;
    std::optional<int64_t> stepsMin;
    std::optional<int64_t> stepsMax;
    std::optional<int64_t> widthMin;
    std::optional<int64_t> widthMax;
    std::optional<int64_t> heightMin;
    std::optional<int64_t> heightMax;
    SamplerMatch match = SamplerMatch::EachCriterion;

    bool empty() const {
        return !model && !sampler && !scheduler && !cfgMin && !cfgMax && !stepsMin && !stepsMax &&
               !widthMin && !widthMax && !heightMin && !heightMax;
    }
};

/// Restricts a query to one folder, optionally including its subfolders
struct FolderScope {
    std::string folder; ///< absolute folder path, empty for the whole index
    bool recursive = false;
};

struct FileQuery {
    FolderScope scope;
    MetadataFilter metadata;
    std::optional<std::string> search; ///< case-insensitive name substring
    bool favoritesOnly = false;
    std::vector<std::string> prefixes;   ///< names starting with `<prefix>_`
    std::vector<std::string> extensions; ///< with or without the leading dot
};

enum class SortKey { ModifiedTime, Name };
enum class SortDirection { Descending, Ascending };

struct PageRequest {
    SortKey sort = SortKey::ModifiedTime;
    SortDirection direction = SortDirection::Descending;
    int64_t limit = 100;
    int64_t offset = 0;
};

struct Page {
    std::vector<FileRow> rows;
    int64_t totalCount = 0;
};

template <typename T> struct ValueRange {
    std::optional<T> min;
    std::optional<T> max;
};

/// Distinct filter values with per-value file counts
struct FilterOptions {
    std::vector<std::pair<std::string, int64_t>> models;
    std::vector<std::pair<std::string, int64_t>> samplers;
    std::vector<std::pair<std::string, int64_t>> schedulers;
    ValueRange<double> cfg;
    ValueRange<int64_t> steps;
    ValueRange<int64_t> width;
    ValueRange<int64_t> height;
};

struct IndexStats {
    int64_t fileCount = 0;
    int64_t samplerCount = 0;
    int64_t favoriteCount = 0;
    int64_t withWorkflowCount = 0;
};

} // namespace mediadex::metadata
