#include <mediadex/cli/json_output.h>

namespace mediadex::cli {

namespace {

template <typename T> json optionalValue(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T> json rangeJson(const metadata::ValueRange<T>& range) {
    return json{{"min", optionalValue(range.min)}, {"max", optionalValue(range.max)}};
}

json countedValues(const std::vector<std::pair<std::string, int64_t>>& values) {
    json out = json::array();
    for (const auto& [value, count] : values) {
        out.push_back({{"value", value}, {"count", count}});
    }
    return out;
}

} // namespace

json toJson(const metadata::FileRecord& file) {
    return json{{"id", file.id},
                {"path", file.path},
                {"name", file.name},
                {"folder", file.folder},
                {"type", std::string(metadata::mediaTypeName(file.type))},
                {"mtime", file.mtime},
                {"duration", file.duration},
                {"dimensions", file.dimensions},
                {"has_workflow", file.hasWorkflow},
                {"is_favorite", file.isFavorite},
                {"prompt_preview", file.promptPreview},
                {"sampler_names", file.samplerNames},
                {"thumbnail_path", optionalValue(file.thumbnailPath)}};
}

json toJson(const metadata::Page& page) {
    json rows = json::array();
    for (const auto& row : page.rows) {
        auto item = toJson(row.file);
        item["sampler_count"] = row.samplerCount;
        rows.push_back(std::move(item));
    }
    return json{{"total", page.totalCount}, {"files", std::move(rows)}};
}

json toJson(const extraction::SamplerRecord& sampler) {
    return json{{"sampler_index", sampler.samplerIndex},
                {"model_name", optionalValue(sampler.modelName)},
                {"sampler_name", optionalValue(sampler.samplerName)},
                {"scheduler", optionalValue(sampler.scheduler)},
                {"positive_prompt", optionalValue(sampler.positivePrompt)},
                {"negative_prompt", optionalValue(sampler.negativePrompt)},
                {"width", optionalValue(sampler.width)},
                {"height", optionalValue(sampler.height)},
                {"cfg", optionalValue(sampler.cfg)},
                {"steps", optionalValue(sampler.steps)}};
}

json toJson(const extraction::SamplerRecords& samplers) {
    json out = json::array();
    for (const auto& s : samplers) {
        out.push_back(toJson(s));
    }
    return out;
}

json toJson(const metadata::FilterOptions& options) {
    return json{{"models", countedValues(options.models)},
                {"samplers", countedValues(options.samplers)},
                {"schedulers", countedValues(options.schedulers)},
                {"cfg", rangeJson(options.cfg)},
                {"steps", rangeJson(options.steps)},
                {"width", rangeJson(options.width)},
                {"height", rangeJson(options.height)}};
}

json toJson(const metadata::IndexStats& stats) {
    return json{{"files", stats.fileCount},
                {"samplers", stats.samplerCount},
                {"favorites", stats.favoriteCount},
                {"with_workflow", stats.withWorkflowCount}};
}

json toJson(const sync::SyncSummary& summary) {
    json failures = json::array();
    for (const auto& [path, reason] : summary.failures) {
        failures.push_back({{"path", path}, {"reason", reason}});
    }
    return json{{"added", summary.added},
                {"updated", summary.updated},
                {"deleted", summary.deleted},
                {"processed", summary.processed},
                {"failed", summary.failed},
                {"with_workflow", summary.withWorkflow},
                {"with_metadata", summary.withMetadata},
                {"without_metadata", summary.withoutMetadata},
                {"total_samplers", summary.totalSamplers},
                {"elapsed_ms", summary.elapsed.count()},
                {"failures", std::move(failures)}};
}

} // namespace mediadex::cli
