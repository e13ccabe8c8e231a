#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <mediadex/extraction/metadata_service.h>
#include <mediadex/extraction/sampler_extractor.h>
#include <mediadex/graph/graph_document.h>

namespace mediadex::extraction {

using nlohmann::json;

MetadataService::MetadataService(std::shared_ptr<IDebugSink> debugSink)
    : debugSink_(debugSink ? std::move(debugSink) : std::make_shared<NullDebugSink>()) {}

DetectedPayload MetadataService::detect(const json& root) {
    DetectedPayload out;
    if (!root.is_object()) {
        return out;
    }

    if (auto it = root.find("prompt"); it != root.end() && it->is_object()) {
        return {"nested_prompt", &*it};
    }
    if (auto it = root.find("Prompt"); it != root.end() && it->is_object()) {
        return {"nested_Prompt", &*it};
    }

    if (auto nodes = root.find("nodes"); nodes != root.end() && nodes->is_array()) {
        if (auto extra = root.find("extra"); extra != root.end() && extra->is_object()) {
            if (auto p = extra->find("prompt"); p != extra->end() && p->is_object()) {
                return {"linked_with_embedded_inline", &*p};
            }
        }
        return {"linked", &root};
    }

    if (root.empty()) {
        return out;
    }
    size_t sampled = 0;
    size_t objects = 0;
    bool allTyped = true;
    for (const auto& [key, value] : root.items()) {
        if (sampled++ == 3) {
            break;
        }
        if (value.is_object()) {
            ++objects;
            allTyped = allTyped && value.contains("class_type");
        }
    }
    if (objects > 0 && allTyped) {
        return {"inline", &root};
    }
    return out;
}

void MetadataService::debug(const std::filesystem::path& file, std::string_view stage,
                            std::string_view info, const json& data) const {
    if (!debugSink_->enabled()) {
        return;
    }
    debugSink_->emit(file, stage, info, data.dump());
}

SamplerRecords MetadataService::extract(std::string_view rawBytes,
                                        const std::filesystem::path& sourceFile) const {
    if (rawBytes.empty()) {
        return {};
    }
    try {
        if (debugSink_->enabled()) {
            debugSink_->emit(sourceFile, "01_raw", "string", rawBytes);
        }

        auto root = json::parse(rawBytes.begin(), rawBytes.end(), nullptr, false);
        if (root.is_discarded()) {
            spdlog::debug("[MetadataService] {}: metadata is not valid JSON",
                          sourceFile.filename().string());
            return {};
        }
        debug(sourceFile, "02_parsed", "json_object", root);

        auto detected = detect(root);
        if (debugSink_->enabled()) {
            json summary = {{"detected_format", detected.format},
                            {"payload_found", detected.payload != nullptr},
                            {"root_type", root.type_name()}};
            debug(sourceFile, "03_format_detection", detected.format, summary);
        }
        if (!detected.payload) {
            spdlog::debug("[MetadataService] {}: no recognizable graph payload",
                          sourceFile.filename().string());
            return {};
        }
        debug(sourceFile, "04_parser_input", detected.format, *detected.payload);

        auto doc = graph::GraphDocument::fromJson(*detected.payload);
        if (!doc) {
            spdlog::debug("[MetadataService] {}: {}", sourceFile.filename().string(),
                          doc.error().message);
            return {};
        }

        SamplerExtractor extractor(fileDimensionFallback(sourceFile));
        auto records = extractor.extractAll(doc.value());

        if (debugSink_->enabled()) {
            json output = json::array();
            for (const auto& r : records) {
                output.push_back({{"sampler_index", r.samplerIndex},
                                  {"model_name", r.modelName ? json(*r.modelName) : json()},
                                  {"sampler_name", r.samplerName ? json(*r.samplerName) : json()},
                                  {"scheduler", r.scheduler ? json(*r.scheduler) : json()},
                                  {"cfg", r.cfg ? json(*r.cfg) : json()},
                                  {"steps", r.steps ? json(*r.steps) : json()},
                                  {"width", r.width ? json(*r.width) : json()},
                                  {"height", r.height ? json(*r.height) : json()}});
            }
            auto variant = graph::variantName(doc.value().variant());
            debug(sourceFile, "05_parser_output",
                  fmt::format("{}_{}_samplers", variant, records.size()),
                  json{{"variant", variant}, {"samplers_found", records.size()},
                       {"metadata", output}});
        }
        return records;
    } catch (const std::exception& e) {
        spdlog::warn("[MetadataService] unexpected failure extracting {}: {}",
                     sourceFile.filename().string(), e.what());
        return {};
    }
}

} // namespace mediadex::extraction
