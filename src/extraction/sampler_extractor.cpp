#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <mediadex/extraction/sampler_extractor.h>
#include <mediadex/graph/graph_tracer.h>
#include <mediadex/graph/node_types.h>

namespace mediadex::extraction {

using graph::GraphDocument;
using graph::GraphTracer;
using graph::Node;
using nlohmann::json;

namespace {

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<int64_t> parseInteger(std::string_view s) {
    int64_t value = 0;
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> asText(const std::optional<json>& value) {
    if (!value) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    if (value->is_number()) {
        return value->dump();
    }
    return std::nullopt;
}

bool truthy(const json& value) {
    if (value.is_null()) {
        return false;
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string() || value.is_array() || value.is_object()) {
        return !value.empty();
    }
    if (value.is_number_float()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_number()) {
        return value.get<int64_t>() != 0;
    }
    return true;
}

std::optional<std::string> promptText(const std::optional<json>& value) {
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    auto text = value->get<std::string>();
    if (trimView(text).empty()) {
        return std::nullopt;
    }
    return text;
}

} // namespace

std::optional<double> SamplerExtractor::toFloat(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        auto text = std::string(trimView(value.get_ref<const std::string&>()));
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        double d = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) {
            return std::nullopt;
        }
        return d;
    }
    return std::nullopt;
}

std::optional<int64_t> SamplerExtractor::toInt(const json& value) {
    if (value.is_number_integer()) {
        if (value.is_number_unsigned()) {
            auto u = value.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return std::nullopt;
            }
            return static_cast<int64_t>(u);
        }
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        // Outside [-2^63, 2^63) the conversion is undefined
        if (!std::isfinite(d) || d < -9.2233720368547758e18 || d >= 9.2233720368547758e18) {
            return std::nullopt;
        }
        return static_cast<int64_t>(std::trunc(d));
    }
    if (value.is_string()) {
        return parseInteger(trimView(value.get_ref<const std::string&>()));
    }
    return std::nullopt;
}

std::string SamplerExtractor::modelBasename(std::string_view value) {
    auto slash = value.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        value = value.substr(slash + 1);
    }
    auto dot = value.find_last_of('.');
    if (dot != std::string_view::npos && dot > 0) {
        value = value.substr(0, dot);
    }
    return std::string(value);
}

std::vector<const Node*> SamplerExtractor::findSamplerNodes(const GraphDocument& doc) {
    std::vector<const Node*> samplers;
    for (const auto& [id, node] : doc.nodes()) {
        if (graph::containsType(graph::kSamplerTypes, doc.nodeType(node))) {
            samplers.push_back(&node);
        }
    }
    std::stable_sort(samplers.begin(), samplers.end(), [](const Node* a, const Node* b) {
        auto na = parseInteger(a->id);
        auto nb = parseInteger(b->id);
        if (na && nb) {
            return *na < *nb;
        }
        if (na.has_value() != nb.has_value()) {
            return na.has_value();
        }
        return a->id < b->id;
    });
    return samplers;
}

SamplerRecords SamplerExtractor::extractAll(const GraphDocument& doc) const {
    SamplerRecords records;
    for (const Node* sampler : findSamplerNodes(doc)) {
        try {
            auto record = extractOne(doc, *sampler);
            record.samplerIndex = static_cast<int>(records.size());
            records.push_back(std::move(record));
        } catch (const std::exception& e) {
            spdlog::debug("[SamplerExtractor] dropping sampler node {}: {}", sampler->id, e.what());
        }
    }
    return records;
}

SamplerRecord SamplerExtractor::extractOne(const GraphDocument& doc, const Node& sampler) const {
    GraphTracer tracer(doc);
    SamplerRecord rec;

    auto guarded = [&sampler](const char* field, auto&& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::debug("[SamplerExtractor] node {} field '{}': {}", sampler.id, field, e.what());
        }
    };

    guarded("sampler_name", [&] {
        auto value = tracer.valueOf(&sampler, "sampler_name");
        if (!value) {
            const Node* select = tracer.trace(sampler.id, "sampler", graph::kSamplerSelectTypes);
            value = tracer.valueOf(select, "sampler_name");
        }
        rec.samplerName = asText(value);
    });

    guarded("scheduler", [&] {
        auto value = tracer.valueOf(&sampler, "scheduler");
        if (!value) {
            const Node* sched = tracer.trace(sampler.id, "sigmas", graph::kSchedulerTypes);
            value = tracer.valueOf(sched, "scheduler");
        }
        rec.scheduler = asText(value);
    });

    guarded("model_name", [&] {
        const Node* loader = tracer.trace(sampler.id, "model", graph::kModelLoaderTypes);
        if (!loader) {
            return;
        }
        for (auto param : graph::kModelNameParams) {
            auto value = tracer.valueOf(loader, param);
            if (value && truthy(*value)) {
                if (value->is_string()) {
                    rec.modelName = modelBasename(value->get_ref<const std::string&>());
                }
                return;
            }
        }
    });

    guarded("positive_prompt", [&] {
        const Node* encoder = tracer.trace(sampler.id, "positive", graph::kPromptEncoderTypes);
        rec.positivePrompt = promptText(tracer.valueOf(encoder, "text"));
    });

    guarded("negative_prompt", [&] {
        const Node* encoder = tracer.trace(sampler.id, "negative", graph::kPromptEncoderTypes);
        rec.negativePrompt = promptText(tracer.valueOf(encoder, "text"));
    });

    guarded("dimensions", [&] {
        const Node* latent = tracer.trace(sampler.id, "latent_image");
        if (latent && graph::containsType(graph::kDimensionProviderTypes, doc.nodeType(*latent))) {
            if (auto w = tracer.valueOf(latent, "width")) {
                rec.width = toInt(*w);
            }
            if (auto h = tracer.valueOf(latent, "height")) {
                rec.height = toInt(*h);
            }
        }
    });

    if ((!rec.width || !rec.height) && fallback_) {
        guarded("dimensions_fallback", [&] {
            if (auto size = fallback_()) {
                rec.width = size->width;
                rec.height = size->height;
            }
        });
    }

    guarded("cfg", [&] {
        if (auto value = tracer.valueOf(&sampler, "cfg")) {
            rec.cfg = toFloat(*value);
        }
    });

    guarded("steps", [&] {
        auto value = tracer.valueOf(&sampler, "steps");
        if (!value) {
            const Node* sched = tracer.trace(sampler.id, "sigmas", graph::kSchedulerTypes);
            value = tracer.valueOf(sched, "steps");
        }
        if (value) {
            rec.steps = toInt(*value);
        }
    });

    return rec;
}

DimensionFallback fileDimensionFallback(const std::filesystem::path& file) {
    if (file.empty()) {
        return {};
    }
    auto ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext != ".png" && ext != ".jpg" && ext != ".jpeg" && ext != ".webp") {
        return {};
    }
    return [file]() { return media::probeImageSize(file); };
}

} // namespace mediadex::extraction
