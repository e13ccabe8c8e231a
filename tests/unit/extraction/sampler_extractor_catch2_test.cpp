#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <mediadex/extraction/sampler_extractor.h>

using namespace mediadex;
using namespace mediadex::extraction;
using nlohmann::json;

namespace {

graph::GraphDocument build(const json& root) {
    auto doc = graph::GraphDocument::fromJson(root);
    REQUIRE(doc.has_value());
    return std::move(doc).value();
}

json txt2imgInline() {
    return json::parse(R"({
        "4": {"class_type": "CheckpointLoaderSimple",
              "inputs": {"ckpt_name": "models/sdxl/sdxl_base.safetensors"}},
        "5": {"class_type": "EmptyLatentImage", "inputs": {"width": 1024, "height": 768, "batch_size": 1}},
        "6": {"class_type": "CLIPTextEncode", "inputs": {"text": "a red fox in snow", "clip": ["4", 1]}},
        "7": {"class_type": "CLIPTextEncode", "inputs": {"text": "   ", "clip": ["4", 1]}},
        "3": {"class_type": "KSampler",
              "inputs": {"model": ["4", 0], "positive": ["6", 0], "negative": ["7", 0],
                         "latent_image": ["5", 0], "seed": 1, "steps": "30", "cfg": "6.5",
                         "sampler_name": "dpmpp_2m", "scheduler": "karras", "denoise": 1.0}}
    })");
}

json txt2imgLinked() {
    return json::parse(R"({
        "nodes": [
            {"id": 4, "type": "CheckpointLoaderSimple",
             "widgets_values": ["models/sdxl/sdxl_base.safetensors"]},
            {"id": 5, "type": "EmptyLatentImage", "widgets_values": [1024, 768, 1]},
            {"id": 6, "type": "CLIPTextEncode", "inputs": [{"name": "clip", "link": 10}],
             "widgets_values": ["a red fox in snow"]},
            {"id": 7, "type": "CLIPTextEncode", "inputs": [{"name": "clip", "link": 11}],
             "widgets_values": ["   "]},
            {"id": 3, "type": "KSampler",
             "inputs": [{"name": "model", "link": 1}, {"name": "positive", "link": 2},
                        {"name": "negative", "link": 3}, {"name": "latent_image", "link": 4}],
             "widgets_values": [1, "randomize", 30, 6.5, "dpmpp_2m", "karras", 1.0]}
        ],
        "links": [[1, 4, 0, 3, 0, "MODEL"], [2, 6, 0, 3, 1, "CONDITIONING"],
                  [3, 7, 0, 3, 2, "CONDITIONING"], [4, 5, 0, 3, 3, "LATENT"],
                  [10, 4, 1, 6, 0, "CLIP"], [11, 4, 1, 7, 0, "CLIP"]]
    })");
}

} // namespace

TEST_CASE("SamplerExtractor: text-to-image graph", "[unit][extraction]") {
    auto doc = build(txt2imgInline());
    auto records = SamplerExtractor().extractAll(doc);
    REQUIRE(records.size() == 1);

    const auto& r = records.front();
    CHECK(r.samplerIndex == 0);
    CHECK(r.modelName == "sdxl_base");
    CHECK(r.samplerName == "dpmpp_2m");
    CHECK(r.scheduler == "karras");
    CHECK(r.positivePrompt == "a red fox in snow");
    CHECK_FALSE(r.negativePrompt.has_value());
    CHECK(r.width == 1024);
    CHECK(r.height == 768);
    CHECK(r.cfg == 6.5);
    CHECK(r.steps == 30);
}

TEST_CASE("SamplerExtractor: results do not depend on the serialization", "[unit][extraction]") {
    auto fromInline = SamplerExtractor().extractAll(build(txt2imgInline()));
    auto fromLinked = SamplerExtractor().extractAll(build(txt2imgLinked()));
    REQUIRE(fromInline.size() == 1);
    CHECK(fromInline == fromLinked);
}

TEST_CASE("SamplerExtractor: graph without samplers", "[unit][extraction]") {
    auto doc = build(json::parse(R"({
        "4": {"class_type": "CheckpointLoaderSimple", "inputs": {"ckpt_name": "a.safetensors"}}
    })"));
    CHECK(SamplerExtractor().extractAll(doc).empty());
}

TEST_CASE("SamplerExtractor: advanced sampler resolves helpers", "[unit][extraction]") {
    auto doc = build(json::parse(R"({
        "1": {"class_type": "UNETLoader", "inputs": {"unet_name": "flux1-dev.gguf"}},
        "2": {"class_type": "KSamplerSelect", "inputs": {"sampler_name": "euler"}},
        "3": {"class_type": "BasicScheduler", "inputs": {"scheduler": "simple", "steps": 20, "model": ["1", 0]}},
        "9": {"class_type": "SamplerCustomAdvanced",
              "inputs": {"sampler": ["2", 0], "sigmas": ["3", 0], "model": ["1", 0]}}
    })"));
    auto records = SamplerExtractor().extractAll(doc);
    REQUIRE(records.size() == 1);
    CHECK(records[0].samplerName == "euler");
    CHECK(records[0].scheduler == "simple");
    CHECK(records[0].steps == 20);
    CHECK(records[0].modelName == "flux1-dev");
    CHECK_FALSE(records[0].cfg.has_value());
}

TEST_CASE("SamplerExtractor: samplers are ordered by numeric id", "[unit][extraction]") {
    auto doc = build(json::parse(R"({
        "10": {"class_type": "KSampler", "inputs": {"steps": 10}},
        "9":  {"class_type": "KSampler", "inputs": {"steps": 9}},
        "b":  {"class_type": "KSampler", "inputs": {"steps": 2}},
        "a":  {"class_type": "KSampler", "inputs": {"steps": 1}}
    })"));
    auto records = SamplerExtractor().extractAll(doc);
    REQUIRE(records.size() == 4);
    CHECK(records[0].steps == 9);
    CHECK(records[1].steps == 10);
    CHECK(records[2].steps == 1);
    CHECK(records[3].steps == 2);
    for (size_t i = 0; i < records.size(); ++i) {
        CHECK(records[i].samplerIndex == static_cast<int>(i));
    }
}

TEST_CASE("SamplerExtractor: dimension fallback", "[unit][extraction]") {
    auto doc = build(json::parse(R"({
        "3": {"class_type": "KSampler", "inputs": {"steps": 10}}
    })"));

    SECTION("used when the graph has no latent size") {
        SamplerExtractor extractor([] { return media::ImageSize{512, 640}; });
        auto records = extractor.extractAll(doc);
        REQUIRE(records.size() == 1);
        CHECK(records[0].width == 512);
        CHECK(records[0].height == 640);
    }

    SECTION("ignored when the graph provides it") {
        SamplerExtractor extractor([] { return media::ImageSize{1, 1}; });
        auto records = extractor.extractAll(build(txt2imgInline()));
        CHECK(records[0].width == 1024);
    }
}

TEST_CASE("SamplerExtractor: value helpers", "[unit][extraction]") {
    CHECK(SamplerExtractor::modelBasename("sdxl_base.safetensors") == "sdxl_base");
    CHECK(SamplerExtractor::modelBasename("a/b\\c/model.v2.ckpt") == "model.v2");
    CHECK(SamplerExtractor::modelBasename("noext") == "noext");

    CHECK(SamplerExtractor::toFloat(json("7.5")) == 7.5);
    CHECK(SamplerExtractor::toFloat(json(7)) == 7.0);
    CHECK_FALSE(SamplerExtractor::toFloat(json("high")).has_value());
    CHECK_FALSE(SamplerExtractor::toFloat(json(nullptr)).has_value());

    CHECK(SamplerExtractor::toInt(json("25")) == 25);
    CHECK(SamplerExtractor::toInt(json(25.9)) == 25);
    CHECK_FALSE(SamplerExtractor::toInt(json("25.5")).has_value());
    CHECK_FALSE(SamplerExtractor::toInt(json::array()).has_value());
}

TEST_CASE("SamplerExtractor: out-of-range numbers become null", "[unit][extraction]") {
    auto doc = build(json::parse(R"({
        "1": {"class_type": "EmptyLatentImage", "inputs": {"width": 1e300, "height": 512}},
        "2": {"class_type": "KSampler",
              "inputs": {"latent_image": ["1", 0], "steps": 1e30, "cfg": 7, "sampler_name": "euler"}}
    })"));

    auto records = SamplerExtractor().extractAll(doc);
    REQUIRE(records.size() == 1);
    CHECK_FALSE(records[0].width.has_value());
    CHECK(records[0].height == 512);
    CHECK_FALSE(records[0].steps.has_value());
    CHECK(records[0].cfg == 7.0);
    CHECK(records[0].samplerName == "euler");

    CHECK_FALSE(SamplerExtractor::toInt(json(-1e19)).has_value());
    CHECK_FALSE(SamplerExtractor::toInt(json(9.2233720368547758e18)).has_value());
    CHECK_FALSE(SamplerExtractor::toInt(json(std::numeric_limits<uint64_t>::max())).has_value());
    CHECK(SamplerExtractor::toInt(json(-9.0e18)) == -9'000'000'000'000'000'000);
}
