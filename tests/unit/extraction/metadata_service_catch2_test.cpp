#include <catch2/catch_test_macros.hpp>

#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <mediadex/extraction/metadata_service.h>

using namespace mediadex::extraction;
using nlohmann::json;

namespace {

struct RecordingSink : IDebugSink {
    bool enabled() const override { return true; }
    void emit(const std::filesystem::path&, std::string_view stage, std::string_view info,
              std::string_view) override {
        std::lock_guard<std::mutex> lock(mutex);
        stages.push_back(std::string(stage) + ":" + std::string(info));
    }
    std::mutex mutex;
    std::vector<std::string> stages;
};

const char* kInline = R"({
    "4": {"class_type": "CheckpointLoaderSimple", "inputs": {"ckpt_name": "sdxl_base.safetensors"}},
    "3": {"class_type": "KSampler", "inputs": {"model": ["4", 0], "steps": 20, "cfg": 7}}
})";

} // namespace

TEST_CASE("MetadataService: detects payload shapes", "[unit][extraction][detect]") {
    auto inlineGraph = json::parse(kInline);

    CHECK(MetadataService::detect(inlineGraph).format == "inline");
    CHECK(MetadataService::detect(json{{"prompt", inlineGraph}}).format == "nested_prompt");
    CHECK(MetadataService::detect(json{{"Prompt", inlineGraph}}).format == "nested_Prompt");

    json linked = {{"nodes", json::array()}, {"links", json::array()}};
    CHECK(MetadataService::detect(linked).format == "linked");

    linked["extra"] = {{"prompt", inlineGraph}};
    auto embedded = MetadataService::detect(linked);
    CHECK(embedded.format == "linked_with_embedded_inline");
    CHECK(embedded.payload == &linked["extra"]["prompt"]);

    CHECK(MetadataService::detect(json{{"a", 1}}).payload == nullptr);
    CHECK(MetadataService::detect(json::object()).format == "unknown");
    CHECK(MetadataService::detect(json::array()).payload == nullptr);
}

TEST_CASE("MetadataService: extract never fails loudly", "[unit][extraction]") {
    MetadataService service;

    CHECK(service.extract("").empty());
    CHECK(service.extract("not json").empty());
    CHECK(service.extract("{\"truncated\": ").empty());
    CHECK(service.extract("[1, 2, 3]").empty());
    CHECK(service.extract(R"({"unrelated": {"key": 1}})").empty());
}

TEST_CASE("MetadataService: extracts from each payload shape", "[unit][extraction]") {
    MetadataService service;
    auto inlineGraph = json::parse(kInline);

    for (const auto& payload : {inlineGraph, json{{"prompt", inlineGraph}}}) {
        auto records = service.extract(payload.dump());
        REQUIRE(records.size() == 1);
        CHECK(records[0].modelName == "sdxl_base");
        CHECK(records[0].steps == 20);
        CHECK(records[0].cfg == 7.0);
    }
}

TEST_CASE("MetadataService: debug stages are emitted in order", "[unit][extraction]") {
    auto sink = std::make_shared<RecordingSink>();
    MetadataService service(sink);

    auto records = service.extract(kInline, "/tmp/render_0001.png");
    REQUIRE(records.size() == 1);
    REQUIRE(sink->stages.size() == 5);
    CHECK(sink->stages[0] == "01_raw:string");
    CHECK(sink->stages[1] == "02_parsed:json_object");
    CHECK(sink->stages[2] == "03_format_detection:inline");
    CHECK(sink->stages[3] == "04_parser_input:inline");
    CHECK(sink->stages[4] == "05_parser_output:inline_1_samplers");
}
