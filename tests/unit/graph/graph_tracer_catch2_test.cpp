#include <catch2/catch_test_macros.hpp>

#include <array>
#include <string_view>
#include <nlohmann/json.hpp>
#include <mediadex/graph/graph_tracer.h>
#include <mediadex/graph/node_types.h>

using namespace mediadex::graph;
using nlohmann::json;

namespace {

GraphDocument build(const char* text) {
    auto doc = GraphDocument::fromJson(json::parse(text));
    REQUIRE(doc.has_value());
    return std::move(doc).value();
}

constexpr std::array<std::string_view, 1> kStopAtLoader = {"CheckpointLoaderSimple"};

} // namespace

TEST_CASE("GraphTracer: follows a chain to the stop type", "[unit][graph][tracer]") {
    auto doc = build(R"({
        "1": {"class_type": "CheckpointLoaderSimple", "inputs": {"ckpt_name": "m.safetensors"}},
        "2": {"class_type": "LoraLoader", "inputs": {"model": ["1", 0]}},
        "3": {"class_type": "LoraLoader", "inputs": {"model": ["2", 0]}},
        "9": {"class_type": "KSampler", "inputs": {"model": ["3", 0]}}
    })");
    GraphTracer tracer(doc);

    const Node* found = tracer.trace("9", "model", kStopAtLoader);
    REQUIRE(found != nullptr);
    CHECK(found->id == "1");

    SECTION("without stop types the last node in the chain is returned") {
        CHECK(tracer.trace("9", "model")->id == "1");
    }

    SECTION("the start node itself can match") {
        CHECK(tracer.trace("1", "model", kStopAtLoader)->id == "1");
    }
}

TEST_CASE("GraphTracer: cycles terminate", "[unit][graph][tracer]") {
    auto doc = build(R"({
        "1": {"class_type": "Reroute", "inputs": {"model": ["2", 0]}},
        "2": {"class_type": "Reroute", "inputs": {"model": ["1", 0]}},
        "9": {"class_type": "KSampler", "inputs": {"model": ["1", 0]}}
    })");
    GraphTracer tracer(doc);

    CHECK(tracer.trace("9", "model", kStopAtLoader) == nullptr);
    CHECK(tracer.trace("9", "model", kStopAtLoader, 3) == nullptr);
}

TEST_CASE("GraphTracer: dangling references yield nothing", "[unit][graph][tracer]") {
    auto doc = build(R"({
        "9": {"class_type": "KSampler", "inputs": {"model": ["404", 0]}}
    })");
    GraphTracer tracer(doc);
    CHECK(tracer.trace("9", "model", kStopAtLoader) == nullptr);
    CHECK(tracer.trace("missing", "model") == nullptr);
}

TEST_CASE("GraphTracer: valueOf reads through primitive nodes", "[unit][graph][tracer]") {
    auto doc = build(R"({
        "5": {"class_type": "PrimitiveNode", "inputs": {"value": 30}},
        "9": {"class_type": "KSampler", "inputs": {"steps": ["5", 0], "cfg": 6.0}}
    })");
    GraphTracer tracer(doc);
    const Node* sampler = doc.find("9");

    CHECK(tracer.valueOf(sampler, "cfg") == json(6.0));
    CHECK(tracer.valueOf(sampler, "steps") == json(30));
    CHECK_FALSE(tracer.valueOf(sampler, "seed").has_value());
    CHECK_FALSE(tracer.valueOf(nullptr, "cfg").has_value());
}
