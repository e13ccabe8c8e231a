#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <mediadex/graph/graph_document.h>

using namespace mediadex;
using namespace mediadex::graph;
using nlohmann::json;

namespace {

json linkedGraph() {
    return json::parse(R"({
        "nodes": [
            {"id": 4, "type": "CheckpointLoaderSimple", "widgets_values": ["sdxl_base.safetensors"]},
            {"id": 6, "type": "CLIPTextEncode", "inputs": [{"name": "clip", "link": 3}],
             "widgets_values": ["a lighthouse at dusk"]},
            {"id": 3, "type": "KSampler",
             "inputs": [{"name": "model", "link": 1}, {"name": "positive", "link": 4},
                        {"name": "negative", "link": null}],
             "widgets_values": [42, "fixed", 25, 7.5, "euler", "karras", 1.0]}
        ],
        "links": [[1, 4, 0, 3, 0, "MODEL"], [3, 4, 1, 6, 0, "CLIP"], [4, 6, 0, 3, 1, "CONDITIONING"]]
    })");
}

json inlineGraph() {
    return json::parse(R"({
        "4": {"class_type": "CheckpointLoaderSimple", "inputs": {"ckpt_name": "sdxl_base.safetensors"}},
        "6": {"class_type": "CLIPTextEncode", "inputs": {"text": "a lighthouse at dusk", "clip": ["4", 1]}},
        "3": {"class_type": "KSampler",
              "inputs": {"model": ["4", 0], "positive": ["6", 0], "seed": 42, "steps": 25,
                         "cfg": 7.5, "sampler_name": "euler", "scheduler": "karras"}}
    })");
}

} // namespace

TEST_CASE("GraphDocument: linked serialization", "[unit][graph]") {
    auto doc = GraphDocument::fromJson(linkedGraph());
    REQUIRE(doc.has_value());
    const auto& g = doc.value();

    CHECK(g.variant() == GraphVariant::Linked);
    CHECK(g.size() == 3);

    const Node* sampler = g.find("3");
    REQUIRE(sampler != nullptr);
    CHECK(g.nodeType(*sampler) == "KSampler");

    SECTION("links resolve to source node and slot") {
        auto conn = g.connection(*sampler, "positive");
        REQUIRE(conn.has_value());
        CHECK(conn->node == "6");
        CHECK(conn->slot == 0);
        CHECK(g.inputSource(*sampler, "model") == g.find("4"));
    }

    SECTION("null links are unconnected") {
        CHECK_FALSE(g.connection(*sampler, "negative").has_value());
        CHECK(g.inputSource(*sampler, "negative") == nullptr);
    }

    SECTION("widgets fall back to known positions") {
        CHECK(g.widgetValue(*sampler, "steps") == json(25));
        CHECK(g.widgetValue(*sampler, "cfg") == json(7.5));
        CHECK(g.widgetValue(*sampler, "sampler_name") == json("euler"));
        CHECK(g.widgetValue(*g.find("4"), "ckpt_name") == json("sdxl_base.safetensors"));
        CHECK_FALSE(g.widgetValue(*sampler, "not_a_param").has_value());
    }
}

TEST_CASE("GraphDocument: inline serialization", "[unit][graph]") {
    auto doc = GraphDocument::fromJson(inlineGraph());
    REQUIRE(doc.has_value());
    const auto& g = doc.value();

    CHECK(g.variant() == GraphVariant::Inline);
    const Node* sampler = g.find("3");
    REQUIRE(sampler != nullptr);

    CHECK(g.inputSource(*sampler, "positive") == g.find("6"));
    CHECK(g.connection(*g.find("6"), "clip")->slot == 1);
    CHECK(g.widgetValue(*sampler, "steps") == json(25));

    // A wired input is not a literal
    CHECK_FALSE(g.widgetValue(*sampler, "model").has_value());
}

TEST_CASE("GraphDocument: both serializations expose the same view", "[unit][graph]") {
    auto linked = GraphDocument::fromJson(linkedGraph());
    auto inlined = GraphDocument::fromJson(inlineGraph());
    REQUIRE(linked.has_value());
    REQUIRE(inlined.has_value());

    for (const auto* g : {&linked.value(), &inlined.value()}) {
        const Node* sampler = g->find("3");
        REQUIRE(sampler != nullptr);
        CHECK(g->inputSource(*sampler, "model")->id == "4");
        CHECK(g->inputSource(*sampler, "positive")->id == "6");
        for (auto param : {"steps", "cfg", "sampler_name", "scheduler"}) {
            CHECK(linked.value().widgetValue(*linked.value().find("3"), param) ==
                  g->widgetValue(*sampler, param));
        }
    }
}

TEST_CASE("GraphDocument: widget index map overrides positions", "[unit][graph]") {
    auto root = linkedGraph();
    root["widget_idx_map"] = {{"3", {{"steps", 0}}}};
    auto doc = GraphDocument::fromJson(root);
    REQUIRE(doc.has_value());
    CHECK(doc.value().widgetValue(*doc.value().find("3"), "steps") == json(42));
    // Parameters missing from the map still use the table
    CHECK(doc.value().widgetValue(*doc.value().find("3"), "cfg") == json(7.5));
}

TEST_CASE("GraphDocument: rejects unrecognized shapes", "[unit][graph]") {
    CHECK(GraphDocument::fromJson(json::array()).error().code == ErrorCode::UnrecognizedFormat);
    CHECK(GraphDocument::fromJson(json{{"foo", 1}}).error().code ==
          ErrorCode::UnrecognizedFormat);
    CHECK(GraphDocument::fromJson(json{{"1", {{"inputs", json::object()}}}}).error().code ==
          ErrorCode::UnrecognizedFormat);
}

TEST_CASE("GraphDocument: ids are canonical strings", "[unit][graph]") {
    CHECK(idToString(json(12)) == "12");
    CHECK(idToString(json(12.0)) == "12");
    CHECK(idToString(json("12")) == "12");
    CHECK(idToString(json("abc")) == "abc");
    CHECK(idToString(json(1e300)) == json(1e300).dump());
    CHECK(idToString(json(-1e19)) == json(-1e19).dump());
}
