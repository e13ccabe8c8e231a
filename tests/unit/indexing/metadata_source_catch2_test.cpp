#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <string>
#include "common/test_helpers_catch2.h"
#include <mediadex/indexing/metadata_source.h>

using namespace mediadex::indexing;
using nlohmann::json;

namespace {

const std::string kInline =
    R"({"3": {"class_type": "KSampler", "inputs": {"steps": 20}}})";
const std::string kLinked = R"({"nodes": [{"id": 1, "type": "KSampler"}], "links": []})";

struct FixedProbe : IMediaProbe {
    std::optional<ProbeResult> probe(const std::filesystem::path&) const override {
        ProbeResult result;
        result.tags = {{"title", "clip"}, {"comment", "  " + kInline}};
        return result;
    }
};

} // namespace

TEST_CASE("EmbeddedMetadataSource: payload validation", "[unit][indexing][metadata_source]") {
    SECTION("inline graphs are returned as given") {
        CHECK(EmbeddedMetadataSource::validatePayload(kInline) == kInline);
    }

    SECTION("nested linked graphs are unwrapped") {
        auto wrapped = json{{"workflow", json::parse(kLinked)}}.dump();
        auto result = EmbeddedMetadataSource::validatePayload(wrapped);
        REQUIRE(result.has_value());
        CHECK(json::parse(*result) == json::parse(kLinked));
    }

    SECTION("nested inline graphs keep the wrapper") {
        auto wrapped = json{{"prompt", json::parse(kInline)}}.dump();
        CHECK(EmbeddedMetadataSource::validatePayload(wrapped) == wrapped);
    }

    SECTION("unusable candidates are rejected") {
        CHECK_FALSE(EmbeddedMetadataSource::validatePayload("").has_value());
        CHECK_FALSE(EmbeddedMetadataSource::validatePayload("{}").has_value());
        CHECK_FALSE(EmbeddedMetadataSource::validatePayload("[1, 2]").has_value());
        CHECK_FALSE(EmbeddedMetadataSource::validatePayload("{\"a\": ").has_value());
    }
}

TEST_CASE("EmbeddedMetadataSource: byte scan finds the first balanced object",
          "[unit][indexing][metadata_source]") {
    CHECK(EmbeddedMetadataSource::scanForJsonObject("xx{\"a\": {\"b\": 1}} trailing {\"c\": 2}") ==
          "{\"a\": {\"b\": 1}}");
    CHECK_FALSE(EmbeddedMetadataSource::scanForJsonObject("no braces").has_value());
    CHECK_FALSE(EmbeddedMetadataSource::scanForJsonObject("{\"open\": {").has_value());
    CHECK_FALSE(EmbeddedMetadataSource::scanForJsonObject("{not json}").has_value());
}

TEST_CASE("EmbeddedMetadataSource: PNG text chunks", "[unit][indexing][metadata_source]") {
    SECTION("workflow chunk wins over prompt") {
        auto png = mediadex::test::make_png(8, 8, {{"prompt", kInline}, {"workflow", kLinked}});
        auto result = EmbeddedMetadataSource::fromPngChunks(png);
        REQUIRE(result.has_value());
        CHECK(json::parse(*result).contains("nodes"));
    }

    SECTION("invalid workflow falls through to prompt") {
        auto png = mediadex::test::make_png(8, 8, {{"workflow", "garbage"}, {"prompt", kInline}});
        CHECK(EmbeddedMetadataSource::fromPngChunks(png) == kInline);
    }

    SECTION("unrelated chunks are ignored") {
        auto png = mediadex::test::make_png(8, 8, {{"Comment", kInline}});
        CHECK_FALSE(EmbeddedMetadataSource::fromPngChunks(png).has_value());
    }
}

TEST_CASE("EmbeddedMetadataSource: read falls back in order", "[unit][indexing][metadata_source]") {
    mediadex::test::TempDir dir;
    const auto sidecars = dir / "logs";

    EmbeddedMetadataSource source({sidecars, {".mp4"}});

    SECTION("PNG chunks") {
        auto file = mediadex::test::write_file(
            dir / "a.png", mediadex::test::make_png(4, 4, {{"prompt", kInline}}));
        CHECK(source.read(file) == kInline);
    }

    SECTION("raw byte scan") {
        auto file = mediadex::test::write_file(dir / "clip.mp4", "\x01\x02" + kInline + "\x03");
        CHECK(source.read(file) == kInline);
    }

    SECTION("video container tags through the probe") {
        EmbeddedMetadataSource probed({{}, {".mp4"}}, std::make_shared<FixedProbe>());
        auto file = mediadex::test::write_file(dir / "tagged.mp4", "binary");
        auto result = probed.read(file);
        REQUIRE(result.has_value());
        CHECK(json::parse(*result) == json::parse(kInline));
    }

    SECTION("newest sidecar") {
        auto file = mediadex::test::write_file(dir / "b.png", mediadex::test::make_png(4, 4));
        auto older = mediadex::test::write_file(sidecars / "b.png.json", kLinked);
        auto newer = mediadex::test::write_file(sidecars / "b.png_2.json", kInline);
        mediadex::test::write_file(sidecars / "other.png.json", kLinked);
        mediadex::test::set_mtime(older, 1'000);
        mediadex::test::set_mtime(newer, 2'000);

        CHECK(source.read(file) == kInline);
    }

    SECTION("nothing found") {
        auto file = mediadex::test::write_file(dir / "c.png", mediadex::test::make_png(4, 4));
        CHECK_FALSE(source.read(file).has_value());
        CHECK_FALSE(source.read(dir / "missing.png").has_value());
    }
}
