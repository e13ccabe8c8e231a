#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "common/test_helpers_catch2.h"
#include <mediadex/crypto/hasher.h>
#include <mediadex/indexing/file_analyzer.h>

using namespace mediadex;
using namespace mediadex::indexing;
using metadata::MediaType;

namespace {

const std::string kGraph = R"({
    "4": {"class_type": "CheckpointLoaderSimple", "inputs": {"ckpt_name": "models/sdxl_base.safetensors"}},
    "6": {"class_type": "CLIPTextEncode", "inputs": {"text": "  a lighthouse at dusk, volumetric fog  "}},
    "7": {"class_type": "CLIPTextEncode", "inputs": {"text": "blurry"}},
    "3": {"class_type": "KSampler", "inputs": {"model": ["4", 0], "positive": ["6", 0],
          "negative": ["7", 0], "sampler_name": "euler", "scheduler": "karras",
          "steps": 25, "cfg": 6.5}},
    "9": {"class_type": "KSampler", "inputs": {"model": ["4", 0], "positive": ["6", 0],
          "negative": ["7", 0], "sampler_name": "dpmpp_2m", "steps": 10, "cfg": 4}}
})";

struct RecordingThumbnails : IThumbnailProducer {
    std::optional<std::filesystem::path> produce(const std::filesystem::path&,
                                                 const std::string& contentKey,
                                                 MediaType) override {
        std::lock_guard<std::mutex> lock(mutex);
        keys.push_back(contentKey);
        return std::filesystem::path("/thumbs") / (contentKey + ".webp");
    }
    std::mutex mutex;
    std::vector<std::string> keys;
};

constexpr size_t kGifHeaderBytes = 13;
constexpr size_t kGifFrameBytes = 23;

// GIF89a without a colour table, one 1x1 frame per delay (in 1/100 s)
std::string makeGif(const std::vector<uint16_t>& delays) {
    std::string gif = "GIF89a";
    gif += std::string("\x01\x00\x01\x00\x00\x00\x00", 7);
    for (auto delay : delays) {
        gif += std::string("\x21\xF9\x04\x00", 4);
        gif += static_cast<char>(delay & 0xFF);
        gif += static_cast<char>(delay >> 8);
        gif += std::string("\x00\x00", 2);
        gif += std::string("\x2C\x00\x00\x00\x00\x01\x00\x01\x00\x00", 10);
        gif += std::string("\x02\x02\x4C\x01\x00", 5);
    }
    gif += '\x3B';
    return gif;
}

FileAnalyzer makeAnalyzer(std::shared_ptr<IThumbnailProducer> thumbnails = nullptr,
                          AnalyzerOptions options = {}) {
    AnalyzerServices services;
    services.metadataSource =
        std::make_shared<EmbeddedMetadataSource>(EmbeddedMetadataSource::Options{});
    services.metadataService = std::make_shared<extraction::MetadataService>();
    services.thumbnails = std::move(thumbnails);
    options.promptPreviewLength = 16;
    return FileAnalyzer(options, services);
}

} // namespace

TEST_CASE("FileAnalyzer: classifies by extension", "[unit][indexing][analyzer]") {
    auto analyzer = makeAnalyzer();
    CHECK(analyzer.classify("a.PNG") == MediaType::Image);
    CHECK(analyzer.classify("a.jpeg") == MediaType::Image);
    CHECK(analyzer.classify("a.gif") == MediaType::AnimatedImage);
    CHECK(analyzer.classify("a.webp") == MediaType::AnimatedImage);
    CHECK(analyzer.classify("a.MKV") == MediaType::Video);
    CHECK(analyzer.classify("a.flac") == MediaType::Audio);
    CHECK(analyzer.classify("notes.txt") == MediaType::Unknown);
    CHECK_FALSE(analyzer.isMediaFile("noext"));
}

TEST_CASE("FileAnalyzer: analyzes a PNG with an embedded graph", "[unit][indexing][analyzer]") {
    test::TempDir dir;
    auto file = test::write_file(dir / "shots" / "lighthouse.png",
                                 test::make_png(832, 1216, {{"prompt", kGraph}}));
    test::set_mtime(file, 1'700'000'000);

    auto thumbnails = std::make_shared<RecordingThumbnails>();
    auto analyzer = makeAnalyzer(thumbnails);

    auto result = analyzer.analyze(file);
    REQUIRE(result.has_value());
    const auto& entry = result.value();
    const auto& rec = entry.file;

    CHECK(rec.path == file.string());
    CHECK(rec.id == crypto::fileIdForPath(file.string()));
    CHECK(rec.name == "lighthouse.png");
    CHECK(rec.folder == (dir / "shots").string());
    CHECK(rec.mtime == 1'700'000'000.0);
    CHECK(rec.type == MediaType::Image);
    CHECK(rec.dimensions == "832x1216");
    CHECK(rec.duration.empty());
    CHECK(rec.hasWorkflow);

    REQUIRE(entry.samplers.size() == 2);
    CHECK(entry.samplers[0].samplerIndex == 0);
    CHECK(entry.samplers[0].modelName == "sdxl_base");
    CHECK(entry.samplers[1].samplerIndex == 1);
    CHECK(rec.samplerNames == "dpmpp_2m, euler");
    CHECK(rec.promptPreview == "a lighthouse at ...");

    const auto key = crypto::thumbnailKey(rec.path, rec.mtime);
    REQUIRE(thumbnails->keys == std::vector<std::string>{key});
    CHECK(rec.thumbnailPath == "/thumbs/" + key + ".webp");
}

TEST_CASE("FileAnalyzer: files without metadata", "[unit][indexing][analyzer]") {
    test::TempDir dir;
    auto analyzer = makeAnalyzer();

    SECTION("plain PNG has no samplers") {
        auto file = test::write_file(dir / "plain.png", test::make_png(10, 20));
        auto result = analyzer.analyze(file);
        REQUIRE(result.has_value());
        CHECK_FALSE(result.value().file.hasWorkflow);
        CHECK(result.value().samplers.empty());
        CHECK(result.value().file.dimensions == "10x20");
        CHECK(result.value().file.promptPreview.empty());
        CHECK_FALSE(result.value().file.thumbnailPath.has_value());
    }

    SECTION("missing file is reported") {
        auto result = analyzer.analyze(dir / "gone.png");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::FileNotFound);
    }
}

TEST_CASE("FileAnalyzer: animated GIF timing", "[unit][indexing][analyzer]") {
    test::TempDir dir;
    // Three frames of 30 seconds each
    auto file = test::write_file(dir / "loop.gif", makeGif({3000, 3000, 3000}));

    SECTION("whole file within the read limit") {
        auto result = makeAnalyzer().analyze(file);
        REQUIRE(result.has_value());
        CHECK(result.value().file.type == MediaType::AnimatedImage);
        CHECK(result.value().file.dimensions == "1x1");
        CHECK(result.value().file.duration == "01:30");
    }

    SECTION("frames past the read limit are not counted") {
        AnalyzerOptions options;
        options.maxAnimationBytes = kGifHeaderBytes + 2 * kGifFrameBytes;
        auto result = makeAnalyzer(nullptr, options).analyze(file);
        REQUIRE(result.has_value());
        CHECK(result.value().file.dimensions == "1x1");
        CHECK(result.value().file.duration == "01:00");
    }

    SECTION("a single frame within the limit has no duration") {
        AnalyzerOptions options;
        options.maxAnimationBytes = kGifHeaderBytes + kGifFrameBytes + 4;
        auto result = makeAnalyzer(nullptr, options).analyze(file);
        REQUIRE(result.has_value());
        CHECK(result.value().file.duration.empty());
    }
}

TEST_CASE("FileAnalyzer: summary helpers", "[unit][indexing][analyzer]") {
    extraction::SamplerRecords samplers(2);
    samplers[0].positivePrompt = "short";
    samplers[0].samplerName = "euler";
    samplers[1].samplerName = "euler";

    CHECK(FileAnalyzer::promptPreview(samplers, 150) == "short");
    CHECK(FileAnalyzer::promptPreview(samplers, 3) == "sho...");
    CHECK(FileAnalyzer::promptPreview({}, 10).empty());
    CHECK(FileAnalyzer::samplerNames(samplers) == "euler");

    samplers[0].positivePrompt = "\xC3\xA9t\xC3\xA9 long";
    CHECK(FileAnalyzer::promptPreview(samplers, 2) == "\xC3\xA9t...");
}
