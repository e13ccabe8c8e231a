#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>
#include "common/test_helpers_catch2.h"
#include <mediadex/config/config_helpers.h>
#include <mediadex/config/gallery_config.h>
#include <mediadex/config/logging.h>

using namespace mediadex;
using namespace mediadex::config;
using mediadex::test::ScopedEnvVar;

namespace {

// Variables the loader reads that the tests below set explicitly
struct CleanEnv {
    ScopedEnvVar output{"MEDIADEX_OUTPUT_PATH", std::nullopt};
    ScopedEnvVar input{"MEDIADEX_INPUT_PATH", std::nullopt};
    ScopedEnvVar batch{"MEDIADEX_BATCH_SIZE", std::nullopt};
    ScopedEnvVar workers{"MEDIADEX_MAX_WORKERS", std::nullopt};
    ScopedEnvVar video{"MEDIADEX_VIDEO_EXTENSIONS", std::nullopt};
    ScopedEnvVar debug{"MEDIADEX_DEBUG_EXTRACTION", std::nullopt};
    ScopedEnvVar ttl{"MEDIADEX_FILTER_OPTIONS_TTL", std::nullopt};
    ScopedEnvVar dataDir{"MEDIADEX_DATA_DIR", std::nullopt};
    ScopedEnvVar logFile{"MEDIADEX_LOG_FILE", std::nullopt};
};

} // namespace

TEST_CASE("Config: parse_config_value reads sections and dotted keys", "[unit][config]") {
    test::TempDir dir;
    auto file = test::write_file(dir / "config.toml", R"(# gallery settings
[gallery]
output_path = "/srv/out"   # trailing comment
name = 'a # not a comment'

[sync]
batch_size = 250
cache.filter_options_size = 7
)");

    CHECK(parse_config_value(file, "gallery", "output_path") == "/srv/out");
    CHECK(parse_config_value(file, "gallery", "name") == "a # not a comment");
    CHECK(parse_config_value(file, "sync", "batch_size") == "250");
    CHECK(parse_config_value(file, "gallery", "batch_size").empty());
    CHECK(parse_config_value(file, "cache", "filter_options_size") == "7");
    CHECK(parse_config_value(dir / "missing.toml", "gallery", "output_path").empty());
}

TEST_CASE("Config: string lists accept both notations", "[unit][config]") {
    CHECK(parse_string_list(".mp4, .mkv") == std::vector<std::string>{".mp4", ".mkv"});
    CHECK(parse_string_list(R"([".mp4", 'webm', ""])") ==
          std::vector<std::string>{".mp4", "webm"});
    CHECK(parse_string_list("  ").empty());
}

TEST_CASE("Config: load layers environment over file over defaults", "[unit][config]") {
    CleanEnv clean;
    test::TempDir dir;
    std::filesystem::create_directories(dir / "out");
    std::filesystem::create_directories(dir / "other");
    auto file = test::write_file(dir / "config.toml",
                                 "[gallery]\noutput_path = \"" + (dir / "out").string() +
                                     "\"\n[sync]\nbatch_size = 250\nmax_workers = 0\n"
                                     "[media]\nvideo_extensions = [\"MP4\", \".webm\"]\n"
                                     "[core]\ndata_dir = \"" + (dir / "data").string() + "\"\n");

    SECTION("file values") {
        auto cfg = loadGalleryConfig(file.string());
        REQUIRE(cfg.has_value());
        const auto& c = cfg.value();
        CHECK(c.outputPath == dir / "out");
        CHECK(c.batchSize == 250);
        CHECK(c.maxWorkers == 1);
        CHECK(c.pageSize == 100);
        CHECK(c.videoExtensions == std::vector<std::string>{".mp4", ".webm"});
        CHECK(c.dataDir == dir / "data");
        CHECK(c.databasePath() == dir / "data" / ".sqlite_cache" / "gallery_cache.sqlite");
        CHECK(c.debugDir == dir / "out" / "workflow_debug");
        CHECK(c.logging.file == dir / "data" / "logs" / "mediadex.log");
        CHECK(c.sidecarDir().empty());
    }

    SECTION("environment wins") {
        ScopedEnvVar output("MEDIADEX_OUTPUT_PATH", (dir / "other").string());
        ScopedEnvVar input("MEDIADEX_INPUT_PATH", (dir / "in").string());
        ScopedEnvVar batch("MEDIADEX_BATCH_SIZE", std::string("32"));
        ScopedEnvVar debug("MEDIADEX_DEBUG_EXTRACTION", std::string("Yes"));
        auto cfg = loadGalleryConfig(file.string());
        REQUIRE(cfg.has_value());
        CHECK(cfg.value().outputPath == dir / "other");
        CHECK(cfg.value().batchSize == 32);
        CHECK(cfg.value().debugExtraction);
        CHECK(cfg.value().sidecarDir() == dir / "in" / "workflow_logs_success");
    }

    SECTION("invalid numbers keep defaults") {
        ScopedEnvVar batch("MEDIADEX_BATCH_SIZE", std::string("lots"));
        ScopedEnvVar ttl("MEDIADEX_FILTER_OPTIONS_TTL", std::string("-5"));
        auto cfg = loadGalleryConfig(file.string());
        REQUIRE(cfg.has_value());
        CHECK(cfg.value().batchSize == 500);
        CHECK(cfg.value().filterOptionsTtl == std::chrono::seconds(300));
    }
}

TEST_CASE("Config: output path is required", "[unit][config]") {
    CleanEnv clean;
    test::TempDir dir;
    auto empty = test::write_file(dir / "config.toml", "[sync]\nbatch_size = 10\n");

    auto missing = loadGalleryConfig(empty.string());
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::InvalidArgument);

    ScopedEnvVar output("MEDIADEX_OUTPUT_PATH", (dir / "nope").string());
    auto notDir = loadGalleryConfig(empty.string());
    REQUIRE_FALSE(notDir.has_value());
    CHECK(notDir.error().code == ErrorCode::InvalidArgument);

    auto noFile = loadGalleryConfig((dir / "absent.toml").string());
    REQUIRE_FALSE(noFile.has_value());
    CHECK(noFile.error().code == ErrorCode::FileNotFound);
}

TEST_CASE("Config: log levels", "[unit][config]") {
    CHECK(parseLogLevel("debug") == spdlog::level::debug);
    CHECK(parseLogLevel("warning") == spdlog::level::warn);
    CHECK(parseLogLevel("error") == spdlog::level::err);
    CHECK_FALSE(parseLogLevel("loud").has_value());
}
