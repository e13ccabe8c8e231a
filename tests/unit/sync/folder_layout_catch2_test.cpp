#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include "common/test_helpers_catch2.h"
#include <mediadex/sync/folder_layout.h>

using namespace mediadex;
using namespace mediadex::sync;

TEST_CASE("FolderLayoutCache: keys round-trip", "[unit][sync][layout]") {
    CHECK(FolderLayoutCache::keyFor("") == kRootFolderKey);
    CHECK(FolderLayoutCache::relativePathFor(kRootFolderKey).value().empty());

    const std::string rel = "2024/portraits?";
    auto key = FolderLayoutCache::keyFor(rel);
    CHECK(key.find('/') == std::string::npos);
    CHECK(key.find('+') == std::string::npos);
    CHECK(FolderLayoutCache::relativePathFor(key).value() == rel);

    CHECK(FolderLayoutCache::relativePathFor("!!!!").error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("FolderLayoutCache: scans the tree root first", "[unit][sync][layout]") {
    test::TempDir dir;
    const auto root = dir / "out";
    std::filesystem::create_directories(root / "b" / "nested");
    std::filesystem::create_directories(root / "a");
    std::filesystem::create_directories(root / "_thumbs" / "inner");

    FolderLayoutCache cache(root / "", {"_thumbs"});
    auto layout = cache.get();
    REQUIRE(layout->folders.size() == 4);

    const auto& rootInfo = layout->folders[0];
    CHECK(rootInfo.key == kRootFolderKey);
    CHECK(rootInfo.path == normalizedFolder(root));
    CHECK_FALSE(rootInfo.parentKey.has_value());
    CHECK(rootInfo.children.size() == 2);

    CHECK(layout->folders[1].relativePath == "a");
    CHECK(layout->folders[2].relativePath == "b");
    const auto& nested = layout->folders[3];
    CHECK(nested.relativePath == "b/nested");
    CHECK(nested.depth == 1);
    CHECK(nested.displayName == "nested");
    CHECK(nested.parentKey == FolderLayoutCache::keyFor("b"));

    CHECK(layout->find(FolderLayoutCache::keyFor("b/nested")) == &nested);
    CHECK(layout->findByPath(root / "b" / "nested" / "") == &nested);
    CHECK(layout->find(FolderLayoutCache::keyFor("_thumbs")) == nullptr);

    SECTION("snapshots are shared until invalidated") {
        CHECK(cache.get() == layout);
        std::filesystem::create_directories(root / "c");
        CHECK(cache.get()->folders.size() == 4);

        cache.invalidate();
        auto refreshed = cache.get();
        CHECK(refreshed != layout);
        CHECK(refreshed->folders.size() == 5);
        CHECK(layout->folders.size() == 4);
    }
}

TEST_CASE("FolderLayoutCache: missing root yields only the root entry", "[unit][sync][layout]") {
    test::TempDir dir;
    FolderLayoutCache cache(dir / "absent", {});
    auto layout = cache.get();
    REQUIRE(layout->folders.size() == 1);
    CHECK(layout->folders[0].key == kRootFolderKey);
}
