#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>
#include <mediadex/metadata/query_helpers.h>

using namespace mediadex::metadata;
using namespace mediadex::metadata::sql;

TEST_CASE("QueryHelpers: buildSelect", "[unit][metadata][sql]") {
    SECTION("defaults to all columns") {
        QuerySpec spec;
        spec.table = "files";
        CHECK(buildSelect(spec) == "SELECT * FROM files");
    }

    SECTION("full statement") {
        QuerySpec spec;
        spec.from = "files f JOIN samplers s ON s.file_id = f.id";
        spec.columns = {"s.model_name", "COUNT(DISTINCT f.id)"};
        spec.conditions = {"s.model_name IS NOT NULL", "f.folder = ?"};
        spec.groupBy = "s.model_name";
        spec.orderBy = "2 DESC";
        spec.limit = 10;
        spec.offset = 20;
        CHECK(buildSelect(spec) ==
              "SELECT s.model_name, COUNT(DISTINCT f.id) FROM files f JOIN samplers s ON "
              "s.file_id = f.id WHERE s.model_name IS NOT NULL AND f.folder = ? GROUP BY "
              "s.model_name ORDER BY 2 DESC LIMIT 10 OFFSET 20");
    }

    SECTION("offset without limit is dropped") {
        QuerySpec spec;
        spec.table = "files";
        spec.offset = 5;
        CHECK(buildSelect(spec) == "SELECT * FROM files");
    }
}

TEST_CASE("QueryHelpers: escapeLike", "[unit][metadata][sql]") {
    CHECK(escapeLike("plain") == "plain");
    CHECK(escapeLike("50%_off\\") == "50\\%\\_off\\\\");
}

TEST_CASE("QueryHelpers: metadata filter uses existential subqueries", "[unit][metadata][sql]") {
    MetadataFilter filter;

    SECTION("empty filter adds nothing") {
        auto clause = metadataFilterClause(filter);
        CHECK(clause.conditions.empty());
        CHECK(clause.params.empty());
    }

    filter.model = "sdxl_base";
    filter.stepsMin = 20;
    filter.cfgMax = 8.0;

    SECTION("one subquery per criterion") {
        auto clause = metadataFilterClause(filter);
        REQUIRE(clause.conditions.size() == 3);
        CHECK(clause.conditions[0] ==
              "EXISTS (SELECT 1 FROM samplers s WHERE s.file_id = f.id AND s.model_name = ?)");
        CHECK(clause.conditions[1] ==
              "EXISTS (SELECT 1 FROM samplers s WHERE s.file_id = f.id AND s.cfg <= ?)");
        REQUIRE(clause.params.size() == 3);
        CHECK(std::get<std::string>(clause.params[0]) == "sdxl_base");
        CHECK(std::get<double>(clause.params[1]) == 8.0);
        CHECK(std::get<int64_t>(clause.params[2]) == 20);
    }

    SECTION("same-sampler mode combines criteria in one subquery") {
        filter.match = SamplerMatch::SameSampler;
        auto clause = metadataFilterClause(filter);
        REQUIRE(clause.conditions.size() == 1);
        CHECK(clause.conditions[0] ==
              "EXISTS (SELECT 1 FROM samplers s WHERE s.file_id = f.id AND s.model_name = ? AND "
              "s.cfg <= ? AND s.steps >= ?)");
        CHECK(clause.params.size() == 3);
    }

    SECTION("empty strings are ignored") {
        MetadataFilter blank;
        blank.sampler = "";
        CHECK(metadataFilterClause(blank).conditions.empty());
    }
}

TEST_CASE("QueryHelpers: file query clause", "[unit][metadata][sql]") {
    FileQuery query;

    SECTION("exact folder scope strips trailing separators") {
        query.scope.folder = "/gallery/renders/";
        auto clause = fileQueryClause(query);
        REQUIRE(clause.conditions.size() == 1);
        CHECK(clause.conditions[0] == "f.folder = ?");
        CHECK(std::get<std::string>(clause.params[0]) == "/gallery/renders");
    }

    SECTION("recursive scope is a byte range below the folder") {
        query.scope.folder = "/gallery/100%_done/";
        query.scope.recursive = true;
        auto clause = fileQueryClause(query);
        REQUIRE(clause.conditions.size() == 1);
        CHECK(clause.conditions[0] == "(f.folder = ? OR (f.folder >= ? AND f.folder < ?))");
        REQUIRE(clause.params.size() == 3);
        CHECK(std::get<std::string>(clause.params[0]) == "/gallery/100%_done");
        CHECK(std::get<std::string>(clause.params[1]) == "/gallery/100%_done/");
        CHECK(std::get<std::string>(clause.params[2]) == "/gallery/100%_done0");
    }

    SECTION("recursive root scope covers every absolute folder") {
        query.scope.folder = "/";
        query.scope.recursive = true;
        auto clause = fileQueryClause(query);
        REQUIRE(clause.params.size() == 3);
        CHECK(std::get<std::string>(clause.params[0]) == "/");
        CHECK(std::get<std::string>(clause.params[1]) == "/");
        CHECK(std::get<std::string>(clause.params[2]) == "0");
    }

    SECTION("search, favourites, prefixes and extensions") {
        query.search = "  fox ";
        query.favoritesOnly = true;
        query.prefixes = {"upscaled", " "};
        query.extensions = {".PNG", "webp"};
        auto clause = fileQueryClause(query);

        REQUIRE(clause.conditions.size() == 4);
        CHECK(clause.conditions[0] == "f.name LIKE ? ESCAPE '\\'");
        CHECK(clause.conditions[1] == "f.is_favorite = 1");
        CHECK(clause.conditions[2] == "(f.name LIKE ? ESCAPE '\\')");
        CHECK(clause.conditions[3] == "(f.name LIKE ? ESCAPE '\\' OR f.name LIKE ? ESCAPE '\\')");

        REQUIRE(clause.params.size() == 4);
        CHECK(std::get<std::string>(clause.params[0]) == "%fox%");
        CHECK(std::get<std::string>(clause.params[1]) == "upscaled\\_%");
        CHECK(std::get<std::string>(clause.params[2]) == "%.png");
        CHECK(std::get<std::string>(clause.params[3]) == "%.webp");
    }

    SECTION("parameters follow condition order") {
        query.scope.folder = "/g";
        query.metadata.sampler = "euler";
        query.search = "x";
        auto clause = fileQueryClause(query);
        REQUIRE(clause.params.size() == 3);
        CHECK(std::get<std::string>(clause.params[0]) == "/g");
        CHECK(std::get<std::string>(clause.params[1]) == "euler");
        CHECK(std::get<std::string>(clause.params[2]) == "%x%");
    }
}
