#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <mediadex/metadata/database.h>
#include <mediadex/metadata/index_schema.h>
#include <mediadex/metadata/migration.h>

using namespace mediadex;
using namespace mediadex::metadata;

namespace {

struct MemoryDb {
    MemoryDb() {
        auto opened = db.open(":memory:", ConnectionMode::Memory);
        REQUIRE(opened.has_value());
    }

    int64_t scalar(const std::string& sql) {
        auto stmt = db.prepare(sql);
        REQUIRE(stmt.has_value());
        auto s = std::move(stmt).value();
        auto row = s.step();
        REQUIRE(row.has_value());
        REQUIRE(row.value());
        return s.getInt64(0);
    }

    bool hasIndex(const std::string& name) {
        return scalar("SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name='" + name +
                      "'") == 1;
    }

    Database db;
};

Migration createWidgets() {
    Migration m;
    m.version = 1;
    m.name = "widgets";
    m.upSQL = R"(
        CREATE TABLE widgets (id INTEGER PRIMARY KEY, label TEXT NOT NULL);
        CREATE INDEX idx_widgets_label ON widgets(label);
        INSERT INTO widgets (label) VALUES ('a'), ('b'), ('c');
    )";
    return m;
}

} // namespace

TEST_CASE("MigrationManager: fresh database reaches the latest schema", "[unit][metadata][migration]") {
    MemoryDb mem;
    MigrationManager manager(mem.db);
    REQUIRE(manager.initialize().has_value());
    manager.registerMigrations(indexMigrations());

    CHECK(manager.getCurrentVersion().value() == 0);
    CHECK(manager.needsMigration().value());
    REQUIRE(manager.migrate().has_value());

    CHECK(manager.getCurrentVersion().value() == kIndexSchemaVersion);
    CHECK(mem.db.userVersion().value() == kIndexSchemaVersion);
    CHECK_FALSE(manager.needsMigration().value());
    CHECK(mem.scalar("SELECT COUNT(*) FROM pragma_table_info('samplers') "
                     "WHERE name = 'sampler_index'") == 1);
    CHECK(mem.hasIndex("idx_samplers_model"));
    CHECK(mem.hasIndex("idx_files_folder"));

    auto history = manager.getHistory();
    REQUIRE(history.has_value());
    REQUIRE(history.value().size() == static_cast<size_t>(kIndexSchemaVersion));
    for (const auto& entry : history.value()) {
        CHECK(entry.success);
    }

    SECTION("migrating again is a no-op") {
        REQUIRE(manager.migrate().has_value());
        CHECK(manager.getHistory().value().size() == static_cast<size_t>(kIndexSchemaVersion));
    }
}

TEST_CASE("MigrationManager: legacy rows survive the upgrade", "[unit][metadata][migration]") {
    MemoryDb mem;
    MigrationManager manager(mem.db);
    REQUIRE(manager.initialize().has_value());
    manager.registerMigrations(indexMigrations());
    REQUIRE(manager.migrateTo(1).has_value());

    REQUIRE(mem.db
                .execute("INSERT INTO files (id, path, mtime, name) "
                         "VALUES ('f1', '/gallery/set/a.png', 100, 'a.png');"
                         "INSERT INTO samplers (file_id, model_name, steps) "
                         "VALUES ('f1', 'sdxl_base', 30);")
                .has_value());

    REQUIRE(manager.migrate().has_value());

    CHECK(mem.scalar("SELECT COUNT(*) FROM samplers WHERE file_id = 'f1' AND sampler_index = 0 "
                     "AND model_name = 'sdxl_base' AND steps = 30") == 1);
    CHECK(mem.scalar("SELECT COUNT(*) FROM files WHERE folder = '/gallery/set'") == 1);
    CHECK(mem.scalar("SELECT COUNT(*) FROM sqlite_master WHERE name = 'samplers_backup'") == 0);

    SECTION("a second sampler row per file is now accepted") {
        CHECK(mem.db
                  .execute("INSERT INTO samplers (file_id, sampler_index, model_name) "
                           "VALUES ('f1', 1, 'refiner')")
                  .has_value());
        CHECK_FALSE(mem.db
                        .execute("INSERT INTO samplers (file_id, sampler_index) VALUES ('f1', 1)")
                        .has_value());
    }
}

TEST_CASE("MigrationManager: failed migration restores backed-up tables", "[unit][metadata][migration]") {
    MemoryDb mem;
    MigrationManager manager(mem.db);
    REQUIRE(manager.initialize().has_value());
    manager.registerMigration(createWidgets());

    Migration broken;
    broken.version = 2;
    broken.name = "broken restructure";
    broken.backupTables = {"widgets"};

    SECTION("error result") {
        broken.upFunc = [](Database& db) -> Result<void> {
            auto dropped = db.execute("DROP TABLE widgets");
            if (!dropped)
                return dropped;
            return Error{ErrorCode::InvalidData, "simulated failure"};
        };
    }
    SECTION("exception") {
        broken.upFunc = [](Database& db) -> Result<void> {
            auto dropped = db.execute("DELETE FROM widgets");
            if (!dropped)
                return dropped;
            throw std::runtime_error("simulated crash");
        };
    }
    manager.registerMigration(broken);

    auto result = manager.migrate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::MigrationFailed);

    CHECK(mem.db.tableExists("widgets").value());
    CHECK(mem.scalar("SELECT COUNT(*) FROM widgets") == 3);
    CHECK(mem.hasIndex("idx_widgets_label"));
    CHECK_FALSE(mem.db.tableExists("widgets_backup").value());

    CHECK(manager.getCurrentVersion().value() == 1);
    auto history = manager.getHistory().value();
    REQUIRE(history.size() == 2);
    CHECK_FALSE(history[1].success);
    CHECK_FALSE(history[1].error.empty());
}

TEST_CASE("Database: statements bind, step and roll back", "[unit][metadata][database]") {
    MemoryDb mem;
    REQUIRE(mem.db.execute("CREATE TABLE kv (k TEXT PRIMARY KEY, v INTEGER, d REAL)").has_value());

    SECTION("bound values round through a select") {
        auto insert = mem.db.prepare("INSERT INTO kv (k, v, d) VALUES (?, ?, ?)");
        REQUIRE(insert.has_value());
        auto stmt = std::move(insert).value();
        REQUIRE(stmt.bindAll("a", int64_t{7}, std::optional<double>{}).has_value());
        REQUIRE(stmt.execute().has_value());
        CHECK(mem.db.changes() == 1);

        auto select = mem.db.prepare("SELECT v, d FROM kv WHERE k = ?");
        REQUIRE(select.has_value());
        auto query = std::move(select).value();
        REQUIRE(query.bind(1, std::string("a")).has_value());
        REQUIRE(query.step().value());
        CHECK(query.getInt64(0) == 7);
        CHECK_FALSE(query.getOptionalDouble(1).has_value());
    }

    SECTION("binding past the last parameter is an error") {
        auto stmt = mem.db.prepare("SELECT k FROM kv WHERE k = ?");
        REQUIRE(stmt.has_value());
        auto s = std::move(stmt).value();
        auto bound = s.bind(2, 1);
        REQUIRE_FALSE(bound.has_value());
        CHECK(bound.error().code == ErrorCode::DatabaseError);
        CHECK(bound.error().message.find("parameter 2") != std::string::npos);
    }

    SECTION("a failing transaction body leaves no rows") {
        auto result = mem.db.transaction([&]() -> Result<void> {
            auto r = mem.db.execute("INSERT INTO kv (k, v) VALUES ('x', 1)");
            if (!r)
                return r;
            return mem.db.execute("INSERT INTO kv (k, v) VALUES ('x', 2)");
        });
        REQUIRE_FALSE(result.has_value());
        CHECK_FALSE(mem.db.inTransaction());
        CHECK(mem.scalar("SELECT COUNT(*) FROM kv") == 0);
    }
}
