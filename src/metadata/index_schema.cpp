#include <utility>
#include <string>
#include <mediadex/metadata/index_schema.h>

namespace mediadex::metadata {

namespace {

Result<bool> columnExists(Database& db, const std::string& table, const std::string& column) {
    auto stmtResult = db.prepare("SELECT 1 FROM pragma_table_info(?) WHERE name = ?");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto bound = stmt.bindAll(table, column);
    if (!bound)
        return bound.error();
    return stmt.step();
}

Migration createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Initial files and samplers tables";
    m.upSQL = R"(
        CREATE TABLE IF NOT EXISTS files (
            id TEXT PRIMARY KEY,
            path TEXT NOT NULL UNIQUE,
            mtime REAL NOT NULL,
            name TEXT NOT NULL,
            type TEXT,
            duration TEXT,
            dimensions TEXT,
            has_workflow INTEGER NOT NULL DEFAULT 0,
            is_favorite INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS samplers (
            file_id TEXT PRIMARY KEY REFERENCES files(id) ON DELETE CASCADE,
            model_name TEXT,
            sampler_name TEXT,
            scheduler TEXT,
            positive_prompt TEXT,
            negative_prompt TEXT,
            width INTEGER,
            height INTEGER,
            cfg REAL,
            steps INTEGER
        );
    )";
    return m;
}

Migration addSummaryColumns() {
    Migration m;
    m.version = 2;
    m.name = "Add preview, sampler summary, thumbnail and folder columns";
    m.upFunc = [](Database& db) -> Result<void> {
        const std::pair<const char*, const char*> columns[] = {
            {"prompt_preview", "TEXT"},
            {"sampler_names", "TEXT"},
            {"thumbnail_path", "TEXT"},
            {"folder", "TEXT NOT NULL DEFAULT ''"},
        };
        for (const auto& [name, type] : columns) {
            auto exists = columnExists(db, "files", name);
            if (!exists)
                return exists.error();
            if (exists.value())
                continue;
            auto added =
                db.execute(std::string("ALTER TABLE files ADD COLUMN ") + name + " " + type);
            if (!added)
                return added;
        }
        // Parent directory: path up to its last '/'
        return db.execute(R"(
            UPDATE files SET folder = CASE
                WHEN instr(path, '/') = 0 THEN ''
                WHEN length(rtrim(path, replace(path, '/', ''))) = 1 THEN '/'
                ELSE substr(path, 1, length(rtrim(path, replace(path, '/', ''))) - 1)
            END
            WHERE folder = ''
        )");
    };
    return m;
}

Migration restructureSamplers() {
    Migration m;
    m.version = 3;
    m.name = "Allow several samplers per file";
    m.backupTables = {"samplers"};
    m.upFunc = [](Database& db) -> Result<void> {
        auto hasIndex = columnExists(db, "samplers", "sampler_index");
        if (!hasIndex)
            return hasIndex.error();
        if (hasIndex.value())
            return {};

        return db.execute(R"(
            CREATE TABLE samplers_new (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                file_id TEXT NOT NULL REFERENCES files(id) ON DELETE CASCADE ON UPDATE CASCADE,
                sampler_index INTEGER NOT NULL DEFAULT 0,
                model_name TEXT,
                sampler_name TEXT,
                scheduler TEXT,
                positive_prompt TEXT,
                negative_prompt TEXT,
                width INTEGER,
                height INTEGER,
                cfg REAL,
                steps INTEGER,
                UNIQUE(file_id, sampler_index)
            );

            INSERT INTO samplers_new (file_id, sampler_index, model_name, sampler_name,
                                      scheduler, positive_prompt, negative_prompt,
                                      width, height, cfg, steps)
            SELECT file_id, 0, model_name, sampler_name, scheduler, positive_prompt,
                   negative_prompt, width, height, cfg, steps
            FROM samplers;

            DROP TABLE samplers;
            ALTER TABLE samplers_new RENAME TO samplers;
        )");
    };
    return m;
}

Migration createIndices() {
    Migration m;
    m.version = 4;
    m.name = "Secondary indices";
    m.upSQL = R"(
        CREATE INDEX IF NOT EXISTS idx_files_name ON files(name);
        CREATE INDEX IF NOT EXISTS idx_files_mtime ON files(mtime DESC);
        CREATE INDEX IF NOT EXISTS idx_files_type ON files(type);
        CREATE INDEX IF NOT EXISTS idx_files_favorite ON files(is_favorite);
        CREATE INDEX IF NOT EXISTS idx_files_path ON files(path);
        CREATE INDEX IF NOT EXISTS idx_files_folder ON files(folder);

        CREATE INDEX IF NOT EXISTS idx_samplers_file_id ON samplers(file_id);
        CREATE INDEX IF NOT EXISTS idx_samplers_model ON samplers(model_name);
        CREATE INDEX IF NOT EXISTS idx_samplers_sampler ON samplers(sampler_name);
        CREATE INDEX IF NOT EXISTS idx_samplers_scheduler ON samplers(scheduler);
        CREATE INDEX IF NOT EXISTS idx_samplers_cfg ON samplers(cfg);
        CREATE INDEX IF NOT EXISTS idx_samplers_steps ON samplers(steps);
        CREATE INDEX IF NOT EXISTS idx_samplers_width ON samplers(width);
        CREATE INDEX IF NOT EXISTS idx_samplers_height ON samplers(height);
    )";
    return m;
}

} // namespace

std::vector<Migration> indexMigrations() {
    return {createInitialSchema(), addSummaryColumns(), restructureSamplers(), createIndices()};
}

} // namespace mediadex::metadata
