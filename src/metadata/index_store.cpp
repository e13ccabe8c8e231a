#include <spdlog/spdlog.h>
#include <filesystem>
#include <string>
#include <mediadex/crypto/hasher.h>
#include <mediadex/metadata/index_schema.h>
#include <mediadex/metadata/index_store.h>
#include <mediadex/metadata/migration.h>
#include <mediadex/metadata/query_helpers.h>

namespace mediadex::metadata {

namespace {

constexpr const char* kFileColumns =
    "f.id, f.path, f.mtime, f.name, f.type, f.duration, f.dimensions, f.has_workflow, "
    "f.is_favorite, f.prompt_preview, f.sampler_names, f.thumbnail_path, f.folder";
constexpr int kFileColumnCount = 13;

constexpr const char* kUpsertFileSql = R"(
    INSERT INTO files (id, path, mtime, name, type, duration, dimensions, has_workflow,
                       is_favorite, prompt_preview, sampler_names, thumbnail_path, folder)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(path) DO UPDATE SET
        mtime = excluded.mtime,
        name = excluded.name,
        type = excluded.type,
        duration = excluded.duration,
        dimensions = excluded.dimensions,
        has_workflow = excluded.has_workflow,
        prompt_preview = excluded.prompt_preview,
        sampler_names = excluded.sampler_names,
        thumbnail_path = COALESCE(excluded.thumbnail_path, files.thumbnail_path),
        folder = excluded.folder
)";

constexpr const char* kInsertSamplerSql = R"(
    INSERT INTO samplers (file_id, sampler_index, model_name, sampler_name, scheduler,
                          positive_prompt, negative_prompt, width, height, cfg, steps)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
)";

FileRecord readFileRecord(const Statement& stmt) {
    FileRecord file;
    file.id = stmt.getString(0);
    file.path = stmt.getString(1);
    file.mtime = stmt.getDouble(2);
    file.name = stmt.getString(3);
    file.type = parseMediaType(stmt.getString(4));
    file.duration = stmt.getString(5);
    file.dimensions = stmt.getString(6);
    file.hasWorkflow = stmt.getInt(7) != 0;
    file.isFavorite = stmt.getInt(8) != 0;
    file.promptPreview = stmt.getString(9);
    file.samplerNames = stmt.getString(10);
    file.thumbnailPath = stmt.getOptionalString(11);
    file.folder = stmt.getString(12);
    return file;
}

Result<void> upsertFileRows(Database& db, const std::vector<FileRecord>& files) {
    auto stmtResult = db.prepare(kUpsertFileSql);
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();

    for (const auto& f : files) {
        auto bound = stmt.bindAll(f.id, f.path, f.mtime, f.name, mediaTypeName(f.type),
                                  f.duration, f.dimensions, f.hasWorkflow ? 1 : 0,
                                  f.isFavorite ? 1 : 0, f.promptPreview, f.samplerNames,
                                  f.thumbnailPath, f.folder);
        if (!bound)
            return bound;
        auto executed = stmt.execute();
        if (!executed)
            return executed;
        auto reset = stmt.reset();
        if (!reset)
            return reset;
    }
    return {};
}

Result<void> replaceSamplerRows(Statement& deleteStmt, Statement& insertStmt, const FileId& fileId,
                                const extraction::SamplerRecords& samplers) {
    auto bound = deleteStmt.bind(1, fileId);
    if (!bound)
        return bound;
    auto deleted = deleteStmt.execute();
    if (!deleted)
        return deleted;
    auto reset = deleteStmt.reset();
    if (!reset)
        return reset;

    for (const auto& s : samplers) {
        auto b = insertStmt.bindAll(fileId, s.samplerIndex, s.modelName, s.samplerName,
                                    s.scheduler, s.positivePrompt, s.negativePrompt, s.width,
                                    s.height, s.cfg, s.steps);
        if (!b)
            return b;
        auto executed = insertStmt.execute();
        if (!executed)
            return executed;
        auto r = insertStmt.reset();
        if (!r)
            return r;
    }
    return {};
}

struct SamplerStatements {
    Statement deleteStmt;
    Statement insertStmt;
};

Result<SamplerStatements> prepareSamplerStatements(Database& db) {
    auto del = db.prepare("DELETE FROM samplers WHERE file_id = ?");
    if (!del)
        return del.error();
    auto ins = db.prepare(kInsertSamplerSql);
    if (!ins)
        return ins.error();
    return SamplerStatements{std::move(del).value(), std::move(ins).value()};
}

// Run one statement per key, summing affected rows
Result<int64_t> executeForEach(Database& db, const std::string& sql,
                               const std::vector<std::string>& keys) {
    auto stmtResult = db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();

    int64_t affected = 0;
    auto txn = db.transaction([&]() -> Result<void> {
        for (const auto& key : keys) {
            auto bound = stmt.bind(1, key);
            if (!bound)
                return bound;
            auto executed = stmt.execute();
            if (!executed)
                return executed;
            affected += db.changes();
            auto reset = stmt.reset();
            if (!reset)
                return reset;
        }
        return {};
    });
    if (!txn)
        return txn.error();
    return affected;
}

Result<std::vector<std::pair<std::string, int64_t>>>
distinctCounts(Database& db, const std::string& column, const sql::Clause& scope) {
    sql::QuerySpec spec;
    spec.from = "samplers s JOIN files f ON f.id = s.file_id";
    spec.columns = {"s." + column, "COUNT(DISTINCT s.file_id) AS file_count"};
    spec.conditions = {"s." + column + " IS NOT NULL", "s." + column + " != ''"};
    spec.conditions.insert(spec.conditions.end(), scope.conditions.begin(), scope.conditions.end());
    spec.groupBy = "s." + column;
    spec.orderBy = "file_count DESC, s." + column + " ASC";

    auto stmtResult = db.prepare(sql::buildSelect(spec));
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto bound = sql::bindParams(stmt, scope.params);
    if (!bound)
        return bound.error();

    std::vector<std::pair<std::string, int64_t>> values;
    while (true) {
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        values.emplace_back(stmt.getString(0), stmt.getInt64(1));
    }
    return values;
}

std::string orderByFor(const PageRequest& page) {
    const char* dir = page.direction == SortDirection::Ascending ? "ASC" : "DESC";
    if (page.sort == SortKey::Name)
        return std::string("f.name COLLATE NOCASE ") + dir + ", f.path " + dir;
    return std::string("f.mtime ") + dir + ", f.name " + dir;
}

} // namespace

IndexStore::IndexStore(std::string dbPath, const ConnectionPoolConfig& poolConfig)
    : dbPath_(std::move(dbPath)), poolConfig_(poolConfig) {}

IndexStore::~IndexStore() {
    close();
}

Result<void> IndexStore::requireInitialized() const {
    if (!initialized_.load() || !pool_) {
        return Error{ErrorCode::NotInitialized, "Index store is not initialized"};
    }
    return {};
}

Result<void> IndexStore::initialize() {
    if (initialized_.load())
        return {};

    std::error_code ec;
    auto parent = std::filesystem::path(dbPath_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::PermissionDenied,
                         "Cannot create index directory " + parent.string() + ": " + ec.message()};
        }
    }

    auto pool = std::make_unique<ConnectionPool>(dbPath_, poolConfig_);
    auto poolInit = pool->initialize();
    if (!poolInit)
        return poolInit;

    auto migrated = pool->withConnection([this](Database& db) -> Result<void> {
        MigrationManager manager(db);
        auto init = manager.initialize();
        if (!init)
            return init;
        manager.registerMigrations(indexMigrations());

        auto before = manager.getCurrentVersion();
        if (!before)
            return before.error();

        auto result = manager.migrate();
        if (!result)
            return result;

        if (before.value() < manager.getLatestVersion()) {
            spdlog::info("[IndexStore] schema migrated from version {} to {}", before.value(),
                         manager.getLatestVersion());
            needsRescan_ = true;
        }
        return {};
    });
    if (!migrated) {
        spdlog::error("[IndexStore] failed to prepare {}: {}", dbPath_, migrated.error().message);
        pool->shutdown();
        return migrated;
    }

    pool_ = std::move(pool);
    initialized_ = true;
    spdlog::info("[IndexStore] opened {}", dbPath_);
    return {};
}

void IndexStore::close() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    initialized_ = false;
    if (pool_) {
        pool_->shutdown();
        pool_.reset();
    }
}

Result<int> IndexStore::schemaVersion() {
    return withRead([](Database& db) { return db.userVersion(); });
}

Result<void> IndexStore::upsertFiles(const std::vector<FileRecord>& files) {
    return withWrite([&](Database& db) {
        return db.transaction([&]() { return upsertFileRows(db, files); });
    });
}

Result<void> IndexStore::replaceSamplers(const FileId& fileId,
                                         const extraction::SamplerRecords& samplers) {
    return withWrite([&](Database& db) -> Result<void> {
        auto stmts = prepareSamplerStatements(db);
        if (!stmts)
            return stmts.error();
        auto s = std::move(stmts).value();
        return db.transaction([&]() {
            return replaceSamplerRows(s.deleteStmt, s.insertStmt, fileId, samplers);
        });
    });
}

Result<void> IndexStore::commitBatch(const std::vector<IndexEntry>& entries) {
    if (entries.empty()) {
        return requireInitialized();
    }
    return withWrite([&](Database& db) -> Result<void> {
        auto stmts = prepareSamplerStatements(db);
        if (!stmts)
            return stmts.error();
        auto s = std::move(stmts).value();

        std::vector<FileRecord> files;
        files.reserve(entries.size());
        for (const auto& e : entries)
            files.push_back(e.file);

        auto committed = db.transaction([&]() -> Result<void> {
            auto upserted = upsertFileRows(db, files);
            if (!upserted)
                return upserted;
            for (const auto& e : entries) {
                auto replaced =
                    replaceSamplerRows(s.deleteStmt, s.insertStmt, e.file.id, e.samplers);
                if (!replaced)
                    return replaced;
            }
            return {};
        });
        if (!committed) {
            spdlog::error("[IndexStore] batch of {} files rolled back: {}", entries.size(),
                          committed.error().message);
            return Error{ErrorCode::TransactionFailed, committed.error().message};
        }
        return {};
    });
}

Result<int64_t> IndexStore::deleteByPath(const std::vector<std::string>& paths) {
    if (paths.empty()) {
        if (auto ready = requireInitialized(); !ready)
            return ready.error();
        return int64_t{0};
    }
    return withWrite(
        [&](Database& db) { return executeForEach(db, "DELETE FROM files WHERE path = ?", paths); });
}

Result<int64_t> IndexStore::deleteById(const std::vector<FileId>& ids) {
    if (ids.empty()) {
        if (auto ready = requireInitialized(); !ready)
            return ready.error();
        return int64_t{0};
    }
    return withWrite(
        [&](Database& db) { return executeForEach(db, "DELETE FROM files WHERE id = ?", ids); });
}

Result<int64_t> IndexStore::setFavorite(const std::vector<FileId>& ids, bool favorite) {
    if (ids.empty()) {
        if (auto ready = requireInitialized(); !ready)
            return ready.error();
        return int64_t{0};
    }
    const std::string sql = favorite ? "UPDATE files SET is_favorite = 1 WHERE id = ?"
                                     : "UPDATE files SET is_favorite = 0 WHERE id = ?";
    return withWrite([&](Database& db) { return executeForEach(db, sql, ids); });
}

Result<FileRecord> IndexStore::relocate(const FileId& oldId, const std::string& newPath) {
    return withWrite([&](Database& db) -> Result<FileRecord> {
        std::filesystem::path p(newPath);
        const FileId newId = crypto::fileIdForPath(newPath);
        const std::string name = p.filename().string();
        const std::string folder = p.parent_path().string();

        auto txn = db.transaction([&]() -> Result<void> {
            auto stmtResult =
                db.prepare("UPDATE files SET id = ?, path = ?, name = ?, folder = ? WHERE id = ?");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();
            auto bound = stmt.bindAll(newId, newPath, name, folder, oldId);
            if (!bound)
                return bound;
            auto executed = stmt.execute();
            if (!executed)
                return executed;
            if (db.changes() == 0)
                return Error{ErrorCode::NotFound, "No indexed file with id " + oldId};
            return {};
        });
        if (!txn)
            return txn.error();

        auto stmtResult = db.prepare(std::string("SELECT ") + kFileColumns +
                                     " FROM files f WHERE f.id = ?");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = stmt.bind(1, newId);
        if (!bound)
            return bound.error();
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (!row.value())
            return Error{ErrorCode::InternalError, "Relocated row vanished: " + newId};
        return readFileRecord(stmt);
    });
}

Result<int64_t> IndexStore::countMatching(const FileQuery& query) {
    return withRead([&](Database& db) -> Result<int64_t> {
        auto clause = sql::fileQueryClause(query);
        sql::QuerySpec spec;
        spec.table = "files f";
        spec.columns = {"COUNT(*)"};
        spec.conditions = clause.conditions;

        auto stmtResult = db.prepare(sql::buildSelect(spec));
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = sql::bindParams(stmt, clause.params);
        if (!bound)
            return bound.error();
        auto row = stmt.step();
        if (!row)
            return row.error();
        return row.value() ? stmt.getInt64(0) : int64_t{0};
    });
}

Result<Page> IndexStore::queryPage(const FileQuery& query, const PageRequest& page) {
    if (page.limit <= 0 || page.offset < 0) {
        return Error{ErrorCode::InvalidArgument, "Page limit must be positive and offset >= 0"};
    }
    auto total = countMatching(query);
    if (!total)
        return total.error();

    return withRead([&](Database& db) -> Result<Page> {
        auto clause = sql::fileQueryClause(query);
        sql::QuerySpec spec;
        spec.table = "files f";
        spec.columns = {kFileColumns,
                        "(SELECT COUNT(*) FROM samplers sc WHERE sc.file_id = f.id)"};
        spec.conditions = clause.conditions;
        spec.orderBy = orderByFor(page);
        spec.limit = page.limit;
        spec.offset = page.offset;

        auto stmtResult = db.prepare(sql::buildSelect(spec));
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = sql::bindParams(stmt, clause.params);
        if (!bound)
            return bound.error();

        Page result;
        result.totalCount = total.value();
        while (true) {
            auto row = stmt.step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            result.rows.push_back(FileRow{readFileRecord(stmt), stmt.getInt64(kFileColumnCount)});
        }
        return result;
    });
}

Result<std::unordered_map<std::string, double>>
IndexStore::listIndexedMtimes(const FolderScope& scope) {
    return withRead([&](Database& db) -> Result<std::unordered_map<std::string, double>> {
        FileQuery query;
        query.scope = scope;
        auto clause = sql::fileQueryClause(query);
        sql::QuerySpec spec;
        spec.table = "files f";
        spec.columns = {"f.path", "f.mtime"};
        spec.conditions = clause.conditions;

        auto stmtResult = db.prepare(sql::buildSelect(spec));
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = sql::bindParams(stmt, clause.params);
        if (!bound)
            return bound.error();

        std::unordered_map<std::string, double> mtimes;
        while (true) {
            auto row = stmt.step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            mtimes.emplace(stmt.getString(0), stmt.getDouble(1));
        }
        return mtimes;
    });
}

Result<std::optional<FileRecord>> IndexStore::getFile(const FileId& id) {
    return withRead([&](Database& db) -> Result<std::optional<FileRecord>> {
        auto stmtResult =
            db.prepare(std::string("SELECT ") + kFileColumns + " FROM files f WHERE f.id = ?");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = stmt.bind(1, id);
        if (!bound)
            return bound.error();
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (!row.value())
            return std::optional<FileRecord>{};
        return std::optional<FileRecord>{readFileRecord(stmt)};
    });
}

Result<extraction::SamplerRecords> IndexStore::getSamplers(const FileId& id) {
    return withRead([&](Database& db) -> Result<extraction::SamplerRecords> {
        auto stmtResult = db.prepare(R"(
            SELECT sampler_index, model_name, sampler_name, scheduler, positive_prompt,
                   negative_prompt, width, height, cfg, steps
            FROM samplers WHERE file_id = ? ORDER BY sampler_index ASC
        )");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = stmt.bind(1, id);
        if (!bound)
            return bound.error();

        extraction::SamplerRecords records;
        while (true) {
            auto row = stmt.step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            extraction::SamplerRecord r;
            r.samplerIndex = stmt.getInt(0);
            r.modelName = stmt.getOptionalString(1);
            r.samplerName = stmt.getOptionalString(2);
            r.scheduler = stmt.getOptionalString(3);
            r.positivePrompt = stmt.getOptionalString(4);
            r.negativePrompt = stmt.getOptionalString(5);
            r.width = stmt.getOptionalInt64(6);
            r.height = stmt.getOptionalInt64(7);
            r.cfg = stmt.getOptionalDouble(8);
            r.steps = stmt.getOptionalInt64(9);
            records.push_back(std::move(r));
        }
        return records;
    });
}

Result<FilterOptions> IndexStore::filterOptions(const FolderScope& scope) {
    return withRead([&](Database& db) -> Result<FilterOptions> {
        FileQuery query;
        query.scope = scope;
        auto clause = sql::fileQueryClause(query);

        FilterOptions options;
        auto models = distinctCounts(db, "model_name", clause);
        if (!models)
            return models.error();
        options.models = std::move(models).value();
        auto samplers = distinctCounts(db, "sampler_name", clause);
        if (!samplers)
            return samplers.error();
        options.samplers = std::move(samplers).value();
        auto schedulers = distinctCounts(db, "scheduler", clause);
        if (!schedulers)
            return schedulers.error();
        options.schedulers = std::move(schedulers).value();

        sql::QuerySpec spec;
        spec.from = "samplers s JOIN files f ON f.id = s.file_id";
        spec.columns = {"MIN(s.cfg)",   "MAX(s.cfg)",   "MIN(s.steps)",  "MAX(s.steps)",
                        "MIN(s.width)", "MAX(s.width)", "MIN(s.height)", "MAX(s.height)"};
        spec.conditions = clause.conditions;
        auto stmtResult = db.prepare(sql::buildSelect(spec));
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = sql::bindParams(stmt, clause.params);
        if (!bound)
            return bound.error();
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (row.value()) {
            options.cfg = {stmt.getOptionalDouble(0), stmt.getOptionalDouble(1)};
            options.steps = {stmt.getOptionalInt64(2), stmt.getOptionalInt64(3)};
            options.width = {stmt.getOptionalInt64(4), stmt.getOptionalInt64(5)};
            options.height = {stmt.getOptionalInt64(6), stmt.getOptionalInt64(7)};
        }
        return options;
    });
}

Result<IndexStats> IndexStore::stats() {
    return withRead([&](Database& db) -> Result<IndexStats> {
        auto stmtResult = db.prepare(R"(
            SELECT (SELECT COUNT(*) FROM files),
                   (SELECT COUNT(*) FROM samplers),
                   (SELECT COUNT(*) FROM files WHERE is_favorite = 1),
                   (SELECT COUNT(*) FROM files WHERE has_workflow = 1)
        )");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto row = stmt.step();
        if (!row)
            return row.error();
        IndexStats s;
        if (row.value()) {
            s.fileCount = stmt.getInt64(0);
            s.samplerCount = stmt.getInt64(1);
            s.favoriteCount = stmt.getInt64(2);
            s.withWorkflowCount = stmt.getInt64(3);
        }
        return s;
    });
}

} // namespace mediadex::metadata
