#include <spdlog/spdlog.h>
#include <mediadex/metadata/migration.h>

namespace mediadex::metadata {

namespace {

std::string backupName(const std::string& table) {
    return table + "_backup";
}

} // namespace

MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return createMigrationTables();
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }
    return 0; // No migrations applied yet
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();
    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    return migrateTo(getLatestVersion());
}

Result<void> MigrationManager::migrateTo(int targetVersion) {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    if (currentVersion >= targetVersion) {
        spdlog::debug("[Migration] already at version {}", currentVersion);
        return {};
    }

    int totalMigrations = 0;
    for (const auto& [version, _] : migrations_) {
        if (version > currentVersion && version <= targetVersion) {
            totalMigrations++;
        }
    }

    int appliedMigrations = 0;
    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion || version > targetVersion) {
            continue;
        }
        spdlog::info("[Migration] applying {} '{}' ({}/{})", version, migration.name,
                     ++appliedMigrations, totalMigrations);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            auto recordResult =
                recordMigration(version, migration.name, duration, false, result.error().message);
            if (!recordResult) {
                spdlog::warn("[Migration] could not record failure of {}: {}", version,
                             recordResult.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;
        currentVersion = version;
    }

    spdlog::info("[Migration] schema now at version {}", currentVersion);
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    auto stmtResult = db_.prepare("SELECT version, name, applied_at, duration_ms, success, error "
                                  "FROM migration_history ORDER BY version ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<MigrationHistory> history;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        MigrationHistory entry;
        entry.version = stmt.getInt(0);
        entry.name = stmt.getString(1);
        entry.appliedAt =
            std::chrono::system_clock::time_point(std::chrono::seconds(stmt.getInt64(2)));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        entry.success = stmt.getInt(4) != 0;
        entry.error = stmt.getString(5);
        history.push_back(std::move(entry));
    }
    return history;
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    std::vector<TableBackup> backups;
    if (!migration.backupTables.empty()) {
        auto backupResult = createBackups(migration.backupTables);
        if (!backupResult) {
            return Error{ErrorCode::MigrationFailed,
                         "backup before migration " + std::to_string(migration.version) +
                             " failed: " + backupResult.error().message};
        }
        backups = std::move(backupResult).value();
    }

    Result<void> result;
    try {
        result = db_.transaction([&]() -> Result<void> {
            Result<void> step;
            if (migration.upFunc) {
                step = migration.upFunc(db_);
            } else if (!migration.upSQL.empty()) {
                step = db_.execute(migration.upSQL);
            } else {
                return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
            }
            if (!step)
                return step;
            return db_.setUserVersion(migration.version);
        });
    } catch (const std::exception& e) {
        result = Error{ErrorCode::MigrationFailed, e.what()};
    }

    if (!result) {
        spdlog::error("[Migration] {} '{}' failed: {}", migration.version, migration.name,
                      result.error().message);
        if (!backups.empty()) {
            auto restored = restoreBackups(backups);
            if (!restored) {
                spdlog::error("[Migration] restore from backup failed, backup tables kept: {}",
                              restored.error().message);
                return Error{ErrorCode::MigrationFailed,
                             result.error().message +
                                 "; restore failed: " + restored.error().message};
            }
            dropBackups(backups);
            spdlog::warn("[Migration] restored {} table(s) from backup", backups.size());
        }
        return Error{ErrorCode::MigrationFailed, result.error().message};
    }

    dropBackups(backups);
    return {};
}

Result<std::vector<MigrationManager::TableBackup>>
MigrationManager::createBackups(const std::vector<std::string>& tables) {
    std::vector<TableBackup> backups;
    auto result = db_.transaction([&]() -> Result<void> {
        for (const auto& table : tables) {
            auto ddlStmt = db_.prepare("SELECT sql FROM sqlite_master WHERE type='table' AND name=?");
            if (!ddlStmt)
                return ddlStmt.error();
            Statement stmt = std::move(ddlStmt).value();
            auto bound = stmt.bind(1, table);
            if (!bound)
                return bound;
            auto row = stmt.step();
            if (!row)
                return row.error();
            if (!row.value()) {
                // Nothing to protect
                continue;
            }

            TableBackup backup;
            backup.table = table;
            backup.createSql = stmt.getString(0);

            auto idxStmt = db_.prepare("SELECT sql FROM sqlite_master WHERE type='index' "
                                       "AND tbl_name=? AND sql IS NOT NULL");
            if (!idxStmt)
                return idxStmt.error();
            Statement idx = std::move(idxStmt).value();
            auto idxBound = idx.bind(1, table);
            if (!idxBound)
                return idxBound;
            while (true) {
                auto idxRow = idx.step();
                if (!idxRow)
                    return idxRow.error();
                if (!idxRow.value())
                    break;
                backup.indexSql.push_back(idx.getString(0));
            }

            auto copy = db_.execute("DROP TABLE IF EXISTS " + backupName(table) +
                                    "; CREATE TABLE " + backupName(table) + " AS SELECT * FROM " +
                                    table);
            if (!copy)
                return copy;
            backups.push_back(std::move(backup));
        }
        return {};
    });
    if (!result)
        return result.error();
    return backups;
}

Result<void> MigrationManager::restoreBackups(const std::vector<TableBackup>& backups) {
    return db_.transaction([&]() -> Result<void> {
        for (const auto& backup : backups) {
            auto rebuilt = db_.execute("DROP TABLE IF EXISTS " + backup.table + "; " +
                                       backup.createSql + "; INSERT INTO " + backup.table +
                                       " SELECT * FROM " + backupName(backup.table));
            if (!rebuilt)
                return rebuilt;
            for (const auto& sql : backup.indexSql) {
                auto idx = db_.execute(sql);
                if (!idx)
                    return idx;
            }
        }
        return {};
    });
}

void MigrationManager::dropBackups(const std::vector<TableBackup>& backups) {
    for (const auto& backup : backups) {
        auto dropped = db_.execute("DROP TABLE IF EXISTS " + backupName(backup.table));
        if (!dropped) {
            spdlog::warn("[Migration] could not drop {}: {}", backupName(backup.table),
                         dropped.error().message);
        }
    }
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT OR REPLACE INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    int64_t durationMs = duration.count();

    auto bindResult = stmt.bindAll(version, name, seconds, durationMs, success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<void> MigrationManager::createMigrationTables() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT,
            UNIQUE(version)
        )
    )");
}

} // namespace mediadex::metadata
