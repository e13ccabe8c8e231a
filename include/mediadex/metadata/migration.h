#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <mediadex/metadata/database.h>

namespace mediadex::metadata {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version = 0;  ///< Migration version number
    std::string name; ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for complex migrations)
     */
    std::function<Result<void>(Database&)> upFunc;

    /**
     * @brief Tables copied to `<table>_backup` before the migration runs
     *
     * If the migration fails the listed tables are rebuilt from the copies,
     * including their indices. Copies are dropped after success.
     */
    std::vector<std::string> backupTables;
};

/**
 * @brief Migration history entry
 */
struct MigrationHistory {
    int version = 0;
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds duration{0};
    bool success = false;
    std::string error;
};

/**
 * @brief Applies an ordered list of schema migrations
 *
 * The applied version is tracked in `migration_history` and mirrored into
 * PRAGMA user_version.
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create tables)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    /**
     * @brief Highest successfully applied version, 0 for a fresh database
     */
    Result<int> getCurrentVersion();

    int getLatestVersion() const;

    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations
     */
    Result<void> migrate();

    /**
     * @brief Apply pending migrations up to and including `targetVersion`
     */
    Result<void> migrateTo(int targetVersion);

    Result<std::vector<MigrationHistory>> getHistory();

private:
    struct TableBackup {
        std::string table;
        std::string createSql;
        std::vector<std::string> indexSql;
    };

    Result<void> applyMigration(const Migration& migration);
    Result<std::vector<TableBackup>> createBackups(const std::vector<std::string>& tables);
    Result<void> restoreBackups(const std::vector<TableBackup>& backups);
    void dropBackups(const std::vector<TableBackup>& backups);

    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");

    Result<void> createMigrationTables();

    Database& db_;
    std::map<int, Migration> migrations_;
};

} // namespace mediadex::metadata
