#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <ragcore/metadata/database.h>

namespace ragcore::metadata {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;      ///< Migration version number
    std::string name; ///< Human-readable name
    std::string upSQL;

    /**
     * @brief Custom migration function (for migrations that need more than SQL)
     */
    std::function<Result<void>(Database&)> upFunc;
};

struct MigrationHistory {
    int version;
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds duration;
};

/**
 * @brief Applies versioned migrations in order, each in its own transaction
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Create the migration bookkeeping table
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    int getLatestVersion() const;
    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations
     */
    Result<void> migrate();

    Result<std::vector<MigrationHistory>> getHistory();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration, std::chrono::milliseconds& elapsed);
};

/**
 * @brief Built-in migrations for the document/chunk schema
 */
class KnowledgeSchemaMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    // Version 1: documents and chunks, chunks cascade with their document
    static Migration createInitialSchema();
    // Version 2: lookup indexes for dedup, status scans and chunk loading
    static Migration createLookupIndexes();
};

} // namespace ragcore::metadata
