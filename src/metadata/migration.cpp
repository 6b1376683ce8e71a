#include <spdlog/spdlog.h>
#include <ragcore/metadata/migration.h>

namespace ragcore::metadata {

// MigrationManager implementation
MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL
        )
    )");
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
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history");
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
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    if (currentVersion > getLatestVersion()) {
        return Error{ErrorCode::InvalidState,
                     "Database schema version " + std::to_string(currentVersion) +
                         " is newer than this build supports"};
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion) {
            continue;
        }
        spdlog::debug("Applying migration {} '{}'", version, migration.name);

        std::chrono::milliseconds elapsed{0};
        auto result = applyMigration(migration, elapsed);
        if (!result) {
            spdlog::error("Migration {} '{}' failed: {}", version, migration.name,
                          result.error().message);
            return result;
        }
        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    auto stmtResult = db_.prepare("SELECT version, name, applied_at, duration_ms "
                                  "FROM migration_history ORDER BY version");
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
        entry.appliedAt = stmt.getTime(2);
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        history.push_back(entry);
    }

    return history;
}

Result<void> MigrationManager::applyMigration(const Migration& migration,
                                              std::chrono::milliseconds& elapsed) {
    auto start = std::chrono::steady_clock::now();
    // The history row is written in the same transaction as the schema change
    return db_.transaction([&]() -> Result<void> {
        Result<void> applied;
        if (migration.upFunc) {
            applied = migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            applied = db_.execute(migration.upSQL);
        } else {
            return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
        }
        if (!applied)
            return applied;

        elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        auto stmtResult = db_.prepare("INSERT INTO migration_history "
                                      "(version, name, applied_at, duration_ms) "
                                      "VALUES (?, ?, ?, ?)");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        auto bindResult = stmt.bindAll(migration.version, migration.name, now,
                                       static_cast<int64_t>(elapsed.count()));
        if (!bindResult)
            return bindResult;
        return stmt.execute();
    });
}

// KnowledgeSchemaMigrations implementation
std::vector<Migration> KnowledgeSchemaMigrations::getAllMigrations() {
    return {createInitialSchema(), createLookupIndexes()};
}

Migration KnowledgeSchemaMigrations::createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Initial document and chunk schema";
    m.upSQL = R"(
        CREATE TABLE IF NOT EXISTS documents (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            title TEXT NOT NULL,
            description TEXT NOT NULL DEFAULT '',
            doc_type TEXT NOT NULL DEFAULT 'custom',
            scope TEXT NOT NULL DEFAULT 'global',
            is_admin_managed INTEGER NOT NULL DEFAULT 0,
            source_type TEXT NOT NULL,
            source_details TEXT NOT NULL DEFAULT '{}',
            content_hash TEXT NOT NULL,
            raw_content TEXT,
            status TEXT NOT NULL DEFAULT 'PENDING',
            processing_error TEXT,
            chunk_count INTEGER NOT NULL DEFAULT 0,
            target_functions TEXT NOT NULL DEFAULT '[]',
            target_platforms TEXT NOT NULL DEFAULT '[]',
            tags TEXT NOT NULL DEFAULT '[]',
            priority INTEGER NOT NULL DEFAULT 5 CHECK (priority BETWEEN 1 AND 10),
            is_active INTEGER NOT NULL DEFAULT 1,
            usage_count INTEGER NOT NULL DEFAULT 0,
            last_used_at INTEGER,
            uploaded_by TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS chunks (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            document_id INTEGER NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
            chunk_index INTEGER NOT NULL,
            content TEXT NOT NULL,
            token_count INTEGER NOT NULL DEFAULT 0,
            embedding BLOB,
            embedding_model TEXT,
            start_char INTEGER NOT NULL,
            end_char INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            UNIQUE (document_id, chunk_index)
        );
    )";
    return m;
}

Migration KnowledgeSchemaMigrations::createLookupIndexes() {
    Migration m;
    m.version = 2;
    m.name = "Lookup indexes";
    m.upSQL = R"(
        CREATE INDEX IF NOT EXISTS idx_documents_content_hash ON documents(content_hash);
        CREATE INDEX IF NOT EXISTS idx_documents_status ON documents(status, is_active);
        CREATE INDEX IF NOT EXISTS idx_documents_uploaded_by ON documents(uploaded_by);
        CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id, chunk_index);
        CREATE INDEX IF NOT EXISTS idx_chunks_embedding_model ON chunks(embedding_model);
    )";
    return m;
}

} // namespace ragcore::metadata
