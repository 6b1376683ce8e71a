#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <set>
#include <variant>
#include <ragcore/metadata/knowledge_store.h>
#include <ragcore/metadata/migration.h>

namespace ragcore::metadata {

namespace {

constexpr size_t kMaxInParams = 500;

constexpr const char* kDocumentColumns =
    "id, title, description, doc_type, scope, is_admin_managed, source_type, source_details, "
    "content_hash, status, processing_error, chunk_count, target_functions, target_platforms, "
    "tags, priority, is_active, usage_count, last_used_at, uploaded_by, created_at, updated_at";

constexpr int kRawContentColumn = 22;

using SqlParam = std::variant<int64_t, std::string>;

Result<void> bindParams(Statement& stmt, const std::vector<SqlParam>& params, int first = 1) {
    int index = first;
    for (const auto& p : params) {
        auto r = std::visit([&](const auto& v) { return stmt.bind(index, v); }, p);
        if (!r)
            return r;
        ++index;
    }
    return {};
}

Result<void> bindNullable(Statement& stmt, int index, const std::optional<std::string>& v) {
    if (v)
        return stmt.bind(index, *v);
    return stmt.bind(index, nullptr);
}

Result<void> bindNullable(Statement& stmt, int index, const std::optional<Timestamp>& v) {
    if (v)
        return stmt.bind(index, *v);
    return stmt.bind(index, nullptr);
}

std::string placeholders(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        out += (i == 0) ? "?" : ", ?";
    }
    return out;
}

std::optional<std::string> nullableString(const Statement& stmt, int column) {
    if (stmt.isNull(column))
        return std::nullopt;
    return stmt.getString(column);
}

Result<DocumentRecord> readDocument(const Statement& stmt, bool withContent) {
    DocumentRecord d;
    d.id = stmt.getInt64(0);
    d.title = stmt.getString(1);
    d.description = stmt.getString(2);

    auto type = parseDocumentType(stmt.getString(3));
    if (!type)
        return type.error();
    d.doc_type = type.value();

    auto scope = parseDocumentScope(stmt.getString(4));
    if (!scope)
        return scope.error();
    d.scope = scope.value();

    d.is_admin_managed = stmt.getInt(5) != 0;

    auto sourceType = parseSourceType(stmt.getString(6));
    if (!sourceType)
        return sourceType.error();
    auto source = parseSourceDetails(sourceType.value(), stmt.getString(7));
    if (!source)
        return source.error();
    d.source = std::move(source).value();

    d.content_hash = stmt.getString(8);

    auto status = parseDocumentStatus(stmt.getString(9));
    if (!status)
        return status.error();
    d.status = status.value();

    d.processing_error = nullableString(stmt, 10);
    d.chunk_count = stmt.getInt64(11);

    auto functions = parseStringSet(stmt.getString(12));
    if (!functions)
        return functions.error();
    d.target_functions = std::move(functions).value();

    auto platforms = parseStringSet(stmt.getString(13));
    if (!platforms)
        return platforms.error();
    d.target_platforms = std::move(platforms).value();

    auto tags = parseStringSet(stmt.getString(14));
    if (!tags)
        return tags.error();
    d.tags = std::move(tags).value();

    d.priority = stmt.getInt(15);
    d.is_active = stmt.getInt(16) != 0;
    d.usage_count = stmt.getInt64(17);
    if (!stmt.isNull(18)) {
        d.last_used_at = stmt.getTime(18);
    }
    d.uploaded_by = nullableString(stmt, 19);
    d.created_at = stmt.getTime(20);
    d.updated_at = stmt.getTime(21);

    if (withContent) {
        d.raw_content = nullableString(stmt, kRawContentColumn);
    }
    return d;
}

Result<std::vector<DocumentRecord>> collectDocuments(Statement& stmt, bool withContent) {
    std::vector<DocumentRecord> out;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        auto doc = readDocument(stmt, withContent);
        if (!doc)
            return doc.error();
        out.push_back(std::move(doc).value());
    }
    return out;
}

Result<DocumentId> insertDocument(Database& db, const DocumentRecord& doc) {
    auto stmtResult = db.prepare(
        "INSERT INTO documents (title, description, doc_type, scope, is_admin_managed, "
        "source_type, source_details, content_hash, status, chunk_count, target_functions, "
        "target_platforms, tags, priority, is_active, usage_count, created_at, updated_at, "
        "raw_content, processing_error, uploaded_by, last_used_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();

    const Timestamp now = nowSeconds();
    const Timestamp created = doc.created_at == Timestamp{} ? now : doc.created_at;
    const Timestamp updated = doc.updated_at == Timestamp{} ? now : doc.updated_at;

    auto bound = stmt.bindAll(
        doc.title, doc.description, toString(doc.doc_type), toString(doc.scope),
        doc.is_admin_managed ? 1 : 0, toString(doc.sourceType()),
        serializeSourceDetails(doc.source), doc.content_hash, toString(doc.status),
        static_cast<int64_t>(doc.chunk_count), serializeStringSet(doc.target_functions),
        serializeStringSet(doc.target_platforms), serializeStringSet(doc.tags), doc.priority,
        doc.is_active ? 1 : 0, static_cast<int64_t>(doc.usage_count), created, updated);
    if (!bound)
        return bound.error();

    bound = bindNullable(stmt, 19, doc.raw_content);
    if (!bound)
        return bound.error();
    bound = bindNullable(stmt, 20, doc.processing_error);
    if (!bound)
        return bound.error();
    bound = bindNullable(stmt, 21, doc.uploaded_by);
    if (!bound)
        return bound.error();
    bound = bindNullable(stmt, 22, doc.last_used_at);
    if (!bound)
        return bound.error();

    auto exec = stmt.execute();
    if (!exec)
        return exec.error();
    return db.lastInsertRowId();
}

Result<std::vector<DocumentRecord>> selectByHash(Database& db, const std::string& hash,
                                                 const HashScopeFilter& filter) {
    std::string sql =
        std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE content_hash = ?";
    if (filter.active_only) {
        sql += " AND is_active = 1";
    }
    sql += filter.prefer_admin_managed ? " ORDER BY is_admin_managed DESC, id ASC"
                                       : " ORDER BY id ASC";

    auto stmtResult = db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto bound = stmt.bind(1, hash);
    if (!bound)
        return bound.error();
    return collectDocuments(stmt, false);
}

// Caller owns the transaction
Result<void> writeChunks(Database& db, DocumentId id, const std::vector<ChunkRecord>& chunks,
                         bool markReady) {
    auto del = db.prepare("DELETE FROM chunks WHERE document_id = ?");
    if (!del)
        return del.error();
    Statement delStmt = std::move(del).value();
    auto bound = delStmt.bind(1, static_cast<int64_t>(id));
    if (!bound)
        return bound;
    auto exec = delStmt.execute();
    if (!exec)
        return exec;

    auto ins = db.prepare("INSERT INTO chunks (document_id, chunk_index, content, "
                          "token_count, embedding, embedding_model, start_char, end_char, "
                          "created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!ins)
        return ins.error();
    Statement insStmt = std::move(ins).value();
    const Timestamp now = nowSeconds();

    for (const auto& chunk : chunks) {
        auto reset = insStmt.reset();
        if (!reset)
            return reset;
        auto cleared = insStmt.clearBindings();
        if (!cleared)
            return cleared;

        bound = insStmt.bindAll(static_cast<int64_t>(id), chunk.chunk_index, chunk.content,
                                chunk.token_count);
        if (!bound)
            return bound;
        if (chunk.embedding.empty()) {
            bound = insStmt.bind(5, nullptr);
        } else {
            auto blob = packEmbedding(chunk.embedding);
            bound = insStmt.bind(5, std::span<const std::byte>(blob));
        }
        if (!bound)
            return bound;
        bound = insStmt.bind(6, chunk.embedding_model);
        if (!bound)
            return bound;
        bound = insStmt.bind(7, chunk.start_char);
        if (!bound)
            return bound;
        bound = insStmt.bind(8, chunk.end_char);
        if (!bound)
            return bound;
        bound = insStmt.bind(9, now);
        if (!bound)
            return bound;

        exec = insStmt.execute();
        if (!exec)
            return exec;
    }

    auto upd = db.prepare(markReady ? "UPDATE documents SET chunk_count = ?, updated_at = ?, "
                                      "status = 'READY', processing_error = NULL WHERE id = ?"
                                    : "UPDATE documents SET chunk_count = ?, updated_at = ? "
                                      "WHERE id = ?");
    if (!upd)
        return upd.error();
    Statement updStmt = std::move(upd).value();
    bound = updStmt.bindAll(static_cast<int64_t>(chunks.size()), now,
                            static_cast<int64_t>(id));
    if (!bound)
        return bound;
    exec = updStmt.execute();
    if (!exec)
        return exec;
    if (db.changes() == 0) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id)};
    }
    return {};
}

Result<bool> validPriority(int priority) {
    if (priority < 1 || priority > 10) {
        return Error{ErrorCode::InvalidArgument,
                     "priority must be between 1 and 10, got " + std::to_string(priority)};
    }
    return true;
}

} // namespace

SqliteKnowledgeStore::SqliteKnowledgeStore(std::string dbPath, ConnectionPoolConfig poolConfig)
    : dbPath_(std::move(dbPath)), pool_(std::make_unique<ConnectionPool>(dbPath_, poolConfig)) {}

SqliteKnowledgeStore::~SqliteKnowledgeStore() {
    pool_->shutdown();
}

Result<void> SqliteKnowledgeStore::initialize() {
    if (initialized_) {
        return {};
    }

    std::filesystem::path parent = std::filesystem::path(dbPath_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::DatabaseError,
                         "Cannot create database directory " + parent.string() + ": " +
                             ec.message()};
        }
    }

    auto poolResult = pool_->initialize();
    if (!poolResult) {
        return poolResult;
    }

    auto migrated = pool_->withConnection([](Database& db) -> Result<void> {
        MigrationManager mm(db);
        auto init = mm.initialize();
        if (!init)
            return init;
        mm.registerMigrations(KnowledgeSchemaMigrations::getAllMigrations());
        return mm.migrate();
    });
    if (!migrated) {
        spdlog::error("Knowledge store migration failed for {}: {}", dbPath_,
                      migrated.error().message);
        return migrated;
    }

    initialized_ = true;
    spdlog::debug("Knowledge store ready at {}", dbPath_);
    return {};
}

Result<DocumentId> SqliteKnowledgeStore::createDocument(const DocumentRecord& doc) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection(
        [&](Database& db) -> Result<DocumentId> { return insertDocument(db, doc); });
}

Result<CreateOutcome>
SqliteKnowledgeStore::createDocumentUnlessDuplicate(const DocumentRecord& doc,
                                                    const HashScopeFilter& filter,
                                                    const DuplicateRule& blocks) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<CreateOutcome> {
        CreateOutcome outcome;
        auto tx = db.transaction([&]() -> Result<void> {
            auto matches = selectByHash(db, doc.content_hash, filter);
            if (!matches)
                return matches.error();
            for (auto& existing : matches.value()) {
                if (blocks(existing)) {
                    outcome.conflict = std::move(existing);
                    return {};
                }
            }
            auto id = insertDocument(db, doc);
            if (!id)
                return id.error();
            outcome.created = id.value();
            return {};
        });
        if (!tx)
            return tx.error();
        return outcome;
    });
}

Result<std::optional<DocumentRecord>> SqliteKnowledgeStore::getDocument(DocumentId id) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<std::optional<DocumentRecord>> {
        auto stmtResult = db.prepare(std::string("SELECT ") + kDocumentColumns +
                                     ", raw_content FROM documents WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();

        auto bound = stmt.bind(1, static_cast<int64_t>(id));
        if (!bound)
            return bound.error();

        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            return std::optional<DocumentRecord>{};

        auto doc = readDocument(stmt, true);
        if (!doc)
            return doc.error();
        return std::optional<DocumentRecord>{std::move(doc).value()};
    });
}

Result<void> SqliteKnowledgeStore::updateDocumentStatus(DocumentId id, DocumentStatus status,
                                                        std::optional<std::string> error) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<void> {
        const bool touchesError =
            status == DocumentStatus::Ready || status == DocumentStatus::Failed;
        auto stmtResult = db.prepare(
            touchesError
                ? "UPDATE documents SET status = ?, updated_at = ?, processing_error = ? "
                  "WHERE id = ?"
                : "UPDATE documents SET status = ?, updated_at = ? WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();

        auto bound = stmt.bindAll(toString(status), nowSeconds());
        if (!bound)
            return bound;
        int next = 3;
        if (touchesError) {
            std::optional<std::string> stored;
            if (status == DocumentStatus::Failed) {
                stored = error.value_or("processing failed");
            }
            bound = bindNullable(stmt, next++, stored);
            if (!bound)
                return bound;
        }
        bound = stmt.bind(next, static_cast<int64_t>(id));
        if (!bound)
            return bound;

        auto exec = stmt.execute();
        if (!exec)
            return exec;
        if (db.changes() == 0) {
            return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id)};
        }
        return {};
    });
}

Result<bool> SqliteKnowledgeStore::transitionStatus(DocumentId id,
                                                    const std::vector<DocumentStatus>& from,
                                                    DocumentStatus to) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};
    if (from.empty())
        return false;

    return pool_->withConnection([&](Database& db) -> Result<bool> {
        std::string sql = "UPDATE documents SET status = ?, updated_at = ?";
        if (to == DocumentStatus::Pending) {
            sql += ", processing_error = NULL";
        }
        sql += " WHERE id = ? AND status IN (" + placeholders(from.size()) + ")";

        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();

        auto bound = stmt.bindAll(toString(to), nowSeconds(), static_cast<int64_t>(id));
        if (!bound)
            return bound.error();
        int index = 4;
        for (auto s : from) {
            bound = stmt.bind(index++, toString(s));
            if (!bound)
                return bound.error();
        }

        auto exec = stmt.execute();
        if (!exec)
            return exec.error();
        return db.changes() > 0;
    });
}

Result<void> SqliteKnowledgeStore::replaceChunks(DocumentId id,
                                                 const std::vector<ChunkRecord>& chunks) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() { return writeChunks(db, id, chunks, false); });
    });
}

Result<void> SqliteKnowledgeStore::commitChunks(DocumentId id,
                                                const std::vector<ChunkRecord>& chunks) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() { return writeChunks(db, id, chunks, true); });
    });
}

Result<bool> SqliteKnowledgeStore::deleteDocumentCascade(DocumentId id) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<bool> {
        bool found = false;
        auto tx = db.transaction([&]() -> Result<void> {
            // Explicit chunk delete keeps the cascade even if foreign keys are off
            auto del = db.prepare("DELETE FROM chunks WHERE document_id = ?");
            if (!del)
                return del.error();
            Statement delChunks = std::move(del).value();
            auto bound = delChunks.bind(1, static_cast<int64_t>(id));
            if (!bound)
                return bound;
            auto exec = delChunks.execute();
            if (!exec)
                return exec;

            auto delDoc = db.prepare("DELETE FROM documents WHERE id = ?");
            if (!delDoc)
                return delDoc.error();
            Statement docStmt = std::move(delDoc).value();
            bound = docStmt.bind(1, static_cast<int64_t>(id));
            if (!bound)
                return bound;
            exec = docStmt.execute();
            if (!exec)
                return exec;
            found = db.changes() > 0;
            return {};
        });
        if (!tx)
            return tx.error();
        return found;
    });
}

Result<std::vector<DocumentRecord>>
SqliteKnowledgeStore::findByContentHash(const std::string& hash, const HashScopeFilter& filter) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<std::vector<DocumentRecord>> {
        return selectByHash(db, hash, filter);
    });
}

Result<std::vector<ChunkRecord>>
SqliteKnowledgeStore::listChunks(const std::vector<DocumentId>& ids) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};
    if (ids.empty())
        return std::vector<ChunkRecord>{};

    return pool_->withConnection([&](Database& db) -> Result<std::vector<ChunkRecord>> {
        std::vector<ChunkRecord> out;
        for (size_t offset = 0; offset < ids.size(); offset += kMaxInParams) {
            const size_t n = std::min(kMaxInParams, ids.size() - offset);
            auto stmtResult = db.prepare(
                "SELECT id, document_id, chunk_index, content, token_count, embedding, "
                "embedding_model, start_char, end_char FROM chunks WHERE document_id IN (" +
                placeholders(n) + ") ORDER BY document_id, chunk_index");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();

            for (size_t i = 0; i < n; ++i) {
                auto bound = stmt.bind(static_cast<int>(i + 1), static_cast<int64_t>(ids[offset + i]));
                if (!bound)
                    return bound.error();
            }

            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                ChunkRecord c;
                c.id = stmt.getInt64(0);
                c.document_id = stmt.getInt64(1);
                c.chunk_index = stmt.getInt64(2);
                c.content = stmt.getString(3);
                c.token_count = stmt.getInt64(4);
                if (!stmt.isNull(5)) {
                    c.embedding = unpackEmbedding(stmt.getBlob(5));
                }
                c.embedding_model = stmt.getString(6);
                c.start_char = stmt.getInt64(7);
                c.end_char = stmt.getInt64(8);
                out.push_back(std::move(c));
            }
        }
        return out;
    });
}

Result<bool> SqliteKnowledgeStore::attachRawContent(DocumentId id, const std::string& text) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<bool> {
        bool attached = false;
        auto tx = db.transaction([&]() -> Result<void> {
            auto stmtResult = db.prepare(
                "UPDATE documents SET raw_content = ?, status = 'PENDING', "
                "processing_error = NULL, updated_at = ? "
                "WHERE id = ? AND status IN ('PENDING', 'READY', 'FAILED')");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();
            auto bound = stmt.bindAll(text, nowSeconds(), static_cast<int64_t>(id));
            if (!bound)
                return bound;
            auto exec = stmt.execute();
            if (!exec)
                return exec;
            if (db.changes() > 0) {
                attached = true;
                return {};
            }

            auto lookup = db.prepare("SELECT 1 FROM documents WHERE id = ?");
            if (!lookup)
                return lookup.error();
            Statement existsStmt = std::move(lookup).value();
            bound = existsStmt.bind(1, static_cast<int64_t>(id));
            if (!bound)
                return bound;
            auto step = existsStmt.step();
            if (!step)
                return step.error();
            if (!step.value()) {
                return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id)};
            }
            return {};
        });
        if (!tx)
            return tx.error();
        return attached;
    });
}

Result<std::vector<DocumentRecord>>
SqliteKnowledgeStore::listDocuments(const DocumentQuery& query) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<std::vector<DocumentRecord>> {
        std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE 1 = 1";
        std::vector<SqlParam> params;

        if (query.doc_type) {
            sql += " AND doc_type = ?";
            params.emplace_back(std::string(toString(*query.doc_type)));
        }
        if (query.status) {
            sql += " AND status = ?";
            params.emplace_back(std::string(toString(*query.status)));
        }
        if (query.is_active) {
            sql += " AND is_active = ?";
            params.emplace_back(int64_t{*query.is_active ? 1 : 0});
        }
        if (query.owner) {
            sql += " AND uploaded_by = ?";
            params.emplace_back(*query.owner);
        }
        if (query.admin_managed) {
            sql += " AND is_admin_managed = ?";
            params.emplace_back(int64_t{*query.admin_managed ? 1 : 0});
        }
        sql += " ORDER BY created_at DESC, id DESC";
        if (query.limit > 0) {
            sql += " LIMIT ?";
            params.emplace_back(static_cast<int64_t>(query.limit));
        }

        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = bindParams(stmt, params);
        if (!bound)
            return bound.error();
        return collectDocuments(stmt, false);
    });
}

Result<void> SqliteKnowledgeStore::updateDocumentMetadata(DocumentId id,
                                                          const DocumentUpdate& update) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};
    if (update.priority) {
        auto ok = validPriority(*update.priority);
        if (!ok)
            return ok.error();
    }
    if (update.title && update.title->empty()) {
        return Error{ErrorCode::InvalidArgument, "title must not be empty"};
    }

    return pool_->withConnection([&](Database& db) -> Result<void> {
        std::string sql = "UPDATE documents SET updated_at = ?";
        std::vector<SqlParam> params;

        if (update.title) {
            sql += ", title = ?";
            params.emplace_back(*update.title);
        }
        if (update.description) {
            sql += ", description = ?";
            params.emplace_back(*update.description);
        }
        if (update.target_functions) {
            sql += ", target_functions = ?";
            params.emplace_back(serializeStringSet(*update.target_functions));
        }
        if (update.target_platforms) {
            sql += ", target_platforms = ?";
            params.emplace_back(serializeStringSet(*update.target_platforms));
        }
        if (update.tags) {
            sql += ", tags = ?";
            params.emplace_back(serializeStringSet(*update.tags));
        }
        if (update.priority) {
            sql += ", priority = ?";
            params.emplace_back(static_cast<int64_t>(*update.priority));
        }
        if (update.is_active) {
            sql += ", is_active = ?";
            params.emplace_back(int64_t{*update.is_active ? 1 : 0});
        }
        sql += " WHERE id = ?";
        params.emplace_back(static_cast<int64_t>(id));

        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = stmt.bind(1, nowSeconds());
        if (!bound)
            return bound;
        bound = bindParams(stmt, params, 2);
        if (!bound)
            return bound;
        auto exec = stmt.execute();
        if (!exec)
            return exec;
        if (db.changes() == 0) {
            return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id)};
        }
        return {};
    });
}

Result<void> SqliteKnowledgeStore::recordUsage(const std::vector<DocumentId>& ids,
                                               Timestamp when) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};
    if (ids.empty())
        return {};

    const std::set<DocumentId> unique(ids.begin(), ids.end());
    return pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            auto stmtResult = db.prepare("UPDATE documents SET usage_count = usage_count + 1, "
                                         "last_used_at = ? WHERE id = ?");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();
            for (auto id : unique) {
                auto reset = stmt.reset();
                if (!reset)
                    return reset;
                auto bound = stmt.bindAll(when, static_cast<int64_t>(id));
                if (!bound)
                    return bound;
                auto exec = stmt.execute();
                if (!exec)
                    return exec;
            }
            return {};
        });
    });
}

Result<bool> SqliteKnowledgeStore::deleteChunk(ChunkId id) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<bool> {
        bool found = false;
        auto tx = db.transaction([&]() -> Result<void> {
            auto sel = db.prepare("SELECT document_id FROM chunks WHERE id = ?");
            if (!sel)
                return sel.error();
            Statement selStmt = std::move(sel).value();
            auto bound = selStmt.bind(1, static_cast<int64_t>(id));
            if (!bound)
                return bound;
            auto step = selStmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                return {};
            const int64_t documentId = selStmt.getInt64(0);

            auto del = db.prepare("DELETE FROM chunks WHERE id = ?");
            if (!del)
                return del.error();
            Statement delStmt = std::move(del).value();
            bound = delStmt.bind(1, static_cast<int64_t>(id));
            if (!bound)
                return bound;
            auto exec = delStmt.execute();
            if (!exec)
                return exec;

            auto upd = db.prepare("UPDATE documents SET chunk_count = "
                                  "(SELECT COUNT(*) FROM chunks WHERE document_id = ?), "
                                  "updated_at = ? WHERE id = ?");
            if (!upd)
                return upd.error();
            Statement updStmt = std::move(upd).value();
            bound = updStmt.bindAll(documentId, nowSeconds(), documentId);
            if (!bound)
                return bound;
            exec = updStmt.execute();
            if (!exec)
                return exec;
            found = true;
            return {};
        });
        if (!tx)
            return tx.error();
        return found;
    });
}

Result<std::vector<DocumentId>>
SqliteKnowledgeStore::documentsWithForeignEmbeddings(const std::string& modelId) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<std::vector<DocumentId>> {
        auto stmtResult = db.prepare(
            "SELECT DISTINCT d.id FROM documents d JOIN chunks c ON c.document_id = d.id "
            "WHERE d.status = 'READY' AND (c.embedding_model IS NULL OR c.embedding_model != ?) "
            "ORDER BY d.id");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bound = stmt.bind(1, modelId);
        if (!bound)
            return bound.error();

        std::vector<DocumentId> ids;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            ids.push_back(stmt.getInt64(0));
        }
        return ids;
    });
}

Result<KnowledgeStats> SqliteKnowledgeStore::getStats() {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Knowledge store not initialized"};

    return pool_->withConnection([&](Database& db) -> Result<KnowledgeStats> {
        KnowledgeStats stats;

        auto totals = db.prepare(
            "SELECT COUNT(*), COALESCE(SUM(status = 'READY'), 0), COALESCE(SUM(usage_count), 0) "
            "FROM documents");
        if (!totals)
            return totals.error();
        Statement totalsStmt = std::move(totals).value();
        auto step = totalsStmt.step();
        if (!step)
            return step.error();
        if (step.value()) {
            stats.total_documents = totalsStmt.getInt64(0);
            stats.ready_documents = totalsStmt.getInt64(1);
            stats.total_usage = totalsStmt.getInt64(2);
        }

        auto chunks = db.prepare("SELECT COUNT(*), COUNT(embedding) FROM chunks");
        if (!chunks)
            return chunks.error();
        Statement chunksStmt = std::move(chunks).value();
        step = chunksStmt.step();
        if (!step)
            return step.error();
        if (step.value()) {
            stats.total_chunks = chunksStmt.getInt64(0);
            stats.chunks_with_embeddings = chunksStmt.getInt64(1);
        }

        auto grouped = [&](const char* column,
                           std::map<std::string, int64_t>& into) -> Result<void> {
            auto s = db.prepare(std::string("SELECT ") + column + ", COUNT(*) FROM documents GROUP BY " +
                                column);
            if (!s)
                return s.error();
            Statement st = std::move(s).value();
            while (true) {
                auto r = st.step();
                if (!r)
                    return r.error();
                if (!r.value())
                    break;
                into[st.getString(0)] = st.getInt64(1);
            }
            return {};
        };

        auto byType = grouped("doc_type", stats.by_type);
        if (!byType)
            return byType.error();
        auto byStatus = grouped("status", stats.by_status);
        if (!byStatus)
            return byStatus.error();

        return stats;
    });
}

} // namespace ragcore::metadata
