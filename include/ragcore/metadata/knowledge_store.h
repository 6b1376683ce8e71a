#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <ragcore/metadata/connection_pool.h>
#include <ragcore/metadata/document_record.h>

namespace ragcore::metadata {

// Returns true when an existing document blocks the insert
using DuplicateRule = std::function<bool(const DocumentRecord& existing)>;

struct CreateOutcome {
    std::optional<DocumentId> created;
    std::optional<DocumentRecord> conflict; // set when created is empty
};

/**
 * Persistence contract for documents and their chunks.
 *
 * Every call is its own unit of work. Implementations must make replaceChunks
 * and deleteDocumentCascade atomic and must serialize concurrent writes to the
 * same document's chunk set.
 */
class IKnowledgeStore {
public:
    virtual ~IKnowledgeStore() = default;

    // Inserts doc (its id is ignored) and returns the assigned id
    virtual Result<DocumentId> createDocument(const DocumentRecord& doc) = 0;

    /**
     * Dedup-checked insert. Documents sharing doc.content_hash (narrowed by
     * filter) are read and offered to `blocks` in filter order inside the same
     * write transaction as the insert, so two callers can never both pass the
     * check. The first blocking match is returned instead of inserting.
     */
    virtual Result<CreateOutcome> createDocumentUnlessDuplicate(const DocumentRecord& doc,
                                                                const HashScopeFilter& filter,
                                                                const DuplicateRule& blocks) = 0;

    // Includes raw_content
    virtual Result<std::optional<DocumentRecord>> getDocument(DocumentId id) = 0;

    /**
     * Set status unconditionally. READY clears processing_error, FAILED records
     * error. NotFound for unknown ids.
     */
    virtual Result<void> updateDocumentStatus(DocumentId id, DocumentStatus status,
                                              std::optional<std::string> error = std::nullopt) = 0;

    /**
     * Compare-and-swap on status: moves id to `to` only if its current status is
     * one of `from`. Returns false when the document is missing or in another
     * state. Moving to PENDING clears processing_error.
     */
    virtual Result<bool> transitionStatus(DocumentId id, const std::vector<DocumentStatus>& from,
                                          DocumentStatus to) = 0;

    /**
     * Atomically delete every chunk of id and insert chunks, updating
     * chunk_count in the same transaction.
     */
    virtual Result<void> replaceChunks(DocumentId id, const std::vector<ChunkRecord>& chunks) = 0;

    /**
     * replaceChunks plus the move to READY (clearing processing_error) in one
     * transaction. On failure neither the chunk set nor the status changes.
     */
    virtual Result<void> commitChunks(DocumentId id, const std::vector<ChunkRecord>& chunks) = 0;

    // Deletes the document and its chunks in one transaction; false if absent
    virtual Result<bool> deleteDocumentCascade(DocumentId id) = 0;

    virtual Result<std::vector<DocumentRecord>>
    findByContentHash(const std::string& hash, const HashScopeFilter& filter) = 0;

    // Chunks of the given documents, ordered by document then chunk_index
    virtual Result<std::vector<ChunkRecord>> listChunks(const std::vector<DocumentId>& ids) = 0;

    /**
     * Store fetched text and requeue the document as PENDING in one statement.
     * Returns false, writing nothing, while the document is PROCESSING.
     */
    virtual Result<bool> attachRawContent(DocumentId id, const std::string& text) = 0;

    // Newest first; raw_content is not loaded
    virtual Result<std::vector<DocumentRecord>> listDocuments(const DocumentQuery& query) = 0;

    virtual Result<void> updateDocumentMetadata(DocumentId id, const DocumentUpdate& update) = 0;

    // usage_count += 1 and last_used_at = when, for each id
    virtual Result<void> recordUsage(const std::vector<DocumentId>& ids, Timestamp when) = 0;

    // Removes one chunk and recomputes its document's chunk_count; false if absent
    virtual Result<bool> deleteChunk(ChunkId id) = 0;

    // READY documents with at least one chunk not embedded by modelId
    virtual Result<std::vector<DocumentId>>
    documentsWithForeignEmbeddings(const std::string& modelId) = 0;

    virtual Result<KnowledgeStats> getStats() = 0;
};

/**
 * SQLite-backed store. Each operation checks a connection out of the pool and,
 * when it writes more than one row, runs inside its own transaction.
 */
class SqliteKnowledgeStore : public IKnowledgeStore {
public:
    explicit SqliteKnowledgeStore(std::string dbPath, ConnectionPoolConfig poolConfig = {});
    ~SqliteKnowledgeStore() override;

    SqliteKnowledgeStore(const SqliteKnowledgeStore&) = delete;
    SqliteKnowledgeStore& operator=(const SqliteKnowledgeStore&) = delete;

    /**
     * Open the pool and bring the schema to the latest version
     */
    Result<void> initialize();

    Result<DocumentId> createDocument(const DocumentRecord& doc) override;
    Result<CreateOutcome> createDocumentUnlessDuplicate(const DocumentRecord& doc,
                                                        const HashScopeFilter& filter,
                                                        const DuplicateRule& blocks) override;
    Result<std::optional<DocumentRecord>> getDocument(DocumentId id) override;
    Result<void> updateDocumentStatus(DocumentId id, DocumentStatus status,
                                      std::optional<std::string> error = std::nullopt) override;
    Result<bool> transitionStatus(DocumentId id, const std::vector<DocumentStatus>& from,
                                  DocumentStatus to) override;
    Result<void> replaceChunks(DocumentId id, const std::vector<ChunkRecord>& chunks) override;
    Result<void> commitChunks(DocumentId id, const std::vector<ChunkRecord>& chunks) override;
    Result<bool> deleteDocumentCascade(DocumentId id) override;
    Result<std::vector<DocumentRecord>> findByContentHash(const std::string& hash,
                                                          const HashScopeFilter& filter) override;
    Result<std::vector<ChunkRecord>> listChunks(const std::vector<DocumentId>& ids) override;
    Result<bool> attachRawContent(DocumentId id, const std::string& text) override;
    Result<std::vector<DocumentRecord>> listDocuments(const DocumentQuery& query) override;
    Result<void> updateDocumentMetadata(DocumentId id, const DocumentUpdate& update) override;
    Result<void> recordUsage(const std::vector<DocumentId>& ids, Timestamp when) override;
    Result<bool> deleteChunk(ChunkId id) override;
    Result<std::vector<DocumentId>>
    documentsWithForeignEmbeddings(const std::string& modelId) override;
    Result<KnowledgeStats> getStats() override;

    const std::string& path() const { return dbPath_; }

private:
    std::string dbPath_;
    std::unique_ptr<ConnectionPool> pool_;
    bool initialized_ = false;
};

} // namespace ragcore::metadata
