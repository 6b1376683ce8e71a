#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stop_token>
#include <vector>
#include <ragcore/ingest/ingestion_gateway.h>
#include <ragcore/metadata/knowledge_store.h>

namespace ragcore::ingest {

/**
 * Outcome counts of a batch pass
 */
struct BatchReport {
    size_t processed = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    size_t skipped = 0; // Already claimed by another worker
};

/**
 * Drives documents through PENDING -> PROCESSING -> {READY, FAILED}, plus
 * reprocess and deletion. Documents are independent; batches run in parallel on
 * a fixed worker pool.
 */
class LifecycleManager {
public:
    LifecycleManager(std::shared_ptr<metadata::IKnowledgeStore> store,
                     std::shared_ptr<IngestionGateway> gateway, size_t workers = 2);

    /**
     * READY or FAILED back to PENDING, then process. A document already
     * PROCESSING is OperationInProgress.
     */
    Result<metadata::DocumentRecord> reprocess(DocumentId id, std::stop_token stop = {});

    // Cascade delete, then best-effort removal of the backing file artifact
    Result<void> deleteDocument(DocumentId id);

    Result<BatchReport> processPending(std::stop_token stop = {});

    // FAILED -> PENDING for every failed document; returns how many moved
    Result<size_t> resetFailed();

    /**
     * Reprocess READY documents whose chunks were embedded by a model other
     * than the embedder's preferred one. Skipped while the embedder is degraded.
     */
    Result<BatchReport> refreshStaleEmbeddings(std::stop_token stop = {});

    // PROCESSING -> PENDING for passes a dead process left behind. Call at startup.
    Result<size_t> recoverInterrupted();

private:
    using DocumentTask = std::function<Result<metadata::DocumentRecord>(DocumentId)>;

    BatchReport runBatch(const std::vector<DocumentId>& ids, const DocumentTask& task,
                         std::stop_token stop);
    Result<std::vector<DocumentId>> idsWithStatus(metadata::DocumentStatus status);

    std::shared_ptr<metadata::IKnowledgeStore> store_;
    std::shared_ptr<IngestionGateway> gateway_;
    size_t workers_;
};

} // namespace ragcore::ingest
