#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <ragcore/ingest/lifecycle_manager.h>

namespace ragcore::ingest {

using metadata::DocumentRecord;
using metadata::DocumentStatus;

LifecycleManager::LifecycleManager(std::shared_ptr<metadata::IKnowledgeStore> store,
                                   std::shared_ptr<IngestionGateway> gateway, size_t workers)
    : store_(std::move(store)), gateway_(std::move(gateway)), workers_(std::max<size_t>(1, workers)) {
    if (!store_ || !gateway_) {
        throw std::invalid_argument("LifecycleManager requires a store and a gateway");
    }
}

Result<DocumentRecord> LifecycleManager::reprocess(DocumentId id, std::stop_token stop) {
    auto requeued = store_->transitionStatus(id, {DocumentStatus::Ready, DocumentStatus::Failed},
                                             DocumentStatus::Pending);
    if (!requeued) {
        return requeued.error();
    }

    if (!requeued.value()) {
        auto current = store_->getDocument(id);
        if (!current) {
            return current.error();
        }
        if (!current.value()) {
            return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id)};
        }
        if (current.value()->status == DocumentStatus::Processing) {
            return Error{ErrorCode::OperationInProgress,
                         "Document " + std::to_string(id) + " is already being processed"};
        }
    }

    spdlog::info("Reprocess requested for document {}", id);
    return gateway_->process(id, stop);
}

Result<void> LifecycleManager::deleteDocument(DocumentId id) {
    auto current = store_->getDocument(id);
    if (!current) {
        return current.error();
    }
    if (!current.value()) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id)};
    }
    const DocumentRecord& doc = *current.value();

    auto deleted = store_->deleteDocumentCascade(id);
    if (!deleted) {
        spdlog::error("Deleting document {} failed: {}", id, deleted.error().message);
        return deleted.error();
    }
    if (!deleted.value()) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id)};
    }

    if (const auto* file = std::get_if<metadata::FileSource>(&doc.source);
        file && !file->file_path.empty()) {
        std::error_code ec;
        const bool removed = std::filesystem::remove(file->file_path, ec);
        if (ec) {
            spdlog::warn("Could not remove artifact {} of document {}: {}", file->file_path, id,
                         ec.message());
        } else if (!removed) {
            spdlog::debug("Artifact {} of document {} was already gone", file->file_path, id);
        }
    }

    spdlog::info("Deleted document {} '{}' ({} chunks)", id, doc.title, doc.chunk_count);
    return {};
}

Result<std::vector<DocumentId>> LifecycleManager::idsWithStatus(DocumentStatus status) {
    metadata::DocumentQuery query;
    query.status = status;
    query.limit = 0;
    auto docs = store_->listDocuments(query);
    if (!docs) {
        return docs.error();
    }

    std::vector<DocumentId> ids;
    ids.reserve(docs.value().size());
    for (const auto& doc : docs.value()) {
        ids.push_back(doc.id);
    }
    // Oldest first
    std::sort(ids.begin(), ids.end());
    return ids;
}

BatchReport LifecycleManager::runBatch(const std::vector<DocumentId>& ids,
                                       const DocumentTask& task, std::stop_token stop) {
    std::atomic<size_t> processed{0};
    std::atomic<size_t> failed{0};
    std::atomic<size_t> cancelled{0};
    std::atomic<size_t> skipped{0};

    boost::asio::thread_pool pool(std::min(workers_, std::max<size_t>(1, ids.size())));
    for (auto id : ids) {
        boost::asio::post(pool, [&, id]() {
            if (stop.stop_requested()) {
                cancelled.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            try {
                auto result = task(id);
                if (result) {
                    processed.fetch_add(1, std::memory_order_relaxed);
                    return;
                }
                switch (result.error().code) {
                    case ErrorCode::OperationCancelled:
                        cancelled.fetch_add(1, std::memory_order_relaxed);
                        break;
                    case ErrorCode::OperationInProgress:
                        spdlog::debug("Document {} claimed elsewhere; skipping", id);
                        skipped.fetch_add(1, std::memory_order_relaxed);
                        break;
                    default:
                        failed.fetch_add(1, std::memory_order_relaxed);
                        break;
                }
            } catch (const std::exception& e) {
                spdlog::error("Worker failed on document {}: {}", id, e.what());
                failed.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    pool.join();

    BatchReport report;
    report.processed = processed.load();
    report.failed = failed.load();
    report.cancelled = cancelled.load();
    report.skipped = skipped.load();
    return report;
}

Result<BatchReport> LifecycleManager::processPending(std::stop_token stop) {
    auto ids = idsWithStatus(DocumentStatus::Pending);
    if (!ids) {
        return ids.error();
    }
    if (ids.value().empty()) {
        return BatchReport{};
    }

    spdlog::info("Processing {} pending documents on {} workers", ids.value().size(), workers_);
    auto report = runBatch(
        ids.value(), [this, stop](DocumentId id) { return gateway_->process(id, stop); }, stop);
    spdlog::info("Pending pass done: {} processed, {} failed, {} cancelled", report.processed,
                 report.failed, report.cancelled);
    return report;
}

Result<size_t> LifecycleManager::resetFailed() {
    auto ids = idsWithStatus(DocumentStatus::Failed);
    if (!ids) {
        return ids.error();
    }

    size_t reset = 0;
    for (auto id : ids.value()) {
        auto moved = store_->transitionStatus(id, {DocumentStatus::Failed}, DocumentStatus::Pending);
        if (!moved) {
            return moved.error();
        }
        if (moved.value()) {
            ++reset;
        }
    }
    if (reset > 0) {
        spdlog::info("Reset {} failed documents to PENDING", reset);
    }
    return reset;
}

Result<BatchReport> LifecycleManager::refreshStaleEmbeddings(std::stop_token stop) {
    const auto& embedder = gateway_->embedder();
    if (embedder.isDegraded()) {
        spdlog::warn("Embedding provider is degraded; skipping embedding refresh");
        return BatchReport{};
    }

    auto ids = store_->documentsWithForeignEmbeddings(embedder.preferredModelId());
    if (!ids) {
        return ids.error();
    }
    if (ids.value().empty()) {
        return BatchReport{};
    }

    spdlog::info("Refreshing {} documents embedded by another model than {}", ids.value().size(),
                 embedder.preferredModelId());
    return runBatch(
        ids.value(), [this, stop](DocumentId id) { return reprocess(id, stop); }, stop);
}

Result<size_t> LifecycleManager::recoverInterrupted() {
    auto ids = idsWithStatus(DocumentStatus::Processing);
    if (!ids) {
        return ids.error();
    }

    size_t recovered = 0;
    for (auto id : ids.value()) {
        auto moved =
            store_->transitionStatus(id, {DocumentStatus::Processing}, DocumentStatus::Pending);
        if (!moved) {
            return moved.error();
        }
        if (moved.value()) {
            spdlog::warn("Document {} was left PROCESSING; requeued", id);
            ++recovered;
        }
    }
    return recovered;
}

} // namespace ragcore::ingest
