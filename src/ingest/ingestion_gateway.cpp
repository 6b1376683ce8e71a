#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <ragcore/crypto/hasher.h>
#include <ragcore/ingest/ingestion_gateway.h>

namespace ragcore::ingest {

using metadata::ChunkRecord;
using metadata::DocumentRecord;
using metadata::DocumentStatus;

namespace {

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

IngestionGateway::IngestionGateway(std::shared_ptr<metadata::IKnowledgeStore> store,
                                   std::shared_ptr<vector::Embedder> embedder,
                                   chunking::ChunkingConfig chunking)
    : store_(std::move(store)), embedder_(std::move(embedder)), chunker_(std::move(chunking)) {
    if (!store_ || !embedder_) {
        throw std::invalid_argument("IngestionGateway requires a store and an embedder");
    }
}

int IngestionGateway::effectivePriority(int requested, bool adminManaged) {
    if (adminManaged) {
        return requested;
    }
    return std::max(1, requested - 2);
}

Result<DocumentRecord> IngestionGateway::addDocument(const IngestionRequest& request) {
    if (isBlank(request.title)) {
        return Error{ErrorCode::InvalidArgument, "Document title must not be empty"};
    }
    if (request.priority < 1 || request.priority > 10) {
        return Error{ErrorCode::InvalidArgument,
                     "Priority must be between 1 and 10, got " + std::to_string(request.priority)};
    }
    if (request.scope == metadata::DocumentScope::User && !request.owner) {
        return Error{ErrorCode::InvalidArgument, "User-scoped documents require an owner"};
    }

    std::string contentHash;
    std::optional<std::string> rawContent;
    if (const auto* url = std::get_if<metadata::UrlSource>(&request.source)) {
        if (isBlank(url->url)) {
            return Error{ErrorCode::InvalidArgument, "URL source requires a URL"};
        }
        // The URL is the identity of a crawled document, even once its text arrives
        contentHash = crypto::SHA256Hasher::hashText(url->url);
        if (request.extracted_text && !isBlank(*request.extracted_text)) {
            rawContent = request.extracted_text;
        }
    } else {
        if (!request.extracted_text || isBlank(*request.extracted_text)) {
            return Error{ErrorCode::ExtractionFailed,
                         "No text could be extracted from '" + request.title + "'"};
        }
        contentHash = crypto::SHA256Hasher::hashText(*request.extracted_text);
        rawContent = request.extracted_text;
    }

    DocumentRecord doc;
    doc.title = request.title;
    doc.description = request.description;
    doc.doc_type = request.doc_type;
    doc.scope = request.scope;
    doc.is_admin_managed = request.is_admin_managed;
    doc.source = request.source;
    doc.content_hash = contentHash;
    doc.raw_content = std::move(rawContent);
    doc.status = DocumentStatus::Pending;
    doc.target_functions = request.target_functions;
    doc.target_platforms = request.target_platforms;
    doc.tags = request.tags;
    doc.priority = effectivePriority(request.priority, request.is_admin_managed);
    doc.uploaded_by = request.owner;
    doc.created_at = metadata::nowSeconds();
    doc.updated_at = doc.created_at;

    metadata::HashScopeFilter filter;
    filter.active_only = true;
    filter.prefer_admin_managed = request.scope == metadata::DocumentScope::User;
    auto blocks = [&request](const DocumentRecord& existing) {
        const bool shadowsUpload = existing.is_admin_managed && !request.is_admin_managed;
        const bool sameOwner = existing.uploaded_by == request.owner;
        return shadowsUpload || sameOwner;
    };

    auto outcome = store_->createDocumentUnlessDuplicate(doc, filter, blocks);
    if (!outcome) {
        spdlog::error("Failed to store document '{}': {}", request.title,
                      outcome.error().message);
        return outcome.error();
    }
    if (const auto& existing = outcome.value().conflict) {
        spdlog::info("Rejected duplicate upload '{}': matches document {}", request.title,
                     existing->id);
        return Error{ErrorCode::DuplicateDocument,
                     "Document with the same content already exists: " +
                         std::to_string(existing->id) + " ('" + existing->title + "')",
                     existing->id};
    }
    doc.id = *outcome.value().created;

    spdlog::info("Added document {} '{}' ({}, priority {})", doc.id, doc.title,
                 metadata::toString(doc.doc_type), doc.priority);
    return doc;
}

Result<DocumentRecord> IngestionGateway::admitsProcessing(DocumentId id) {
    auto claimed = store_->transitionStatus(id, {DocumentStatus::Pending, DocumentStatus::Failed},
                                            DocumentStatus::Processing);
    if (!claimed) {
        return claimed.error();
    }

    auto current = store_->getDocument(id);
    if (!current) {
        return current.error();
    }
    if (!current.value()) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id)};
    }
    if (claimed.value()) {
        return std::move(*current.value());
    }

    switch (current.value()->status) {
        case DocumentStatus::Processing:
            return Error{ErrorCode::OperationInProgress,
                         "Document " + std::to_string(id) + " is already being processed"};
        case DocumentStatus::Ready:
            return Error{ErrorCode::InvalidState,
                         "Document " + std::to_string(id) + " is READY; use reprocess"};
        default:
            // Status moved between the swap and the read; let the caller retry
            return Error{ErrorCode::OperationInProgress,
                         "Document " + std::to_string(id) + " changed state concurrently"};
    }
}

Error IngestionGateway::markFailed(DocumentId id, Error cause) {
    auto marked = store_->updateDocumentStatus(id, DocumentStatus::Failed, cause.message);
    if (!marked) {
        spdlog::error("Could not record failure for document {}: {}", id,
                      marked.error().message);
    }
    spdlog::error("Processing document {} failed: {}", id, cause.message);
    return cause;
}

Result<DocumentRecord> IngestionGateway::process(DocumentId id, std::stop_token stop) {
    auto admitted = admitsProcessing(id);
    if (!admitted) {
        return admitted.error();
    }
    DocumentRecord doc = std::move(admitted).value();

    if (!doc.raw_content || isBlank(*doc.raw_content)) {
        return markFailed(id, Error{ErrorCode::ExtractionFailed,
                                    "Document " + std::to_string(id) + " has no extracted text"});
    }

    auto pieces = chunker_.chunk(*doc.raw_content);
    if (pieces.empty()) {
        return markFailed(id, Error{ErrorCode::ExtractionFailed,
                                    "Chunking produced no chunks for document " +
                                        std::to_string(id)});
    }
    spdlog::debug("Document {} split into {} chunks", id, pieces.size());

    std::vector<ChunkRecord> chunks;
    chunks.reserve(pieces.size());
    size_t degraded = 0;
    for (const auto& piece : pieces) {
        if (stop.stop_requested()) {
            return markFailed(id, Error{ErrorCode::OperationCancelled,
                                        "Processing cancelled after " +
                                            std::to_string(chunks.size()) + " of " +
                                            std::to_string(pieces.size()) + " chunks"});
        }

        auto embedded = embedder_->embed(piece.content);
        if (!embedded) {
            return markFailed(id, Error{ErrorCode::ProcessingFailed,
                                        "Embedding chunk " + std::to_string(piece.index) +
                                            " failed: " + embedded.error().message});
        }
        auto& result = embedded.value();
        if (result.degraded) {
            ++degraded;
        }

        ChunkRecord chunk;
        chunk.document_id = id;
        chunk.chunk_index = static_cast<int64_t>(piece.index);
        chunk.content = piece.content;
        chunk.token_count = static_cast<int64_t>(piece.token_count);
        chunk.embedding = std::move(result.embedding);
        chunk.embedding_model = std::move(result.model_id);
        chunk.start_char = static_cast<int64_t>(piece.start_char);
        chunk.end_char = static_cast<int64_t>(piece.end_char);
        chunks.push_back(std::move(chunk));
    }

    auto committed = store_->commitChunks(id, chunks);
    if (!committed) {
        return markFailed(id, Error{ErrorCode::ProcessingFailed,
                                    "Storing chunks failed: " + committed.error().message});
    }

    if (degraded > 0) {
        spdlog::warn("Document {} processed with {} fallback embeddings", id, degraded);
    }
    spdlog::info("Processed document {} '{}': {} chunks", id, doc.title, chunks.size());

    doc.status = DocumentStatus::Ready;
    doc.chunk_count = static_cast<int64_t>(chunks.size());
    doc.processing_error.reset();
    return doc;
}

Result<void> IngestionGateway::attachExtractedText(DocumentId id, const std::string& text) {
    if (isBlank(text)) {
        return Error{ErrorCode::ExtractionFailed,
                     "Fetched text for document " + std::to_string(id) + " is empty"};
    }

    auto current = store_->getDocument(id);
    if (!current) {
        return current.error();
    }
    if (!current.value()) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id)};
    }
    const auto& doc = *current.value();
    if (doc.sourceType() != metadata::SourceType::Url) {
        return Error{ErrorCode::InvalidArgument,
                     "Document " + std::to_string(id) + " is not a URL document"};
    }

    // Text and status change together; a pass that claimed the document first wins
    auto requeued = store_->attachRawContent(id, text);
    if (!requeued) {
        return requeued.error();
    }
    if (!requeued.value()) {
        return Error{ErrorCode::OperationInProgress,
                     "Document " + std::to_string(id) + " is being processed"};
    }

    spdlog::info("Attached {} bytes of fetched text to document {}", text.size(), id);
    return {};
}

} // namespace ragcore::ingest
