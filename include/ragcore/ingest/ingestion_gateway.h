#pragma once

#include <memory>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <ragcore/chunking/text_chunker.h>
#include <ragcore/core/types.h>
#include <ragcore/metadata/knowledge_store.h>
#include <ragcore/vector/embedder.h>

namespace ragcore::ingest {

/**
 * A document handed over by the extraction collaborator.
 *
 * File sources carry their extracted text. URL sources may arrive before the
 * crawler has fetched them; their text is attached later.
 */
struct IngestionRequest {
    std::string title;
    std::string description;
    metadata::DocumentType doc_type{metadata::DocumentType::Custom};
    metadata::DocumentScope scope{metadata::DocumentScope::Global};
    bool is_admin_managed{false};
    metadata::SourceDetails source{metadata::FileSource{}};
    std::optional<std::string> extracted_text;
    std::set<std::string> target_functions;
    std::set<std::string> target_platforms;
    std::set<std::string> tags;
    int priority{5};
    std::optional<std::string> owner;
};

/**
 * Admits documents (dedup, validation) and turns a document's text into
 * embedded chunks. Safe to call from several threads; per-document exclusion
 * comes from the store's status compare-and-swap.
 */
class IngestionGateway {
public:
    IngestionGateway(std::shared_ptr<metadata::IKnowledgeStore> store,
                     std::shared_ptr<vector::Embedder> embedder,
                     chunking::ChunkingConfig chunking = {});

    /**
     * Validate, dedup and create a PENDING document. Processing is a separate
     * step. DuplicateDocument errors carry the existing document id.
     */
    Result<metadata::DocumentRecord> addDocument(const IngestionRequest& request);

    /**
     * Chunk and embed a PENDING or FAILED document, then atomically replace its
     * chunk set and mark it READY. On failure the document is left FAILED with
     * the cause recorded and its previous chunks untouched. The stop token is
     * checked between chunks.
     */
    Result<metadata::DocumentRecord> process(DocumentId id, std::stop_token stop = {});

    /**
     * Store text fetched for a URL document and queue it for processing again
     */
    Result<void> attachExtractedText(DocumentId id, const std::string& text);

    // Stored priority: requested as-is for admin-managed documents, lowered by 2 otherwise
    static int effectivePriority(int requested, bool adminManaged);

    const vector::Embedder& embedder() const { return *embedder_; }
    const chunking::TextChunker& chunker() const { return chunker_; }

private:
    Result<metadata::DocumentRecord> admitsProcessing(DocumentId id);
    Error markFailed(DocumentId id, Error cause);

    std::shared_ptr<metadata::IKnowledgeStore> store_;
    std::shared_ptr<vector::Embedder> embedder_;
    chunking::TextChunker chunker_;
};

} // namespace ragcore::ingest
