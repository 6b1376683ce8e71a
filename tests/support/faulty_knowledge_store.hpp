#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <ragcore/metadata/knowledge_store.h>

namespace ragcore::test_support {

/**
 * Delegates to a real store, with switches that make selected writes fail and
 * hooks that run just before selected writes reach the inner store
 */
class FaultyKnowledgeStore : public metadata::IKnowledgeStore {
public:
    explicit FaultyKnowledgeStore(std::shared_ptr<metadata::IKnowledgeStore> inner)
        : inner_(std::move(inner)) {}

    std::atomic<bool> failReplaceChunks{false};
    std::atomic<bool> failRecordUsage{false};

    // Set before use, not while other threads call the store
    std::function<void()> beforeCreate;
    std::function<void()> beforeAttach;

    Result<DocumentId> createDocument(const metadata::DocumentRecord& doc) override {
        return inner_->createDocument(doc);
    }
    Result<metadata::CreateOutcome>
    createDocumentUnlessDuplicate(const metadata::DocumentRecord& doc,
                                  const metadata::HashScopeFilter& filter,
                                  const metadata::DuplicateRule& blocks) override {
        if (beforeCreate) {
            beforeCreate();
        }
        return inner_->createDocumentUnlessDuplicate(doc, filter, blocks);
    }
    Result<std::optional<metadata::DocumentRecord>> getDocument(DocumentId id) override {
        return inner_->getDocument(id);
    }
    Result<void> updateDocumentStatus(DocumentId id, metadata::DocumentStatus status,
                                      std::optional<std::string> error) override {
        return inner_->updateDocumentStatus(id, status, std::move(error));
    }
    Result<bool> transitionStatus(DocumentId id, const std::vector<metadata::DocumentStatus>& from,
                                  metadata::DocumentStatus to) override {
        return inner_->transitionStatus(id, from, to);
    }
    Result<void> replaceChunks(DocumentId id,
                               const std::vector<metadata::ChunkRecord>& chunks) override {
        if (failReplaceChunks.load()) {
            return Error{ErrorCode::TransactionFailed, "injected replaceChunks failure"};
        }
        return inner_->replaceChunks(id, chunks);
    }
    Result<void> commitChunks(DocumentId id,
                              const std::vector<metadata::ChunkRecord>& chunks) override {
        if (failReplaceChunks.load()) {
            return Error{ErrorCode::TransactionFailed, "injected commitChunks failure"};
        }
        return inner_->commitChunks(id, chunks);
    }
    Result<bool> deleteDocumentCascade(DocumentId id) override {
        return inner_->deleteDocumentCascade(id);
    }
    Result<std::vector<metadata::DocumentRecord>>
    findByContentHash(const std::string& hash, const metadata::HashScopeFilter& filter) override {
        return inner_->findByContentHash(hash, filter);
    }
    Result<std::vector<metadata::ChunkRecord>>
    listChunks(const std::vector<DocumentId>& ids) override {
        return inner_->listChunks(ids);
    }
    Result<bool> attachRawContent(DocumentId id, const std::string& text) override {
        if (beforeAttach) {
            beforeAttach();
        }
        return inner_->attachRawContent(id, text);
    }
    Result<std::vector<metadata::DocumentRecord>>
    listDocuments(const metadata::DocumentQuery& query) override {
        return inner_->listDocuments(query);
    }
    Result<void> updateDocumentMetadata(DocumentId id,
                                        const metadata::DocumentUpdate& update) override {
        return inner_->updateDocumentMetadata(id, update);
    }
    Result<void> recordUsage(const std::vector<DocumentId>& ids,
                             metadata::Timestamp when) override {
        if (failRecordUsage.load()) {
            return Error{ErrorCode::DatabaseError, "injected recordUsage failure"};
        }
        return inner_->recordUsage(ids, when);
    }
    Result<bool> deleteChunk(ChunkId id) override { return inner_->deleteChunk(id); }
    Result<std::vector<DocumentId>>
    documentsWithForeignEmbeddings(const std::string& modelId) override {
        return inner_->documentsWithForeignEmbeddings(modelId);
    }
    Result<metadata::KnowledgeStats> getStats() override { return inner_->getStats(); }

private:
    std::shared_ptr<metadata::IKnowledgeStore> inner_;
};

} // namespace ragcore::test_support
