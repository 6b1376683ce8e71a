#pragma once

#include <memory>
#include <optional>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include <ragcore/ingest/ingestion_gateway.h>
#include <ragcore/metadata/knowledge_store.h>
#include <ragcore/vector/embedder.h>
#include "support/faulty_knowledge_store.hpp"
#include "support/temp_dir_scope.hpp"
#include "support/test_embedding_providers.hpp"

namespace ragcore::test_support {

/**
 * SQLite store in a temp dir, wrapped for fault injection, with an embedder
 * backed by a scripted provider and no fallback.
 */
struct KnowledgeFixture {
    explicit KnowledgeFixture(std::shared_ptr<ml::IEmbeddingProvider> primary = nullptr)
        : dir(TempDirScope::unique_under("ragcore-kb")) {
        sqlite = std::make_shared<metadata::SqliteKnowledgeStore>((dir.path() / "kb.db").string());
        auto init = sqlite->initialize();
        REQUIRE(init.has_value());
        store = std::make_shared<FaultyKnowledgeStore>(sqlite);

        provider = std::make_shared<ScriptedEmbeddingProvider>(std::vector<float>{0.0f, 0.0f, 1.0f});
        vector::EmbeddingStrategy strategy;
        strategy.primary = primary ? std::move(primary) : provider;
        embedder = std::make_shared<vector::Embedder>(std::move(strategy));

        chunking::ChunkingConfig chunking;
        chunking.chunk_size = 200;
        chunking.overlap = 40;
        gateway = std::make_shared<ingest::IngestionGateway>(store, embedder, chunking);
    }

    static ingest::IngestionRequest fileRequest(const std::string& title, const std::string& text,
                                                bool admin = true,
                                                std::optional<std::string> owner = std::nullopt) {
        ingest::IngestionRequest req;
        req.title = title;
        req.is_admin_managed = admin;
        req.scope = owner ? metadata::DocumentScope::User : metadata::DocumentScope::Global;
        req.owner = std::move(owner);
        req.source = metadata::FileSource{title + ".txt", "", text.size(), "text/plain"};
        req.extracted_text = text;
        return req;
    }

    DocumentId addDocument(const ingest::IngestionRequest& req) {
        auto added = gateway->addDocument(req);
        REQUIRE(added.has_value());
        return added.value().id;
    }

    // Adds and processes a document; returns its id
    DocumentId addReady(const ingest::IngestionRequest& req) {
        auto id = addDocument(req);
        auto processed = gateway->process(id);
        REQUIRE(processed.has_value());
        return id;
    }

    metadata::DocumentRecord get(DocumentId id) {
        auto r = sqlite->getDocument(id);
        REQUIRE(r.has_value());
        REQUIRE(r.value().has_value());
        return *r.value();
    }

    std::vector<metadata::ChunkRecord> chunksOf(DocumentId id) {
        auto r = sqlite->listChunks({id});
        REQUIRE(r.has_value());
        return r.value();
    }

    TempDirScope dir;
    std::shared_ptr<metadata::SqliteKnowledgeStore> sqlite;
    std::shared_ptr<FaultyKnowledgeStore> store;
    std::shared_ptr<ScriptedEmbeddingProvider> provider;
    std::shared_ptr<vector::Embedder> embedder;
    std::shared_ptr<ingest::IngestionGateway> gateway;
};

} // namespace ragcore::test_support
