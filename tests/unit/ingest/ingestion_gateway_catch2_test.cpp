#include <atomic>
#include <latch>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <ragcore/crypto/hasher.h>
#include <ragcore/ingest/ingestion_gateway.h>
#include "support/knowledge_fixture.hpp"

using namespace ragcore;
using namespace ragcore::ingest;
using metadata::DocumentStatus;
using test_support::KnowledgeFixture;

namespace {

std::string longText(size_t sentences) {
    std::string out;
    for (size_t i = 0; i < sentences; ++i) {
        out += "Step " + std::to_string(i) + " isolates the affected host from the network. ";
    }
    return out;
}

} // namespace

TEST_CASE("IngestionGateway: rejects null collaborators", "[unit][ingest][gateway]") {
    KnowledgeFixture fix;
    CHECK_THROWS_AS(IngestionGateway(nullptr, fix.embedder), std::invalid_argument);
    CHECK_THROWS_AS(IngestionGateway(fix.store, nullptr), std::invalid_argument);
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: add creates a pending document",
                 "[unit][ingest][gateway]") {
    auto req = fileRequest("Ransomware playbook", "Contain first. Then eradicate.");
    req.doc_type = metadata::DocumentType::Playbook;
    req.tags = {"ir"};
    req.target_functions = {"response"};
    req.priority = 8;

    auto added = gateway->addDocument(req);
    REQUIRE(added.has_value());
    const auto& doc = added.value();
    CHECK(doc.id > 0);
    CHECK(doc.status == DocumentStatus::Pending);
    CHECK(doc.priority == 8);
    CHECK(doc.content_hash == crypto::SHA256Hasher::hashText("Contain first. Then eradicate."));

    auto stored = get(doc.id);
    CHECK(stored.title == "Ransomware playbook");
    CHECK(stored.doc_type == metadata::DocumentType::Playbook);
    CHECK(stored.raw_content == std::optional<std::string>("Contain first. Then eradicate."));
    CHECK(stored.tags == std::set<std::string>{"ir"});
    CHECK(stored.chunk_count == 0);
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: request validation",
                 "[unit][ingest][gateway]") {
    SECTION("blank title") {
        auto r = gateway->addDocument(fileRequest("   ", "text"));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }
    SECTION("priority out of range") {
        auto req = fileRequest("t", "text");
        req.priority = 0;
        CHECK(gateway->addDocument(req).error().code == ErrorCode::InvalidArgument);
        req.priority = 11;
        CHECK(gateway->addDocument(req).error().code == ErrorCode::InvalidArgument);
    }
    SECTION("file without extracted text") {
        auto req = fileRequest("t", " \n ");
        auto r = gateway->addDocument(req);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::ExtractionFailed);
    }
    SECTION("user scope without owner") {
        auto req = fileRequest("t", "text");
        req.scope = metadata::DocumentScope::User;
        CHECK(gateway->addDocument(req).error().code == ErrorCode::InvalidArgument);
    }
    SECTION("url without url") {
        IngestionRequest req;
        req.title = "t";
        req.source = metadata::UrlSource{};
        CHECK(gateway->addDocument(req).error().code == ErrorCode::InvalidArgument);
    }

    auto all = sqlite->listDocuments({});
    REQUIRE(all.has_value());
    CHECK(all.value().empty());
}

TEST_CASE("IngestionGateway: non-admin priority is lowered", "[unit][ingest][gateway]") {
    CHECK(IngestionGateway::effectivePriority(5, true) == 5);
    CHECK(IngestionGateway::effectivePriority(5, false) == 3);
    CHECK(IngestionGateway::effectivePriority(10, false) == 8);
    CHECK(IngestionGateway::effectivePriority(2, false) == 1);
    CHECK(IngestionGateway::effectivePriority(1, false) == 1);
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: duplicate detection",
                 "[unit][ingest][gateway]") {
    const std::string text = "Block outbound SMB at the perimeter.";

    SECTION("admin copy shadows a user upload") {
        auto adminId = addDocument(fileRequest("Perimeter policy", text, true));

        auto r = gateway->addDocument(fileRequest("My notes", text, false, "alice"));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::DuplicateDocument);
        REQUIRE(r.error().relatedDocument.has_value());
        CHECK(*r.error().relatedDocument == adminId);
    }

    SECTION("same owner uploading twice") {
        auto first = addDocument(fileRequest("Mine", text, false, "alice"));
        auto r = gateway->addDocument(fileRequest("Mine again", text, false, "alice"));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::DuplicateDocument);
        CHECK(r.error().relatedDocument == std::optional<DocumentId>(first));
    }

    SECTION("different owners may hold the same text") {
        addDocument(fileRequest("Alice copy", text, false, "alice"));
        auto r = gateway->addDocument(fileRequest("Bob copy", text, false, "bob"));
        CHECK(r.has_value());
    }

    SECTION("admin upload is not blocked by a user copy") {
        addDocument(fileRequest("Alice copy", text, false, "alice"));
        auto r = gateway->addDocument(fileRequest("Official", text, true));
        CHECK(r.has_value());
    }

    SECTION("every match is checked, not only the first") {
        addDocument(fileRequest("Alice copy", text, false, "alice"));
        auto bobId = addDocument(fileRequest("Bob copy", text, false, "bob"));
        auto r = gateway->addDocument(fileRequest("Bob again", text, false, "bob"));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().relatedDocument == std::optional<DocumentId>(bobId));
    }

    SECTION("deactivated documents do not count") {
        auto oldId = addDocument(fileRequest("Old", text, true));
        metadata::DocumentUpdate off;
        off.is_active = false;
        REQUIRE(sqlite->updateDocumentMetadata(oldId, off).has_value());
        CHECK(gateway->addDocument(fileRequest("New", text, true)).has_value());
    }
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: concurrent identical uploads create one document",
                 "[unit][ingest][gateway][concurrency]") {
    constexpr int kThreads = 8;
    const std::string text = "Rotate the VPN pre-shared key after every contractor offboarding.";
    std::atomic<int> created{0};
    std::atomic<int> duplicates{0};
    std::atomic<int> other{0};
    std::latch start(kThreads);

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            auto req = fileRequest("Copy " + std::to_string(i), text, false, "alice");
            start.arrive_and_wait();
            auto r = gateway->addDocument(req);
            if (r) {
                ++created;
            } else if (r.error().code == ErrorCode::DuplicateDocument) {
                ++duplicates;
            } else {
                ++other;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(created.load() == 1);
    CHECK(duplicates.load() == kThreads - 1);
    CHECK(other.load() == 0);

    auto matches = sqlite->findByContentHash(crypto::SHA256Hasher::hashText(text), {});
    REQUIRE(matches.has_value());
    CHECK(matches.value().size() == 1);
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: duplicate stored after validation still blocks",
                 "[unit][ingest][gateway]") {
    const std::string text = "Disable legacy NTLM on domain controllers.";
    DocumentId raced = 0;
    store->beforeCreate = [&]() {
        metadata::DocumentRecord doc;
        doc.title = "Raced copy";
        doc.scope = metadata::DocumentScope::User;
        doc.source = metadata::FileSource{"raced.txt", "", text.size(), "text/plain"};
        doc.content_hash = crypto::SHA256Hasher::hashText(text);
        doc.raw_content = text;
        doc.uploaded_by = "alice";
        auto id = sqlite->createDocument(doc);
        REQUIRE(id.has_value());
        raced = id.value();
    };

    auto r = gateway->addDocument(fileRequest("Mine", text, false, "alice"));
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::DuplicateDocument);
    REQUIRE(r.error().relatedDocument.has_value());
    CHECK(*r.error().relatedDocument == raced);
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: URL documents are keyed by URL",
                 "[unit][ingest][gateway]") {
    IngestionRequest req;
    req.title = "Vendor advisory";
    req.is_admin_managed = true;
    req.source = metadata::UrlSource{"https://vendor.example/advisory", 1, 0};

    auto added = gateway->addDocument(req);
    REQUIRE(added.has_value());
    CHECK(added.value().content_hash ==
          crypto::SHA256Hasher::hashText("https://vendor.example/advisory"));
    CHECK_FALSE(get(added.value().id).raw_content.has_value());

    auto dup = gateway->addDocument(req);
    REQUIRE_FALSE(dup.has_value());
    CHECK(dup.error().code == ErrorCode::DuplicateDocument);

    // Not fetched yet
    auto early = gateway->process(added.value().id);
    REQUIRE_FALSE(early.has_value());
    CHECK(early.error().code == ErrorCode::ExtractionFailed);
    CHECK(get(added.value().id).status == DocumentStatus::Failed);

    REQUIRE(gateway->attachExtractedText(added.value().id, "Patch CVE-2024-0001 now.")
                .has_value());
    auto requeued = get(added.value().id);
    CHECK(requeued.status == DocumentStatus::Pending);
    CHECK_FALSE(requeued.processing_error.has_value());

    auto processed = gateway->process(added.value().id);
    REQUIRE(processed.has_value());
    CHECK(processed.value().status == DocumentStatus::Ready);
    CHECK(processed.value().chunk_count == 1);
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: attach validation",
                 "[unit][ingest][gateway]") {
    auto fileId = addDocument(fileRequest("File", "body text"));
    CHECK(gateway->attachExtractedText(fileId, "x").error().code == ErrorCode::InvalidArgument);
    CHECK(gateway->attachExtractedText(fileId, "  ").error().code == ErrorCode::ExtractionFailed);
    CHECK(gateway->attachExtractedText(9999, "x").error().code == ErrorCode::NotFound);
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: attach loses to a pass that claimed the document",
                 "[unit][ingest][gateway]") {
    IngestionRequest req;
    req.title = "Threat feed";
    req.is_admin_managed = true;
    req.source = metadata::UrlSource{"https://feed.example/latest", 1, 0};
    req.extracted_text = "Old feed body.";
    auto id = addDocument(req);

    // A processing pass claims the document between the status read and the write
    store->beforeAttach = [&]() {
        auto claimed =
            sqlite->transitionStatus(id, {DocumentStatus::Pending}, DocumentStatus::Processing);
        REQUIRE(claimed.has_value());
        REQUIRE(claimed.value());
    };

    auto r = gateway->attachExtractedText(id, "New feed body.");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::OperationInProgress);

    auto doc = get(id);
    CHECK(doc.status == DocumentStatus::Processing);
    CHECK(doc.raw_content == std::optional<std::string>("Old feed body."));
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: attach requeues a READY document",
                 "[unit][ingest][gateway]") {
    IngestionRequest req;
    req.title = "Threat feed";
    req.is_admin_managed = true;
    req.source = metadata::UrlSource{"https://feed.example/today", 1, 0};
    req.extracted_text = "Morning feed body.";
    auto id = addReady(req);

    REQUIRE(gateway->attachExtractedText(id, "Evening feed body.").has_value());
    auto doc = get(id);
    CHECK(doc.status == DocumentStatus::Pending);
    CHECK(doc.raw_content == std::optional<std::string>("Evening feed body."));
    CHECK(doc.content_hash == crypto::SHA256Hasher::hashText("https://feed.example/today"));
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: process builds embedded chunks",
                 "[unit][ingest][gateway]") {
    auto id = addDocument(fileRequest("Isolation runbook", longText(12)));

    auto processed = gateway->process(id);
    REQUIRE(processed.has_value());
    CHECK(processed.value().status == DocumentStatus::Ready);

    auto doc = get(id);
    CHECK(doc.status == DocumentStatus::Ready);
    CHECK_FALSE(doc.processing_error.has_value());

    auto chunks = chunksOf(id);
    REQUIRE(chunks.size() > 1);
    CHECK(doc.chunk_count == static_cast<int64_t>(chunks.size()));
    for (size_t i = 0; i < chunks.size(); ++i) {
        CHECK(chunks[i].chunk_index == static_cast<int64_t>(i));
        CHECK_FALSE(chunks[i].content.empty());
        CHECK(chunks[i].embedding == std::vector<float>{0.0f, 0.0f, 1.0f});
        CHECK(chunks[i].embedding_model == "scripted:v1");
    }
    CHECK(provider->calls() == chunks.size());
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: process state guards",
                 "[unit][ingest][gateway]") {
    auto id = addReady(fileRequest("Doc", "Some content."));

    auto again = gateway->process(id);
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == ErrorCode::InvalidState);

    REQUIRE(sqlite->updateDocumentStatus(id, DocumentStatus::Processing).has_value());
    auto busy = gateway->process(id);
    REQUIRE_FALSE(busy.has_value());
    CHECK(busy.error().code == ErrorCode::OperationInProgress);
    CHECK(get(id).status == DocumentStatus::Processing);

    auto missing = gateway->process(123456);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: embedding failure marks FAILED",
                 "[unit][ingest][gateway]") {
    auto id = addDocument(fileRequest("Doc", longText(8)));
    provider->setFailing(true);

    auto r = gateway->process(id);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::ProcessingFailed);

    auto doc = get(id);
    CHECK(doc.status == DocumentStatus::Failed);
    REQUIRE(doc.processing_error.has_value());
    CHECK(doc.processing_error->find("scripted provider offline") != std::string::npos);
    CHECK(chunksOf(id).empty());

    // FAILED documents can be processed again once the provider recovers
    provider->setFailing(false);
    auto retried = gateway->process(id);
    REQUIRE(retried.has_value());
    CHECK(get(id).status == DocumentStatus::Ready);
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: failed rebuild keeps previous chunks",
                 "[unit][ingest][gateway]") {
    auto id = addReady(fileRequest("Doc", longText(8)));
    const auto before = chunksOf(id);
    REQUIRE_FALSE(before.empty());

    REQUIRE(sqlite->transitionStatus(id, {DocumentStatus::Ready}, DocumentStatus::Pending)
                .has_value());
    store->failReplaceChunks = true;

    auto r = gateway->process(id);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::ProcessingFailed);

    auto doc = get(id);
    CHECK(doc.status == DocumentStatus::Failed);
    CHECK(doc.chunk_count == static_cast<int64_t>(before.size()));
    auto after = chunksOf(id);
    REQUIRE(after.size() == before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        CHECK(after[i].id == before[i].id);
        CHECK(after[i].content == before[i].content);
    }
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: cancellation between chunks",
                 "[unit][ingest][gateway]") {
    auto id = addDocument(fileRequest("Doc", longText(12)));

    SECTION("stop requested before the first chunk") {
        std::stop_source source;
        source.request_stop();
        auto r = gateway->process(id, source.get_token());
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::OperationCancelled);
        CHECK(provider->calls() == 0);
    }

    SECTION("stop requested mid-document") {
        std::stop_source source;
        provider->onEmbed([&source](size_t call) {
            if (call == 2) {
                source.request_stop();
            }
        });
        auto r = gateway->process(id, source.get_token());
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::OperationCancelled);
        CHECK(provider->calls() == 2);
    }

    auto doc = get(id);
    CHECK(doc.status == DocumentStatus::Failed);
    REQUIRE(doc.processing_error.has_value());
    CHECK(doc.processing_error->find("cancelled") != std::string::npos);
    CHECK(chunksOf(id).empty());
}

TEST_CASE_METHOD(KnowledgeFixture, "IngestionGateway: same text always yields the same chunks",
                 "[unit][ingest][gateway]") {
    const auto text = longText(10);
    auto a = addReady(fileRequest("A", text, false, "alice"));
    auto b = addReady(fileRequest("B", text, false, "bob"));

    auto ca = chunksOf(a);
    auto cb = chunksOf(b);
    REQUIRE(ca.size() == cb.size());
    for (size_t i = 0; i < ca.size(); ++i) {
        CHECK(ca[i].content == cb[i].content);
        CHECK(ca[i].start_char == cb[i].start_char);
        CHECK(ca[i].end_char == cb[i].end_char);
    }
}
