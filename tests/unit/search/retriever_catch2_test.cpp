#include <cmath>
#include <set>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <ragcore/search/retriever.h>
#include "support/knowledge_fixture.hpp"

using namespace ragcore;
using namespace ragcore::search;
using Catch::Approx;
using metadata::DocumentStatus;
using test_support::KnowledgeFixture;

namespace {

const std::string kQuery = "how do I hunt for credential dumping";

// Unit vector whose cosine with the query vector {1, 0, 0} is `similarity`
std::vector<float> at(double similarity) {
    return {static_cast<float>(similarity),
            static_cast<float>(std::sqrt(1.0 - similarity * similarity)), 0.0f};
}

struct RetrieverFixture : KnowledgeFixture {
    RetrieverFixture() : retriever(std::make_shared<Retriever>(store, embedder)) {
        provider->setVector(kQuery, {1.0f, 0.0f, 0.0f});
    }

    struct DocSpec {
        std::string title;
        std::string content;
        double similarity = 0.9;
        bool admin = true;
        std::optional<std::string> owner;
        int priority = 10;
        std::set<std::string> functions;
        std::set<std::string> platforms;
        metadata::DocumentType type = metadata::DocumentType::Custom;
    };

    DocumentId add(const DocSpec& spec) {
        auto req = fileRequest(spec.title, spec.content, spec.admin, spec.owner);
        req.priority = spec.priority;
        req.target_functions = spec.functions;
        req.target_platforms = spec.platforms;
        req.doc_type = spec.type;
        provider->setVector(spec.content, at(spec.similarity));
        return addReady(req);
    }

    SearchRequest request(size_t topK = 5) const {
        SearchRequest r;
        r.query = kQuery;
        r.top_k = topK;
        r.min_similarity = 0.3;
        return r;
    }

    std::vector<SearchResult> run(const SearchRequest& r) {
        auto results = retriever->search(r);
        REQUIRE(results.has_value());
        return results.value();
    }

    std::shared_ptr<Retriever> retriever;
};

std::set<DocumentId> documentsOf(const std::vector<SearchResult>& results) {
    std::set<DocumentId> ids;
    for (const auto& r : results) {
        ids.insert(r.document_id);
    }
    return ids;
}

} // namespace

TEST_CASE_METHOD(RetrieverFixture, "Retriever: nothing above the threshold",
                 "[unit][search][retriever]") {
    add({.title = "Weak", .content = "Loosely related note.", .similarity = 0.25});
    add({.title = "Weaker", .content = "Barely related note.", .similarity = 0.1});

    CHECK(run(request()).empty());
}

TEST_CASE_METHOD(RetrieverFixture, "Retriever: priority weights the score",
                 "[unit][search][retriever]") {
    auto low = add({.title = "Low", .content = "Low priority note.", .similarity = 0.5,
                    .priority = 1});
    auto high = add({.title = "High", .content = "High priority note.", .similarity = 0.5,
                     .priority = 10});

    auto results = run(request());
    REQUIRE(results.size() == 2);
    CHECK(results[0].document_id == high);
    CHECK(results[0].score == Approx(0.5));
    CHECK(results[1].document_id == low);
    CHECK(results[1].score == Approx(0.05));
    CHECK(results[0].similarity == Approx(0.5).margin(1e-6));
    CHECK(results[0].priority == 10);
    CHECK(results[0].document_title == "High");
    CHECK(results[0].content == "High priority note.");
}

TEST_CASE_METHOD(RetrieverFixture, "Retriever: ranking and top_k",
                 "[unit][search][retriever]") {
    const double sims[] = {0.4, 0.95, 0.6, 0.8, 0.5, 0.7};
    for (int i = 0; i < 6; ++i) {
        add({.title = "Doc " + std::to_string(i),
             .content = "Note number " + std::to_string(i) + ".",
             .similarity = sims[i]});
    }

    auto results = run(request(3));
    REQUIRE(results.size() == 3);
    CHECK(results[0].similarity == Approx(0.95).margin(1e-6));
    CHECK(results[1].similarity == Approx(0.8).margin(1e-6));
    CHECK(results[2].similarity == Approx(0.7).margin(1e-6));
    for (size_t i = 1; i < results.size(); ++i) {
        CHECK(results[i - 1].score >= results[i].score);
    }

    auto zero = request(0);
    CHECK(run(zero).empty());

    auto blank = request();
    blank.query = "   ";
    CHECK(run(blank).empty());
}

TEST_CASE_METHOD(RetrieverFixture, "Retriever: ownership visibility",
                 "[unit][search][retriever]") {
    auto shared = add({.title = "Shared", .content = "Admin guidance."});
    auto alice = add({.title = "Alice notes", .content = "Alice's private notes.", .admin = false,
                      .owner = "alice"});
    auto bob = add({.title = "Bob notes", .content = "Bob's private notes.", .admin = false,
                    .owner = "bob"});

    SECTION("a user sees admin documents and their own") {
        auto r = request();
        r.visibility.owner = "alice";
        CHECK(documentsOf(run(r)) == std::set<DocumentId>{shared, alice});
    }
    SECTION("user documents only") {
        auto r = request();
        r.visibility.owner = "bob";
        r.visibility.include_admin_managed = false;
        CHECK(documentsOf(run(r)) == std::set<DocumentId>{bob});
    }
    SECTION("admin documents only") {
        auto r = request();
        r.visibility.include_user_managed = false;
        CHECK(documentsOf(run(r)) == std::set<DocumentId>{shared});
    }
    SECTION("no owner is an administrative search") {
        CHECK(documentsOf(run(request())) == std::set<DocumentId>{shared, alice, bob});
    }
    SECTION("both excluded") {
        auto r = request();
        r.visibility.include_admin_managed = false;
        r.visibility.include_user_managed = false;
        CHECK(run(r).empty());
    }
}

TEST_CASE("Retriever: visibility rule", "[unit][search][retriever]") {
    metadata::DocumentRecord userDoc;
    userDoc.uploaded_by = "alice";
    metadata::DocumentRecord adminDoc;
    adminDoc.is_admin_managed = true;

    Visibility carol;
    carol.owner = "carol";
    CHECK_FALSE(Retriever::isVisible(userDoc, carol));
    CHECK(Retriever::isVisible(adminDoc, carol));

    Visibility alice;
    alice.owner = "alice";
    CHECK(Retriever::isVisible(userDoc, alice));

    CHECK(Retriever::score(0.8, 5) == Approx(0.4));
}

TEST_CASE_METHOD(RetrieverFixture, "Retriever: target and type filters",
                 "[unit][search][retriever]") {
    auto hunting = add({.title = "Hunting", .content = "Hunting only.",
                        .functions = {"hunting"}});
    auto everywhere = add({.title = "General", .content = "Applies everywhere."});
    auto windows = add({.title = "Windows", .content = "Windows only.", .platforms = {"windows"},
                        .type = metadata::DocumentType::QuerySyntax});

    auto triage = request();
    triage.target_function = "triage";
    CHECK(documentsOf(run(triage)) == std::set<DocumentId>{everywhere, windows});

    auto hunt = request();
    hunt.target_function = "hunting";
    CHECK(documentsOf(run(hunt)) == std::set<DocumentId>{hunting, everywhere, windows});

    auto linuxOnly = request();
    linuxOnly.target_platform = "linux";
    CHECK(documentsOf(run(linuxOnly)) == std::set<DocumentId>{hunting, everywhere});

    auto syntax = request();
    syntax.doc_type = metadata::DocumentType::QuerySyntax;
    CHECK(documentsOf(run(syntax)) == std::set<DocumentId>{windows});
}

TEST_CASE_METHOD(RetrieverFixture, "Retriever: only READY active documents are searched",
                 "[unit][search][retriever]") {
    auto ready = add({.title = "Ready", .content = "Ready note."});
    auto inactive = add({.title = "Inactive", .content = "Inactive note."});
    metadata::DocumentUpdate off;
    off.is_active = false;
    REQUIRE(sqlite->updateDocumentMetadata(inactive, off).has_value());

    auto failed = add({.title = "Failed", .content = "Failed note."});
    REQUIRE(sqlite->updateDocumentStatus(failed, DocumentStatus::Failed, "boom").has_value());

    provider->setVector("Pending note.", at(0.9));
    addDocument(fileRequest("Pending", "Pending note."));

    CHECK(documentsOf(run(request())) == std::set<DocumentId>{ready});
}

TEST_CASE_METHOD(RetrieverFixture, "Retriever: usage is recorded for returned documents",
                 "[unit][search][retriever]") {
    auto hit = add({.title = "Hit", .content = "Relevant note."});
    auto miss = add({.title = "Miss", .content = "Irrelevant note.", .similarity = 0.1});

    REQUIRE(run(request()).size() == 1);
    REQUIRE(run(request()).size() == 1);

    CHECK(get(hit).usage_count == 2);
    CHECK(get(hit).last_used_at.has_value());
    CHECK(get(miss).usage_count == 0);
}

TEST_CASE_METHOD(RetrieverFixture, "Retriever: usage failures do not fail the search",
                 "[unit][search][retriever]") {
    auto hit = add({.title = "Hit", .content = "Relevant note."});
    store->failRecordUsage = true;

    auto results = run(request());
    REQUIRE(results.size() == 1);
    CHECK(results[0].document_id == hit);
    CHECK(get(hit).usage_count == 0);
}

TEST_CASE_METHOD(RetrieverFixture, "Retriever: unembeddable query returns nothing",
                 "[unit][search][retriever]") {
    add({.title = "Hit", .content = "Relevant note."});
    provider->setFailing(true);

    auto results = retriever->search(request());
    REQUIRE(results.has_value());
    CHECK(results.value().empty());
}

TEST_CASE_METHOD(RetrieverFixture, "Retriever: context fits the token budget",
                 "[unit][search][retriever]") {
    // Four words each
    add({.title = "First", .content = "alpha beta gamma delta", .similarity = 0.9});
    add({.title = "Second", .content = "one two three four", .similarity = 0.8});
    add({.title = "Third", .content = "red green blue black", .similarity = 0.7});

    ContextRequest req;
    req.query = kQuery;
    req.max_tokens = 10;

    auto context = retriever->getContextForPrompt(req);
    REQUIRE(context.has_value());
    const auto& c = context.value();
    CHECK(c.token_count == 8);
    REQUIRE(c.sources.size() == 2);
    CHECK(c.sources[0].title == "First");
    CHECK(c.sources[0].similarity == 0.9);
    CHECK(c.sources[1].title == "Second");
    CHECK(c.context_text ==
          "\n=== From: First (custom) ===\nalpha beta gamma delta\n"
          "\n"
          "\n=== From: Second (custom) ===\none two three four\n");

    req.max_tokens = 3;
    auto tooSmall = retriever->getContextForPrompt(req);
    REQUIRE(tooSmall.has_value());
    CHECK(tooSmall.value().sources.empty());
    CHECK(tooSmall.value().context_text.empty());
    CHECK(tooSmall.value().token_count == 0);
}

TEST_CASE_METHOD(RetrieverFixture, "Retriever: context uses its own threshold and depth",
                 "[unit][search][retriever]") {
    for (int i = 0; i < 4; ++i) {
        add({.title = "Doc " + std::to_string(i), .content = "word" + std::to_string(i),
             .similarity = 0.5});
    }
    add({.title = "Below", .content = "below threshold", .similarity = 0.35});

    RetrieverOptions options;
    options.context_candidates = 2;
    options.min_similarity = 0.4;
    Retriever narrow(store, embedder, options);

    ContextRequest req;
    req.query = kQuery;
    auto context = narrow.getContextForPrompt(req);
    REQUIRE(context.has_value());
    CHECK(context.value().sources.size() == 2);
    for (const auto& s : context.value().sources) {
        CHECK(s.title != "Below");
    }
}
