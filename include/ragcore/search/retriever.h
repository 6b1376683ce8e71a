#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <ragcore/core/types.h>
#include <ragcore/metadata/knowledge_store.h>
#include <ragcore/vector/embedder.h>

namespace ragcore::search {

/**
 * Who is searching. Admin-managed documents are visible to everyone who asks
 * for them; user-managed ones only to their uploader. Without an owner no
 * ownership filter applies (administrative search).
 */
struct Visibility {
    std::optional<std::string> owner;
    bool include_admin_managed{true};
    bool include_user_managed{true};
};

struct SearchRequest {
    std::string query;
    std::optional<std::string> target_function;
    std::optional<std::string> target_platform;
    std::optional<metadata::DocumentType> doc_type;
    size_t top_k{5};
    double min_similarity{0.3};
    Visibility visibility;
};

struct SearchResult {
    ChunkId chunk_id = 0;
    DocumentId document_id = 0;
    std::string document_title;
    metadata::DocumentType doc_type = metadata::DocumentType::Custom;
    std::string content;
    double similarity = 0.0;
    int priority = 5;
    std::set<std::string> tags;
    double score = 0.0; // similarity * priority / 10
    int64_t chunk_index = 0;
};

struct ContextRequest {
    std::string query;
    std::optional<std::string> target_function;
    std::optional<std::string> target_platform;
    std::optional<metadata::DocumentType> doc_type;
    size_t max_tokens{2000};
    Visibility visibility;
};

struct ContextSource {
    DocumentId document_id = 0;
    std::string title;
    double similarity = 0.0; // Rounded to 3 decimals
};

struct PromptContext {
    std::string context_text;
    std::vector<ContextSource> sources; // Only chunks that fit the budget
    size_t token_count = 0;
};

struct RetrieverOptions {
    size_t context_candidates = 20; // Search depth for context assembly
    double min_similarity = 0.3;    // Threshold for context assembly
};

/**
 * Brute-force cosine ranking over the chunks of eligible documents.
 */
class Retriever {
public:
    Retriever(std::shared_ptr<metadata::IKnowledgeStore> store,
              std::shared_ptr<vector::Embedder> embedder, RetrieverOptions options = {});

    /**
     * Ranked by score, at most top_k results. A query that cannot be embedded
     * yields an empty list. Bumps usage on the documents returned.
     */
    Result<std::vector<SearchResult>> search(const SearchRequest& request);

    /**
     * Greedy prefix of the ranked results that fits max_tokens, formatted for
     * a generation prompt.
     */
    Result<PromptContext> getContextForPrompt(const ContextRequest& request);

    static double score(double similarity, int priority) { return similarity * (priority / 10.0); }

    static bool isVisible(const metadata::DocumentRecord& doc, const Visibility& visibility);

private:
    std::shared_ptr<metadata::IKnowledgeStore> store_;
    std::shared_ptr<vector::Embedder> embedder_;
    RetrieverOptions options_;
};

} // namespace ragcore::search
