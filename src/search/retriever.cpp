#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <unordered_map>
#include <ragcore/chunking/text_chunker.h>
#include <ragcore/search/retriever.h>

namespace ragcore::search {

using metadata::DocumentRecord;

namespace {

bool allowsTarget(const std::set<std::string>& restriction, const std::optional<std::string>& target) {
    // An empty set means the document applies everywhere
    return !target || restriction.empty() || restriction.count(*target) > 0;
}

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string formatContextPart(const SearchResult& result) {
    std::string part;
    part.reserve(result.document_title.size() + result.content.size() + 32);
    part += "\n=== From: ";
    part += result.document_title;
    part += " (";
    part += metadata::toString(result.doc_type);
    part += ") ===\n";
    part += result.content;
    part += "\n";
    return part;
}

} // namespace

Retriever::Retriever(std::shared_ptr<metadata::IKnowledgeStore> store,
                     std::shared_ptr<vector::Embedder> embedder, RetrieverOptions options)
    : store_(std::move(store)), embedder_(std::move(embedder)), options_(options) {
    if (!store_ || !embedder_) {
        throw std::invalid_argument("Retriever requires a store and an embedder");
    }
}

bool Retriever::isVisible(const DocumentRecord& doc, const Visibility& visibility) {
    if (doc.is_admin_managed) {
        return visibility.include_admin_managed;
    }
    if (!visibility.include_user_managed) {
        return false;
    }
    return !visibility.owner || doc.uploaded_by == visibility.owner;
}

Result<std::vector<SearchResult>> Retriever::search(const SearchRequest& request) {
    std::vector<SearchResult> results;
    if (isBlank(request.query) || request.top_k == 0) {
        return results;
    }
    if (!request.visibility.include_admin_managed && !request.visibility.include_user_managed) {
        return results;
    }

    auto queryVector = embedder_->embed(request.query);
    if (!queryVector) {
        spdlog::warn("Query embedding failed, returning no results: {}",
                     queryVector.error().message);
        return results;
    }
    const auto& embedding = queryVector.value().embedding;

    metadata::DocumentQuery query;
    query.status = metadata::DocumentStatus::Ready;
    query.is_active = true;
    query.doc_type = request.doc_type;
    query.limit = 0;
    auto docs = store_->listDocuments(query);
    if (!docs) {
        return docs.error();
    }

    std::unordered_map<DocumentId, const DocumentRecord*> eligible;
    std::vector<DocumentId> ids;
    for (const auto& doc : docs.value()) {
        if (!isVisible(doc, request.visibility) ||
            !allowsTarget(doc.target_functions, request.target_function) ||
            !allowsTarget(doc.target_platforms, request.target_platform)) {
            continue;
        }
        eligible.emplace(doc.id, &doc);
        ids.push_back(doc.id);
    }
    if (ids.empty()) {
        return results;
    }

    auto chunks = store_->listChunks(ids);
    if (!chunks) {
        return chunks.error();
    }

    for (auto& chunk : chunks.value()) {
        const double similarity = vector::embedding_utils::cosineSimilarity(embedding, chunk.embedding);
        if (similarity < request.min_similarity) {
            continue;
        }
        const DocumentRecord& doc = *eligible.at(chunk.document_id);

        SearchResult r;
        r.chunk_id = chunk.id;
        r.document_id = doc.id;
        r.document_title = doc.title;
        r.doc_type = doc.doc_type;
        r.content = std::move(chunk.content);
        r.similarity = similarity;
        r.priority = doc.priority;
        r.tags = doc.tags;
        r.score = score(similarity, doc.priority);
        r.chunk_index = chunk.chunk_index;
        results.push_back(std::move(r));
    }

    std::sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
        if (a.score != b.score)
            return a.score > b.score;
        if (a.similarity != b.similarity)
            return a.similarity > b.similarity;
        if (a.document_id != b.document_id)
            return a.document_id < b.document_id;
        return a.chunk_index < b.chunk_index;
    });
    if (results.size() > request.top_k) {
        results.resize(request.top_k);
    }

    spdlog::debug("Search over {} documents scored {} chunks, returning {}", ids.size(),
                  chunks.value().size(), results.size());

    if (!results.empty()) {
        std::vector<DocumentId> used;
        for (const auto& r : results) {
            used.push_back(r.document_id);
        }
        auto recorded = store_->recordUsage(used, metadata::nowSeconds());
        if (!recorded) {
            spdlog::warn("Failed to record document usage: {}", recorded.error().message);
        }
    }
    return results;
}

Result<PromptContext> Retriever::getContextForPrompt(const ContextRequest& request) {
    SearchRequest search;
    search.query = request.query;
    search.target_function = request.target_function;
    search.target_platform = request.target_platform;
    search.doc_type = request.doc_type;
    search.top_k = options_.context_candidates;
    search.min_similarity = options_.min_similarity;
    search.visibility = request.visibility;

    auto ranked = this->search(search);
    if (!ranked) {
        return ranked.error();
    }

    PromptContext context;
    std::vector<std::string> parts;
    for (const auto& result : ranked.value()) {
        const size_t tokens = chunking::TextChunker::estimateTokenCount(result.content);
        if (context.token_count + tokens > request.max_tokens) {
            break;
        }
        context.token_count += tokens;
        parts.push_back(formatContextPart(result));
        context.sources.push_back(
            {result.document_id, result.document_title, std::round(result.similarity * 1000.0) / 1000.0});
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            context.context_text += "\n";
        }
        context.context_text += parts[i];
    }

    spdlog::debug("Assembled context from {} of {} chunks ({} tokens)", parts.size(),
                  ranked.value().size(), context.token_count);
    return context;
}

} // namespace ragcore::search
