#include <ragcore/cli/result_renderer.h>

namespace ragcore::cli {

using json = nlohmann::json;

namespace {

json renderSource(const metadata::SourceDetails& source) {
    if (const auto* url = std::get_if<metadata::UrlSource>(&source)) {
        return {{"url", url->url},
                {"crawl_depth", url->crawl_depth},
                {"pages_crawled", url->pages_crawled}};
    }
    const auto& file = std::get<metadata::FileSource>(source);
    return {{"file_name", file.file_name},
            {"file_path", file.file_path},
            {"file_size", file.file_size},
            {"mime_type", file.mime_type}};
}

int64_t epoch(metadata::Timestamp t) {
    return t.time_since_epoch().count();
}

} // namespace

json renderDocument(const metadata::DocumentRecord& doc, bool includeContent) {
    json j = {{"id", doc.id},
              {"title", doc.title},
              {"description", doc.description},
              {"doc_type", std::string(metadata::toString(doc.doc_type))},
              {"scope", std::string(metadata::toString(doc.scope))},
              {"is_admin_managed", doc.is_admin_managed},
              {"source_type", std::string(metadata::toString(doc.sourceType()))},
              {"source", renderSource(doc.source)},
              {"content_hash", doc.content_hash},
              {"status", std::string(metadata::toString(doc.status))},
              {"chunk_count", doc.chunk_count},
              {"target_functions", doc.target_functions},
              {"target_platforms", doc.target_platforms},
              {"tags", doc.tags},
              {"priority", doc.priority},
              {"is_active", doc.is_active},
              {"usage_count", doc.usage_count},
              {"created_at", epoch(doc.created_at)},
              {"updated_at", epoch(doc.updated_at)}};

    j["processing_error"] = doc.processing_error ? json(*doc.processing_error) : json(nullptr);
    j["uploaded_by"] = doc.uploaded_by ? json(*doc.uploaded_by) : json(nullptr);
    j["last_used_at"] = doc.last_used_at ? json(epoch(*doc.last_used_at)) : json(nullptr);
    if (includeContent) {
        j["raw_content"] = doc.raw_content ? json(*doc.raw_content) : json(nullptr);
    }
    return j;
}

json renderSearchResults(const std::vector<search::SearchResult>& results) {
    json arr = json::array();
    for (const auto& r : results) {
        arr.push_back({{"chunk_id", r.chunk_id},
                       {"document_id", r.document_id},
                       {"document_title", r.document_title},
                       {"doc_type", std::string(metadata::toString(r.doc_type))},
                       {"content", r.content},
                       {"similarity", r.similarity},
                       {"priority", r.priority},
                       {"tags", r.tags},
                       {"score", r.score},
                       {"chunk_index", r.chunk_index}});
    }
    return arr;
}

json renderContext(const search::PromptContext& context) {
    json sources = json::array();
    for (const auto& s : context.sources) {
        sources.push_back(
            {{"document_id", s.document_id}, {"title", s.title}, {"similarity", s.similarity}});
    }
    return {{"context_text", context.context_text},
            {"sources", sources},
            {"token_count", context.token_count}};
}

json renderBatchReport(const ingest::BatchReport& report) {
    return {{"processed", report.processed},
            {"failed", report.failed},
            {"cancelled", report.cancelled},
            {"skipped", report.skipped}};
}

json renderStats(const metadata::KnowledgeStats& stats) {
    return {{"total_documents", stats.total_documents},
            {"ready_documents", stats.ready_documents},
            {"total_chunks", stats.total_chunks},
            {"chunks_with_embeddings", stats.chunks_with_embeddings},
            {"total_usage", stats.total_usage},
            {"by_type", stats.by_type},
            {"by_status", stats.by_status}};
}

json renderError(const Error& error) {
    json j = {{"error", errorToString(error.code)}, {"message", error.message}};
    if (error.relatedDocument) {
        j["related_document"] = *error.relatedDocument;
    }
    return j;
}

} // namespace ragcore::cli
