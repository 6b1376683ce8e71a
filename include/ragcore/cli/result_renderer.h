#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include <ragcore/ingest/lifecycle_manager.h>
#include <ragcore/metadata/document_record.h>
#include <ragcore/search/retriever.h>

namespace ragcore::cli {

// JSON views of engine results, as printed by the CLI

nlohmann::json renderDocument(const metadata::DocumentRecord& doc, bool includeContent = false);
nlohmann::json renderSearchResults(const std::vector<search::SearchResult>& results);
nlohmann::json renderContext(const search::PromptContext& context);
nlohmann::json renderBatchReport(const ingest::BatchReport& report);
nlohmann::json renderStats(const metadata::KnowledgeStats& stats);
nlohmann::json renderError(const Error& error);

} // namespace ragcore::cli
