#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <ragcore/core/types.h>

namespace ragcore::metadata {

using Timestamp = std::chrono::sys_seconds;

inline Timestamp nowSeconds() {
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

enum class DocumentType {
    ProductDocumentation,
    QuerySyntax,
    ThreatIntel,
    Playbook,
    Policy,
    Reference,
    Custom
};

enum class DocumentScope { Global, User };

enum class SourceType { File, Url };

/**
 * Processing state machine: PENDING -> PROCESSING -> {READY, FAILED}.
 * READY and FAILED return to PENDING on reprocess.
 */
enum class DocumentStatus { Pending, Processing, Ready, Failed };

std::string_view toString(DocumentType type);
std::string_view toString(DocumentScope scope);
std::string_view toString(SourceType type);
std::string_view toString(DocumentStatus status);

// Case-insensitive; InvalidArgument for unknown names
Result<DocumentType> parseDocumentType(std::string_view s);
Result<DocumentScope> parseDocumentScope(std::string_view s);
Result<SourceType> parseSourceType(std::string_view s);
Result<DocumentStatus> parseDocumentStatus(std::string_view s);

struct FileSource {
    std::string file_name;
    std::string file_path; // Backing artifact, removed when the document is deleted
    uint64_t file_size = 0;
    std::string mime_type;
};

struct UrlSource {
    std::string url;
    int crawl_depth = 0;
    int pages_crawled = 0;
};

using SourceDetails = std::variant<FileSource, UrlSource>;

inline SourceType sourceTypeOf(const SourceDetails& details) {
    return std::holds_alternative<UrlSource>(details) ? SourceType::Url : SourceType::File;
}

// JSON object encoding used for the source_details column
std::string serializeSourceDetails(const SourceDetails& details);
Result<SourceDetails> parseSourceDetails(SourceType type, const std::string& json);

std::string serializeStringSet(const std::set<std::string>& values);
Result<std::set<std::string>> parseStringSet(const std::string& json);

/**
 * A knowledge document. chunk_count is derived from the chunk table and
 * maintained by the store.
 */
struct DocumentRecord {
    DocumentId id = 0;
    std::string title;
    std::string description;
    DocumentType doc_type = DocumentType::Custom;
    DocumentScope scope = DocumentScope::Global;
    bool is_admin_managed = false;
    SourceDetails source = FileSource{};
    std::string content_hash;
    std::optional<std::string> raw_content; // Extracted text; absent until a URL is fetched
    DocumentStatus status = DocumentStatus::Pending;
    std::optional<std::string> processing_error;
    int64_t chunk_count = 0;
    std::set<std::string> target_functions; // Empty = unrestricted
    std::set<std::string> target_platforms; // Empty = unrestricted
    std::set<std::string> tags;
    int priority = 5;
    bool is_active = true;
    int64_t usage_count = 0;
    std::optional<Timestamp> last_used_at;
    std::optional<std::string> uploaded_by;
    Timestamp created_at{};
    Timestamp updated_at{};

    SourceType sourceType() const { return sourceTypeOf(source); }
};

struct ChunkRecord {
    ChunkId id = 0;
    DocumentId document_id = 0;
    int64_t chunk_index = 0;
    std::string content;
    int64_t token_count = 0;
    std::vector<float> embedding;
    std::string embedding_model;
    int64_t start_char = 0;
    int64_t end_char = 0;
};

/**
 * Filter for finding dedup candidates by content hash
 */
struct HashScopeFilter {
    bool active_only = true;
    bool prefer_admin_managed = false; // Return an admin-managed match first when one exists
};

struct DocumentQuery {
    std::optional<DocumentType> doc_type;
    std::optional<DocumentStatus> status;
    std::optional<bool> is_active;
    std::optional<std::string> owner;
    std::optional<bool> admin_managed;
    int limit = 100; // 0 = no limit
};

/**
 * Partial metadata update; unset fields are left unchanged
 */
struct DocumentUpdate {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::set<std::string>> target_functions;
    std::optional<std::set<std::string>> target_platforms;
    std::optional<std::set<std::string>> tags;
    std::optional<int> priority;
    std::optional<bool> is_active;
};

struct KnowledgeStats {
    int64_t total_documents = 0;
    int64_t ready_documents = 0;
    int64_t total_chunks = 0;
    int64_t chunks_with_embeddings = 0;
    int64_t total_usage = 0;
    std::map<std::string, int64_t> by_type;
    std::map<std::string, int64_t> by_status;
};

// Embeddings persist as little-endian float32
std::vector<std::byte> packEmbedding(const std::vector<float>& embedding);
std::vector<float> unpackEmbedding(const std::vector<std::byte>& blob);

} // namespace ragcore::metadata
