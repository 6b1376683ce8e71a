#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <ragcore/core/types.h>

namespace ragcore::config {

struct StorageSettings {
    std::filesystem::path database_path; // default <data dir>/knowledge.db
    std::filesystem::path artifact_dir;  // default <data dir>/artifacts
};

struct ChunkingSettings {
    size_t chunk_size = 1000;
    size_t overlap = 200;
};

struct EmbeddingSettings {
    std::string provider = "http"; // "http" (remote with local fallback) or "local"
    std::string endpoint = "http://localhost:11434";
    std::string model = "nomic-embed-text";
    uint32_t timeout_ms = 30000;
    size_t max_input_chars = 2000;
    size_t dimension = 384; // local fallback dimension
    uint32_t retry_after_ms = 30000;
};

struct RetrievalSettings {
    size_t top_k = 5;
    double min_similarity = 0.3;
    size_t context_max_tokens = 2000;
    size_t context_candidates = 20;
};

struct IngestionSettings {
    size_t workers = 2;
};

struct RagConfig {
    StorageSettings storage;
    ChunkingSettings chunking;
    EmbeddingSettings embedding;
    RetrievalSettings retrieval;
    IngestionSettings ingestion;
    std::string log_level = "warn";
};

// Built-in defaults with storage paths under dataDir
RagConfig defaultConfig(const std::filesystem::path& dataDir);

/**
 * Apply "section.key" -> value overrides (e.g. "embedding.model").
 * Unknown keys and malformed numbers are InvalidArgument.
 */
Result<void> applyOverrides(RagConfig& config, const std::map<std::string, std::string>& values);

/**
 * Resolve the effective configuration: defaults, then the TOML file at
 * configPath (skipped when missing), then RAGCORE_<SECTION>_<KEY> environment
 * variables. The result is validated.
 */
Result<RagConfig> loadConfig(const std::filesystem::path& configPath);

Result<void> validate(const RagConfig& config);

} // namespace ragcore::config
