#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <ragcore/core/types.h>

namespace ragcore::chunking {

/**
 * Configuration for windowed text chunking
 */
struct ChunkingConfig {
    size_t chunk_size = 1000; // Window length in bytes of normalized text
    size_t overlap = 200;     // Bytes shared between consecutive windows

    // A sentence boundary is only accepted when it lies past this fraction of the window
    double min_boundary_ratio = 0.5;

    // Searched in order; the first one found past the ratio wins
    std::vector<std::string> boundaries = {". ", ".\n", "!\n", "?\n", "\n\n"};
};

/**
 * A single chunk of normalized text
 */
struct TextChunk {
    size_t index = 0;      // Zero-based, dense
    std::string content;   // Trimmed window text, never empty
    size_t start_char = 0; // Window start offset in normalized text
    size_t end_char = 0;   // Window end offset (exclusive)
    size_t token_count = 0;
};

/**
 * Splits normalized text into overlapping, sentence-snapped windows.
 *
 * chunk() is a pure function of (text, config): the same input always yields
 * the same boundaries.
 */
class TextChunker {
public:
    explicit TextChunker(ChunkingConfig config = {});

    std::vector<TextChunk> chunk(std::string_view text) const;

    const ChunkingConfig& getConfig() const { return config_; }

    static Result<void> validateConfig(const ChunkingConfig& config);

    // Collapse runs of 3+ newlines to a blank line and runs of spaces to one space
    static std::string normalizeText(std::string_view text);

    // Whitespace-separated word count
    static size_t estimateTokenCount(std::string_view text);

private:
    size_t findBoundary(std::string_view text, size_t start, size_t end) const;

    ChunkingConfig config_;
};

// Convenience wrapper with the default boundary set
std::vector<TextChunk> chunkText(std::string_view text, size_t chunk_size = 1000,
                                 size_t overlap = 200);

} // namespace ragcore::chunking
