#pragma once

#include <string>
#include <vector>
#include <ragcore/core/types.h>

namespace ragcore::ml {

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers.
 *
 * Providers are injected into the Embedder explicitly; nothing in the core
 * looks a provider up from ambient or global state.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    // ========================================================================
    // Core Operations
    // ========================================================================

    /**
     * Generate embedding for a single text
     * @param text Input text, already truncated to getMaxInputChars()
     * @return Vector of float embeddings or error
     */
    virtual Result<std::vector<float>> generateEmbedding(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts. Fails as a whole on the first
     * failing element.
     */
    virtual Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) {
        std::vector<std::vector<float>> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            auto r = generateEmbedding(text);
            if (!r) {
                return r.error();
            }
            out.push_back(std::move(r).value());
        }
        return out;
    }

    // ========================================================================
    // Provider Information
    // ========================================================================

    /**
     * Cheap availability hint. A provider reporting true may still fail a call.
     */
    virtual bool isAvailable() const = 0;

    // e.g. "ollama", "token-hash"
    virtual std::string getProviderName() const = 0;

    /**
     * Identifier recorded on every chunk embedded by this provider, so that
     * chunks produced by another strategy can be found and refreshed.
     */
    virtual std::string getModelId() const = 0;

    // 0 when unknown until the first successful call
    virtual size_t getEmbeddingDimension() const = 0;

    // Input limit in bytes; 0 means unlimited
    virtual size_t getMaxInputChars() const = 0;
};

} // namespace ragcore::ml
