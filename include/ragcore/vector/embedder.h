#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <ragcore/core/types.h>
#include <ragcore/ml/provider.h>

namespace ragcore::config {
struct EmbeddingSettings;
}

namespace ragcore::vector {

/**
 * Which providers the Embedder uses, fixed at construction.
 *
 * primary is tried first; fallback must be deterministic and local. Either may
 * be null, but not both. With only a fallback the Embedder runs local-only and
 * results are not flagged as degraded.
 */
struct EmbeddingStrategy {
    std::shared_ptr<ml::IEmbeddingProvider> primary;
    std::shared_ptr<ml::IEmbeddingProvider> fallback;

    // After a primary failure, the primary is skipped for this long
    std::chrono::milliseconds retry_after{30000};
};

struct EmbeddingResult {
    std::vector<float> embedding;
    std::string model_id;  // Provider that produced the vector
    bool degraded = false; // True when the fallback stood in for a failed primary
};

struct EmbedderStats {
    size_t primary_successes = 0;
    size_t fallbacks = 0;
    size_t failures = 0;
};

/**
 * Produces a vector for a text segment and never fails the pipeline while a
 * fallback exists. Thread-safe: providers are shared, counters are atomic.
 */
class Embedder {
public:
    explicit Embedder(EmbeddingStrategy strategy);

    /**
     * Embed text, truncated to the chosen provider's input limit.
     * Errors only when no provider produced a vector.
     */
    Result<EmbeddingResult> embed(std::string_view text);

    // Model id chunks carry when the preferred provider is healthy
    std::string preferredModelId() const;

    bool isDegraded() const;

    EmbedderStats getStats() const;

    // Longest prefix of at most maxBytes that ends on a UTF-8 boundary; 0 = no limit
    static std::string truncate(std::string_view text, size_t maxBytes);

private:
    using Clock = std::chrono::steady_clock;

    Result<EmbeddingResult> runProvider(ml::IEmbeddingProvider& provider, std::string_view text,
                                        bool degraded);
    bool primaryCoolingDown() const;

    std::shared_ptr<ml::IEmbeddingProvider> primary_;
    std::shared_ptr<ml::IEmbeddingProvider> fallback_;
    std::chrono::milliseconds retryAfter_;

    std::atomic<Clock::rep> primaryRetryAt_{0};
    std::atomic<size_t> primarySuccesses_{0};
    std::atomic<size_t> fallbacks_{0};
    std::atomic<size_t> failures_{0};
};

/**
 * Build the strategy described by configuration: "http" gives the remote
 * provider backed by the token-hash fallback, "local" gives the token-hash
 * provider alone.
 */
EmbeddingStrategy makeEmbeddingStrategy(const config::EmbeddingSettings& settings);

namespace embedding_utils {

/**
 * Cosine similarity in [-1, 1]. Returns 0 for a zero vector or mismatched
 * dimensions; never NaN.
 */
double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * Normalize embeddings to unit length (zero vectors are returned unchanged)
 */
std::vector<float> normalizeEmbedding(const std::vector<float>& embedding);

/**
 * Compute embedding magnitude
 */
double computeMagnitude(const std::vector<float>& embedding);

} // namespace embedding_utils

} // namespace ragcore::vector
