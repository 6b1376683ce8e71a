#pragma once

#include <cstdint>
#include <string_view>
#include <ragcore/ml/provider.h>

namespace ragcore::ml {

/**
 * Deterministic local embedding provider.
 *
 * Projects lowercase alphanumeric tokens into a fixed-dimension space with a
 * signed feature hash (FNV-1a 64) and L2-normalizes the counts. It never fails
 * and needs no network, which makes it the fallback strategy when the remote
 * model is unavailable. Texts that share vocabulary land near each other; that
 * is all the similarity it offers.
 */
class HashEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HashEmbeddingProvider(size_t dimension = 384, size_t maxInputChars = 2000);

    Result<std::vector<float>> generateEmbedding(const std::string& text) override;

    bool isAvailable() const override { return true; }
    std::string getProviderName() const override { return "token-hash"; }
    std::string getModelId() const override;
    size_t getEmbeddingDimension() const override { return dimension_; }
    size_t getMaxInputChars() const override { return maxInputChars_; }

    static uint64_t fnv1a64(std::string_view token);

private:
    size_t dimension_;
    size_t maxInputChars_;
};

} // namespace ragcore::ml
