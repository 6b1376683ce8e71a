#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>
#include <ragcore/ml/hash_embedding_provider.h>

namespace ragcore::ml {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

// Bytes >= 0x80 belong to multi-byte UTF-8 sequences and are kept inside tokens.
bool isTokenByte(unsigned char c) {
    return std::isalnum(c) != 0 || c >= 0x80;
}

} // namespace

HashEmbeddingProvider::HashEmbeddingProvider(size_t dimension, size_t maxInputChars)
    : dimension_(dimension), maxInputChars_(maxInputChars) {
    if (dimension_ == 0) {
        spdlog::warn("HashEmbeddingProvider: dimension 0 is invalid, using 1");
        dimension_ = 1;
    }
}

std::string HashEmbeddingProvider::getModelId() const {
    return "local:token-hash-" + std::to_string(dimension_);
}

uint64_t HashEmbeddingProvider::fnv1a64(std::string_view token) {
    uint64_t h = kFnvOffset;
    for (unsigned char c : token) {
        h ^= c;
        h *= kFnvPrime;
    }
    return h;
}

Result<std::vector<float>> HashEmbeddingProvider::generateEmbedding(const std::string& text) {
    std::vector<float> embedding(dimension_, 0.0f);

    std::string token;
    auto flush = [&]() {
        if (token.empty()) {
            return;
        }
        const uint64_t h = fnv1a64(token);
        const size_t slot = static_cast<size_t>(h % dimension_);
        const float sign = ((h >> 32) & 1U) ? -1.0f : 1.0f;
        embedding[slot] += sign;
        token.clear();
    };

    for (unsigned char c : text) {
        if (isTokenByte(c)) {
            token.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();

    double norm = 0.0;
    for (float v : embedding) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& v : embedding) {
            v *= inv;
        }
    }
    return embedding;
}

} // namespace ragcore::ml
