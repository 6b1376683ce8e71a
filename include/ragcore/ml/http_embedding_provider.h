#pragma once

#include <atomic>
#include <chrono>
#include <ragcore/ml/provider.h>

namespace ragcore::ml {

struct HttpEmbeddingConfig {
    std::string endpoint = "http://localhost:11434";
    std::string model = "nomic-embed-text";
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connect_timeout{5000};
    size_t max_input_chars = 2000;
};

/**
 * Remote embedding provider speaking the Ollama embeddings API:
 * POST {endpoint}/api/embeddings with {"model": ..., "prompt": ...}, answered by
 * {"embedding": [...]}.
 *
 * Every call is bounded by the configured timeout. Transport errors, non-2xx
 * responses and malformed bodies are returned as errors; the caller decides
 * whether to fall back.
 */
class HttpEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HttpEmbeddingProvider(HttpEmbeddingConfig config);
    ~HttpEmbeddingProvider() override;

    HttpEmbeddingProvider(const HttpEmbeddingProvider&) = delete;
    HttpEmbeddingProvider& operator=(const HttpEmbeddingProvider&) = delete;

    Result<std::vector<float>> generateEmbedding(const std::string& text) override;

    // True until a call fails; reset by the next successful call
    bool isAvailable() const override { return available_.load(); }
    std::string getProviderName() const override { return "ollama"; }
    std::string getModelId() const override { return "ollama:" + config_.model; }
    size_t getEmbeddingDimension() const override { return dimension_.load(); }
    size_t getMaxInputChars() const override { return config_.max_input_chars; }

    const HttpEmbeddingConfig& getConfig() const { return config_; }

    // Parse an {"embedding": [...]} response body
    static Result<std::vector<float>> parseEmbeddingResponse(const std::string& body);

private:
    HttpEmbeddingConfig config_;
    std::string url_;
    std::atomic<bool> available_{true};
    std::atomic<size_t> dimension_{0};
};

} // namespace ragcore::ml
