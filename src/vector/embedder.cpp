#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <ragcore/config/config.h>
#include <ragcore/ml/hash_embedding_provider.h>
#include <ragcore/ml/http_embedding_provider.h>
#include <ragcore/vector/embedder.h>

namespace ragcore::vector {

Embedder::Embedder(EmbeddingStrategy strategy)
    : primary_(std::move(strategy.primary)), fallback_(std::move(strategy.fallback)),
      retryAfter_(strategy.retry_after) {
    if (!primary_ && !fallback_) {
        throw std::invalid_argument("Embedder requires at least one embedding provider");
    }
    spdlog::debug("Embedder: primary={} fallback={}", primary_ ? primary_->getModelId() : "none",
                  fallback_ ? fallback_->getModelId() : "none");
}

std::string Embedder::truncate(std::string_view text, size_t maxBytes) {
    if (maxBytes == 0 || text.size() <= maxBytes) {
        return std::string(text);
    }
    size_t cut = maxBytes;
    // Back off continuation bytes so a multi-byte sequence is never split
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

bool Embedder::primaryCoolingDown() const {
    const auto retryAt = primaryRetryAt_.load();
    return retryAt != 0 && Clock::now().time_since_epoch().count() < retryAt;
}

bool Embedder::isDegraded() const {
    return primary_ && fallback_ && primaryCoolingDown();
}

std::string Embedder::preferredModelId() const {
    return primary_ ? primary_->getModelId() : fallback_->getModelId();
}

EmbedderStats Embedder::getStats() const {
    EmbedderStats s;
    s.primary_successes = primarySuccesses_.load();
    s.fallbacks = fallbacks_.load();
    s.failures = failures_.load();
    return s;
}

Result<EmbeddingResult> Embedder::runProvider(ml::IEmbeddingProvider& provider,
                                              std::string_view text, bool degraded) {
    const std::string input = truncate(text, provider.getMaxInputChars());
    try {
        auto r = provider.generateEmbedding(input);
        if (!r) {
            return r.error();
        }
        if (r.value().empty()) {
            return Error{ErrorCode::InvalidData,
                         provider.getProviderName() + " returned an empty embedding"};
        }
        EmbeddingResult out;
        out.embedding = std::move(r).value();
        out.model_id = provider.getModelId();
        out.degraded = degraded;
        return out;
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError,
                     provider.getProviderName() + " threw: " + std::string(e.what())};
    }
}

Result<EmbeddingResult> Embedder::embed(std::string_view text) {
    if (primary_ && (!fallback_ || !primaryCoolingDown())) {
        auto r = runProvider(*primary_, text, false);
        if (r) {
            primaryRetryAt_.store(0);
            primarySuccesses_.fetch_add(1);
            return r;
        }
        if (!fallback_) {
            failures_.fetch_add(1);
            spdlog::error("embedding failed ({}): {}", r.error().code, r.error().message);
            return Error{ErrorCode::EmbeddingUnavailable, r.error().message};
        }
        spdlog::warn("embedding provider '{}' unavailable ({}), falling back to '{}' for {} ms",
                     primary_->getModelId(), r.error().message, fallback_->getModelId(),
                     retryAfter_.count());
        primaryRetryAt_.store((Clock::now() + retryAfter_).time_since_epoch().count());
    }

    const bool degraded = primary_ != nullptr;
    auto r = runProvider(*fallback_, text, degraded);
    if (!r) {
        failures_.fetch_add(1);
        spdlog::error("fallback embedding failed ({}): {}", r.error().code, r.error().message);
        return Error{ErrorCode::EmbeddingUnavailable, r.error().message};
    }
    if (degraded) {
        fallbacks_.fetch_add(1);
    } else {
        primarySuccesses_.fetch_add(1);
    }
    return r;
}

EmbeddingStrategy makeEmbeddingStrategy(const config::EmbeddingSettings& settings) {
    EmbeddingStrategy strategy;
    strategy.fallback =
        std::make_shared<ml::HashEmbeddingProvider>(settings.dimension, settings.max_input_chars);
    strategy.retry_after = std::chrono::milliseconds(settings.retry_after_ms);

    if (settings.provider == "http") {
        ml::HttpEmbeddingConfig http;
        http.endpoint = settings.endpoint;
        http.model = settings.model;
        http.timeout = std::chrono::milliseconds(settings.timeout_ms);
        http.connect_timeout = std::min(http.timeout, std::chrono::milliseconds(5000));
        http.max_input_chars = settings.max_input_chars;
        strategy.primary = std::make_shared<ml::HttpEmbeddingProvider>(std::move(http));
    }
    return strategy;
}

namespace embedding_utils {

double computeMagnitude(const std::vector<float>& embedding) {
    double sum = 0.0;
    for (float v : embedding) {
        sum += static_cast<double>(v) * static_cast<double>(v);
    }
    return std::sqrt(sum);
}

std::vector<float> normalizeEmbedding(const std::vector<float>& embedding) {
    const double magnitude = computeMagnitude(embedding);
    if (magnitude == 0.0) {
        return embedding;
    }
    std::vector<float> out;
    out.reserve(embedding.size());
    for (float v : embedding) {
        out.push_back(static_cast<float>(v / magnitude));
    }
    return out;
}

double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    const double sim = dot_product / (norm_a * norm_b);
    if (std::isnan(sim)) {
        return 0.0;
    }
    return std::clamp(sim, -1.0, 1.0);
}

} // namespace embedding_utils

} // namespace ragcore::vector
