#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string_view>
#include <ragcore/ml/http_embedding_provider.h>

namespace ragcore::ml {

using json = nlohmann::json;

namespace {

std::once_flag g_curlInitOnce;

void ensureCurlGlobalInit() {
    std::call_once(g_curlInitOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<const char*>(contents), total);
    return total;
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::EmbeddingUnavailable;
            break;
    }
    return err;
}

struct CurlHandleDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

std::string joinUrl(std::string base, std::string_view path) {
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    base.append(path);
    return base;
}

} // namespace

HttpEmbeddingProvider::HttpEmbeddingProvider(HttpEmbeddingConfig config)
    : config_(std::move(config)), url_(joinUrl(config_.endpoint, "/api/embeddings")) {
    ensureCurlGlobalInit();
    spdlog::debug("HttpEmbeddingProvider: model '{}' at {}", config_.model, url_);
}

HttpEmbeddingProvider::~HttpEmbeddingProvider() = default;

Result<std::vector<float>> HttpEmbeddingProvider::parseEmbeddingResponse(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (!parsed.is_object() || !parsed.contains("embedding") ||
            !parsed["embedding"].is_array()) {
            return Error{ErrorCode::InvalidData, "response has no 'embedding' array"};
        }
        const auto& arr = parsed["embedding"];
        if (arr.empty()) {
            return Error{ErrorCode::InvalidData, "response embedding is empty"};
        }
        std::vector<float> embedding;
        embedding.reserve(arr.size());
        for (const auto& v : arr) {
            if (!v.is_number()) {
                return Error{ErrorCode::InvalidData, "response embedding has non-numeric value"};
            }
            embedding.push_back(v.get<float>());
        }
        return embedding;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed embedding response: ") + e.what()};
    }
}

Result<std::vector<float>> HttpEmbeddingProvider::generateEmbedding(const std::string& text) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    const std::string payload = json{{"model", config_.model}, {"prompt", text}}.dump();

    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    std::string body;
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connect_timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        available_.store(false);
        return makeCurlError(rc, "embedding request");
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        available_.store(false);
        return Error{ErrorCode::EmbeddingUnavailable,
                     "embedding service returned HTTP " + std::to_string(status)};
    }

    auto parsed = parseEmbeddingResponse(body);
    if (!parsed) {
        available_.store(false);
        return parsed.error();
    }

    available_.store(true);
    dimension_.store(parsed.value().size());
    return parsed;
}

} // namespace ragcore::ml
