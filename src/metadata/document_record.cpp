#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <bit>
#include <cctype>
#include <ragcore/metadata/document_record.h>

namespace ragcore::metadata {

using json = nlohmann::json;

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

template <typename Enum, size_t N>
Result<Enum> parseEnum(std::string_view s, const std::array<Enum, N>& values, const char* what) {
    for (auto v : values) {
        if (iequals(s, toString(v))) {
            return v;
        }
    }
    return Error{ErrorCode::InvalidArgument,
                 std::string("unknown ") + what + ": '" + std::string(s) + "'"};
}

constexpr std::array<DocumentType, 7> kDocumentTypes{
    DocumentType::ProductDocumentation, DocumentType::QuerySyntax, DocumentType::ThreatIntel,
    DocumentType::Playbook,             DocumentType::Policy,      DocumentType::Reference,
    DocumentType::Custom};

constexpr std::array<DocumentScope, 2> kScopes{DocumentScope::Global, DocumentScope::User};

constexpr std::array<SourceType, 2> kSourceTypes{SourceType::File, SourceType::Url};

constexpr std::array<DocumentStatus, 4> kStatuses{DocumentStatus::Pending,
                                                  DocumentStatus::Processing,
                                                  DocumentStatus::Ready, DocumentStatus::Failed};

} // namespace

std::string_view toString(DocumentType type) {
    switch (type) {
        case DocumentType::ProductDocumentation:
            return "product_documentation";
        case DocumentType::QuerySyntax:
            return "query_syntax";
        case DocumentType::ThreatIntel:
            return "threat_intel";
        case DocumentType::Playbook:
            return "playbook";
        case DocumentType::Policy:
            return "policy";
        case DocumentType::Reference:
            return "reference";
        case DocumentType::Custom:
            return "custom";
    }
    return "custom";
}

std::string_view toString(DocumentScope scope) {
    return scope == DocumentScope::User ? "user" : "global";
}

std::string_view toString(SourceType type) {
    return type == SourceType::Url ? "url" : "file";
}

std::string_view toString(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Pending:
            return "PENDING";
        case DocumentStatus::Processing:
            return "PROCESSING";
        case DocumentStatus::Ready:
            return "READY";
        case DocumentStatus::Failed:
            return "FAILED";
    }
    return "PENDING";
}

Result<DocumentType> parseDocumentType(std::string_view s) {
    return parseEnum(s, kDocumentTypes, "document type");
}

Result<DocumentScope> parseDocumentScope(std::string_view s) {
    return parseEnum(s, kScopes, "scope");
}

Result<SourceType> parseSourceType(std::string_view s) {
    return parseEnum(s, kSourceTypes, "source type");
}

Result<DocumentStatus> parseDocumentStatus(std::string_view s) {
    return parseEnum(s, kStatuses, "status");
}

std::string serializeSourceDetails(const SourceDetails& details) {
    json j = std::visit(
        [](const auto& src) -> json {
            using T = std::decay_t<decltype(src)>;
            if constexpr (std::is_same_v<T, FileSource>) {
                return {{"file_name", src.file_name},
                        {"file_path", src.file_path},
                        {"file_size", src.file_size},
                        {"mime_type", src.mime_type}};
            } else {
                return {{"url", src.url},
                        {"crawl_depth", src.crawl_depth},
                        {"pages_crawled", src.pages_crawled}};
            }
        },
        details);
    return j.dump();
}

Result<SourceDetails> parseSourceDetails(SourceType type, const std::string& text) {
    try {
        json j = text.empty() ? json::object() : json::parse(text);
        if (!j.is_object()) {
            return Error{ErrorCode::InvalidData, "source_details is not a JSON object"};
        }
        if (type == SourceType::Url) {
            UrlSource src;
            src.url = j.value("url", std::string{});
            src.crawl_depth = j.value("crawl_depth", 0);
            src.pages_crawled = j.value("pages_crawled", 0);
            return SourceDetails{std::move(src)};
        }
        FileSource src;
        src.file_name = j.value("file_name", std::string{});
        src.file_path = j.value("file_path", std::string{});
        src.file_size = j.value("file_size", uint64_t{0});
        src.mime_type = j.value("mime_type", std::string{});
        return SourceDetails{std::move(src)};
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("bad source_details: ") + e.what()};
    }
}

std::string serializeStringSet(const std::set<std::string>& values) {
    return json(values).dump();
}

Result<std::set<std::string>> parseStringSet(const std::string& text) {
    if (text.empty()) {
        return std::set<std::string>{};
    }
    try {
        auto j = json::parse(text);
        if (!j.is_array()) {
            return Error{ErrorCode::InvalidData, "expected a JSON array of strings"};
        }
        std::set<std::string> out;
        for (const auto& v : j) {
            if (!v.is_string()) {
                return Error{ErrorCode::InvalidData, "expected a JSON array of strings"};
            }
            out.insert(v.get<std::string>());
        }
        return out;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("bad string set: ") + e.what()};
    }
}

std::vector<std::byte> packEmbedding(const std::vector<float>& embedding) {
    std::vector<std::byte> out(embedding.size() * sizeof(float));
    for (size_t i = 0; i < embedding.size(); ++i) {
        auto bits = std::bit_cast<uint32_t>(embedding[i]);
        for (size_t b = 0; b < sizeof(uint32_t); ++b) {
            out[i * sizeof(float) + b] = static_cast<std::byte>((bits >> (8 * b)) & 0xFFU);
        }
    }
    return out;
}

std::vector<float> unpackEmbedding(const std::vector<std::byte>& blob) {
    const size_t n = blob.size() / sizeof(float);
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        uint32_t bits = 0;
        for (size_t b = 0; b < sizeof(uint32_t); ++b) {
            bits |= static_cast<uint32_t>(blob[i * sizeof(float) + b]) << (8 * b);
        }
        out[i] = std::bit_cast<float>(bits);
    }
    return out;
}

} // namespace ragcore::metadata
