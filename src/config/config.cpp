#include <spdlog/spdlog.h>
#include <array>
#include <cctype>
#include <charconv>
#include <ragcore/config/config.h>
#include <ragcore/config/config_helpers.h>

namespace ragcore::config {

namespace {

template <typename T> Result<void> parseUnsigned(const std::string& raw, T& out) {
    T value{};
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last) {
        return Error{ErrorCode::InvalidArgument, "expected a non-negative integer, got '" + raw + "'"};
    }
    out = value;
    return {};
}

Result<void> parseDouble(const std::string& raw, double& out) {
    double value = 0.0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last) {
        return Error{ErrorCode::InvalidArgument, "expected a number, got '" + raw + "'"};
    }
    out = value;
    return {};
}

struct FieldSpec {
    const char* section; // empty for top-level keys
    const char* key;
    Result<void> (*apply)(RagConfig&, const std::string&);
};

const std::array<FieldSpec, 17> kFields{{
    {"storage", "database_path",
     [](RagConfig& c, const std::string& v) -> Result<void> {
         c.storage.database_path = expand_tilde(v);
         return {};
     }},
    {"storage", "artifact_dir",
     [](RagConfig& c, const std::string& v) -> Result<void> {
         c.storage.artifact_dir = expand_tilde(v);
         return {};
     }},
    {"chunking", "chunk_size",
     [](RagConfig& c, const std::string& v) { return parseUnsigned(v, c.chunking.chunk_size); }},
    {"chunking", "overlap",
     [](RagConfig& c, const std::string& v) { return parseUnsigned(v, c.chunking.overlap); }},
    {"embedding", "provider",
     [](RagConfig& c, const std::string& v) -> Result<void> {
         c.embedding.provider = v;
         return {};
     }},
    {"embedding", "endpoint",
     [](RagConfig& c, const std::string& v) -> Result<void> {
         c.embedding.endpoint = v;
         return {};
     }},
    {"embedding", "model",
     [](RagConfig& c, const std::string& v) -> Result<void> {
         c.embedding.model = v;
         return {};
     }},
    {"embedding", "timeout_ms",
     [](RagConfig& c, const std::string& v) { return parseUnsigned(v, c.embedding.timeout_ms); }},
    {"embedding", "max_input_chars",
     [](RagConfig& c, const std::string& v) {
         return parseUnsigned(v, c.embedding.max_input_chars);
     }},
    {"embedding", "dimension",
     [](RagConfig& c, const std::string& v) { return parseUnsigned(v, c.embedding.dimension); }},
    {"embedding", "retry_after_ms",
     [](RagConfig& c, const std::string& v) {
         return parseUnsigned(v, c.embedding.retry_after_ms);
     }},
    {"retrieval", "top_k",
     [](RagConfig& c, const std::string& v) { return parseUnsigned(v, c.retrieval.top_k); }},
    {"retrieval", "min_similarity",
     [](RagConfig& c, const std::string& v) { return parseDouble(v, c.retrieval.min_similarity); }},
    {"retrieval", "context_max_tokens",
     [](RagConfig& c, const std::string& v) {
         return parseUnsigned(v, c.retrieval.context_max_tokens);
     }},
    {"retrieval", "context_candidates",
     [](RagConfig& c, const std::string& v) {
         return parseUnsigned(v, c.retrieval.context_candidates);
     }},
    {"ingestion", "workers",
     [](RagConfig& c, const std::string& v) { return parseUnsigned(v, c.ingestion.workers); }},
    {"", "log_level",
     [](RagConfig& c, const std::string& v) -> Result<void> {
         c.log_level = v;
         return {};
     }},
}};

std::string dottedName(const FieldSpec& f) {
    std::string name = f.section;
    if (!name.empty()) {
        name += '.';
    }
    return name + f.key;
}

std::string envName(const FieldSpec& f) {
    std::string name = "RAGCORE_";
    if (*f.section) {
        name += f.section;
        name += '_';
    }
    name += f.key;
    for (auto& ch : name) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return name;
}

Result<void> applyField(RagConfig& config, const FieldSpec& f, const std::string& raw) {
    auto r = f.apply(config, raw);
    if (!r) {
        return Error{ErrorCode::InvalidArgument, dottedName(f) + ": " + r.error().message};
    }
    return {};
}

} // namespace

RagConfig defaultConfig(const std::filesystem::path& dataDir) {
    RagConfig config;
    config.storage.database_path = dataDir / "knowledge.db";
    config.storage.artifact_dir = dataDir / "artifacts";
    return config;
}

Result<void> applyOverrides(RagConfig& config, const std::map<std::string, std::string>& values) {
    for (const auto& [name, raw] : values) {
        const FieldSpec* match = nullptr;
        for (const auto& f : kFields) {
            if (dottedName(f) == name) {
                match = &f;
                break;
            }
        }
        if (!match) {
            return Error{ErrorCode::InvalidArgument, "unknown config key: " + name};
        }
        auto r = applyField(config, *match, raw);
        if (!r) {
            return r;
        }
    }
    return {};
}

Result<RagConfig> loadConfig(const std::filesystem::path& configPath) {
    std::filesystem::path dataDir = get_data_dir();
    if (const char* env = std::getenv("RAGCORE_DATA_DIR"); env && *env) {
        dataDir = expand_tilde(env);
    }
    RagConfig config = defaultConfig(dataDir);

    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        spdlog::debug("loading config from {}", configPath.string());
        for (const auto& f : kFields) {
            auto raw = parse_config_value(configPath, f.section, f.key);
            if (raw.empty()) {
                continue;
            }
            auto r = applyField(config, f, raw);
            if (!r) {
                return r.error();
            }
        }
    }

    for (const auto& f : kFields) {
        const char* env = std::getenv(envName(f).c_str());
        if (!env || !*env) {
            continue;
        }
        auto r = applyField(config, f, env);
        if (!r) {
            return r.error();
        }
    }
    if (const char* env = std::getenv("RAGCORE_DB_PATH"); env && *env) {
        config.storage.database_path = expand_tilde(env);
    }

    auto valid = validate(config);
    if (!valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate(const RagConfig& config) {
    if (config.storage.database_path.empty()) {
        return Error{ErrorCode::InvalidArgument, "storage.database_path must be set"};
    }
    if (config.chunking.chunk_size == 0) {
        return Error{ErrorCode::InvalidArgument, "chunking.chunk_size must be positive"};
    }
    if (config.chunking.overlap > config.chunking.chunk_size) {
        return Error{ErrorCode::InvalidArgument,
                     "chunking.overlap must not exceed chunking.chunk_size"};
    }
    if (config.embedding.provider != "http" && config.embedding.provider != "local") {
        return Error{ErrorCode::InvalidArgument,
                     "embedding.provider must be 'http' or 'local', got '" +
                         config.embedding.provider + "'"};
    }
    if (config.embedding.timeout_ms == 0) {
        return Error{ErrorCode::InvalidArgument, "embedding.timeout_ms must be positive"};
    }
    if (config.embedding.dimension == 0) {
        return Error{ErrorCode::InvalidArgument, "embedding.dimension must be positive"};
    }
    if (config.retrieval.top_k == 0) {
        return Error{ErrorCode::InvalidArgument, "retrieval.top_k must be positive"};
    }
    if (config.retrieval.context_candidates == 0) {
        return Error{ErrorCode::InvalidArgument, "retrieval.context_candidates must be positive"};
    }
    if (config.retrieval.min_similarity < -1.0 || config.retrieval.min_similarity > 1.0) {
        return Error{ErrorCode::InvalidArgument, "retrieval.min_similarity must be within [-1, 1]"};
    }
    if (config.ingestion.workers == 0) {
        return Error{ErrorCode::InvalidArgument, "ingestion.workers must be positive"};
    }
    static constexpr std::array<std::string_view, 7> kLevels{"trace", "debug", "info", "warn",
                                                             "error", "critical", "off"};
    if (std::find(kLevels.begin(), kLevels.end(), config.log_level) == kLevels.end()) {
        return Error{ErrorCode::InvalidArgument, "log_level '" + config.log_level + "' is not valid"};
    }
    return {};
}

} // namespace ragcore::config
