#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <ragcore/chunking/text_chunker.h>

namespace ragcore::chunking {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Move a cut position onto a UTF-8 character start. Prefers moving backward but
// never to or below floor; in that case it moves forward instead.
size_t alignToCharStart(std::string_view text, size_t pos, size_t floor) {
    if (pos >= text.size()) {
        return text.size();
    }
    size_t back = pos;
    while (back > floor && isContinuationByte(text[back])) {
        --back;
    }
    if (back > floor) {
        return back;
    }
    size_t fwd = pos;
    while (fwd < text.size() && isContinuationByte(text[fwd])) {
        ++fwd;
    }
    return fwd;
}

std::string_view trimView(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isSpace(s[b]))
        ++b;
    while (e > b && isSpace(s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

} // namespace

TextChunker::TextChunker(ChunkingConfig config) : config_(std::move(config)) {
    if (config_.chunk_size == 0) {
        spdlog::warn("TextChunker: chunk_size 0 is invalid, using 1");
        config_.chunk_size = 1;
    }
    if (config_.overlap > config_.chunk_size) {
        spdlog::warn("TextChunker: overlap {} exceeds chunk_size {}, clamping", config_.overlap,
                     config_.chunk_size);
        config_.overlap = config_.chunk_size;
    }
}

Result<void> TextChunker::validateConfig(const ChunkingConfig& config) {
    if (config.chunk_size == 0) {
        return Error{ErrorCode::InvalidArgument, "chunk_size must be positive"};
    }
    if (config.overlap > config.chunk_size) {
        return Error{ErrorCode::InvalidArgument, "overlap must not exceed chunk_size"};
    }
    if (config.min_boundary_ratio < 0.0 || config.min_boundary_ratio >= 1.0) {
        return Error{ErrorCode::InvalidArgument, "min_boundary_ratio must be in [0, 1)"};
    }
    return {};
}

std::string TextChunker::normalizeText(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\n' || c == ' ') {
            size_t run = 0;
            while (i + run < text.size() && text[i + run] == c) {
                ++run;
            }
            size_t keep = run;
            if (c == ' ') {
                keep = 1;
            } else if (run >= 3) {
                keep = 2;
            }
            out.append(keep, c);
            i += run;
            continue;
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

size_t TextChunker::estimateTokenCount(std::string_view text) {
    size_t count = 0;
    bool inWord = false;
    for (char c : text) {
        if (isSpace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++count;
        }
    }
    return count;
}

size_t TextChunker::findBoundary(std::string_view text, size_t start, size_t end) const {
    std::string_view window = text.substr(start, end - start);
    const double minOffset = static_cast<double>(config_.chunk_size) * config_.min_boundary_ratio;

    for (const auto& sep : config_.boundaries) {
        if (sep.empty()) {
            continue;
        }
        auto pos = window.rfind(sep);
        if (pos != std::string_view::npos && static_cast<double>(pos) > minOffset) {
            return start + pos + sep.size();
        }
    }
    return end;
}

std::vector<TextChunk> TextChunker::chunk(std::string_view text) const {
    std::vector<TextChunk> chunks;
    if (text.empty()) {
        return chunks;
    }

    const std::string normalized = normalizeText(text);
    const std::string_view view(normalized);
    const size_t length = view.size();

    size_t start = 0;
    while (start < length) {
        size_t end = start + config_.chunk_size;
        if (end < length) {
            end = alignToCharStart(view, end, start);
            end = findBoundary(view, start, end);
        } else {
            end = length;
        }

        auto content = trimView(view.substr(start, end - start));
        if (!content.empty()) {
            TextChunk c;
            c.index = chunks.size();
            c.content = std::string(content);
            c.start_char = start;
            c.end_char = end;
            c.token_count = estimateTokenCount(content);
            chunks.push_back(std::move(c));
        }

        if (end >= length) {
            break;
        }

        size_t next = end > config_.overlap ? end - config_.overlap : 0;
        next = alignToCharStart(view, next, start);
        if (next <= start) {
            next = end;
        }
        start = next;
    }

    spdlog::debug("TextChunker: {} bytes -> {} chunks", length, chunks.size());
    return chunks;
}

std::vector<TextChunk> chunkText(std::string_view text, size_t chunk_size, size_t overlap) {
    ChunkingConfig config;
    config.chunk_size = chunk_size;
    config.overlap = overlap;
    return TextChunker(std::move(config)).chunk(text);
}

} // namespace ragcore::chunking
