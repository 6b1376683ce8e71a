#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <ragcore/core/types.h>

namespace ragcore::crypto {

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    void update(std::string_view text) { update(std::as_bytes(std::span(text))); }
};

// SHA-256 implementation (lowercase hex digests)
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher() override;

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    using IContentHasher::update;
    std::string finalize() override;

    Result<std::string> hashFile(const std::filesystem::path& path);

    // Static utilities for one-shot hashing
    static std::string hash(std::span<const std::byte> data);
    static std::string hashText(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory function
std::unique_ptr<IContentHasher> createSHA256Hasher();

} // namespace ragcore::crypto
