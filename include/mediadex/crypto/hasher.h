#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <mediadex/core/types.h>

namespace mediadex::crypto {

// Interface for digest hashers
class IHasher {
public:
    virtual ~IHasher() = default;

    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    std::string hash(std::string_view text) {
        init();
        update(std::as_bytes(std::span(text.data(), text.size())));
        return finalize();
    }
};

// MD5 implementation, used for path-derived identifiers only
class MD5Hasher : public IHasher {
public:
    MD5Hasher();
    ~MD5Hasher();

    MD5Hasher(const MD5Hasher&) = delete;
    MD5Hasher& operator=(const MD5Hasher&) = delete;
    MD5Hasher(MD5Hasher&&) noexcept;
    MD5Hasher& operator=(MD5Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    // One-shot lowercase hex digest
    static std::string hex(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/// Deterministic file id: MD5 of the absolute path string
FileId fileIdForPath(std::string_view absolutePath);

/// Thumbnail correlation key: MD5 of the path followed by its mtime
std::string thumbnailKey(std::string_view absolutePath, double mtime);

/// URL-safe base64 (`-` and `_` instead of `+` and `/`, padding kept)
std::string base64UrlEncode(std::string_view data);
Result<std::string> base64UrlDecode(std::string_view encoded);

} // namespace mediadex::crypto
