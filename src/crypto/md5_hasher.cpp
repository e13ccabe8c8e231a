#include <openssl/evp.h>
#include <fmt/format.h>
#include <array>
#include <stdexcept>
#include <vector>
#include <mediadex/crypto/hasher.h>

namespace mediadex::crypto {

struct MD5Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

MD5Hasher::MD5Hasher() : pImpl(std::make_unique<Impl>()) {
    init();
}

MD5Hasher::~MD5Hasher() = default;

MD5Hasher::MD5Hasher(MD5Hasher&&) noexcept = default;
MD5Hasher& MD5Hasher::operator=(MD5Hasher&&) noexcept = default;

void MD5Hasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize MD5");
    }
}

void MD5Hasher::update(std::span<const std::byte> data) {
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update MD5");
    }
}

std::string MD5Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error("Failed to finalize MD5");
    }

    std::string result;
    result.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        result += fmt::format("{:02x}", digest[i]);
    }

    // Reset for potential reuse
    init();
    return result;
}

std::string MD5Hasher::hex(std::string_view text) {
    MD5Hasher hasher;
    return hasher.hash(text);
}

FileId fileIdForPath(std::string_view absolutePath) {
    return MD5Hasher::hex(absolutePath);
}

std::string thumbnailKey(std::string_view absolutePath, double mtime) {
    // {} is the shortest round-trip representation of the double
    return MD5Hasher::hex(fmt::format("{}{}", absolutePath, mtime));
}

std::string base64UrlEncode(std::string_view data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    for (auto& c : out) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    return out;
}

Result<std::string> base64UrlDecode(std::string_view encoded) {
    std::string std64(encoded);
    for (auto& c : std64) {
        if (c == '-') {
            c = '+';
        } else if (c == '_') {
            c = '/';
        }
    }
    while (std64.size() % 4 != 0) {
        std64.push_back('=');
    }
    std::vector<unsigned char> out(3 * (std64.size() / 4) + 1);
    int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(std64.data()),
                                  static_cast<int>(std64.size()));
    if (decoded < 0) {
        return Error{ErrorCode::InvalidArgument, "invalid base64 key"};
    }
    // EVP_DecodeBlock counts padding bytes as output
    size_t padding = 0;
    for (auto it = std64.rbegin(); it != std64.rend() && *it == '=' && padding < 2; ++it) {
        ++padding;
    }
    size_t size = static_cast<size_t>(decoded) >= padding ? static_cast<size_t>(decoded) - padding : 0;
    return std::string(reinterpret_cast<const char*>(out.data()), size);
}

} // namespace mediadex::crypto
