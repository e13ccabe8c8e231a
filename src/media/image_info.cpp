#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <mediadex/media/image_info.h>

namespace mediadex::media {

namespace {

constexpr std::string_view kPngSignature("\x89PNG\r\n\x1a\n", 8);
constexpr size_t kProbeBytes = 1 << 20;

uint32_t be32(std::string_view b, size_t off) {
    return (static_cast<uint32_t>(static_cast<uint8_t>(b[off])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[off + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[off + 2])) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(b[off + 3]));
}

uint16_t be16(std::string_view b, size_t off) {
    return static_cast<uint16_t>((static_cast<uint8_t>(b[off]) << 8) |
                                 static_cast<uint8_t>(b[off + 1]));
}

uint16_t le16(std::string_view b, size_t off) {
    return static_cast<uint16_t>(static_cast<uint8_t>(b[off]) |
                                 (static_cast<uint8_t>(b[off + 1]) << 8));
}

uint32_t le24(std::string_view b, size_t off) {
    return static_cast<uint32_t>(static_cast<uint8_t>(b[off])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[off + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[off + 2])) << 16);
}

uint32_t le32(std::string_view b, size_t off) {
    return le24(b, off) | (static_cast<uint32_t>(static_cast<uint8_t>(b[off + 3])) << 24);
}

uint8_t u8(std::string_view b, size_t off) {
    return static_cast<uint8_t>(b[off]);
}

std::optional<ImageSize> jpegSize(std::string_view b) {
    size_t pos = 2;
    while (pos + 4 <= b.size()) {
        if (u8(b, pos) != 0xFF) {
            return std::nullopt;
        }
        uint8_t marker = u8(b, pos + 1);
        if (marker == 0xFF) {
            ++pos;
            continue;
        }
        if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos += 2;
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA) {
            return std::nullopt;
        }
        uint16_t len = be16(b, pos + 2);
        bool isSof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 &&
                     marker != 0xCC;
        if (isSof) {
            if (pos + 9 > b.size()) {
                return std::nullopt;
            }
            return ImageSize{be16(b, pos + 7), be16(b, pos + 5)};
        }
        pos += 2 + static_cast<size_t>(len);
    }
    return std::nullopt;
}

// Walks RIFF chunks after the 12-byte WEBP header.
template <typename Fn> void forEachRiffChunk(std::string_view b, Fn&& fn) {
    size_t pos = 12;
    while (pos + 8 <= b.size()) {
        std::string_view fourcc = b.substr(pos, 4);
        uint32_t size = le32(b, pos + 4);
        size_t dataOff = pos + 8;
        if (!fn(fourcc, dataOff, static_cast<size_t>(size))) {
            return;
        }
        pos = dataOff + size + (size & 1u);
    }
}

std::optional<ImageSize> webpSize(std::string_view b) {
    std::optional<ImageSize> out;
    forEachRiffChunk(b, [&](std::string_view fourcc, size_t off, size_t) {
        if (fourcc == "VP8X" && off + 10 <= b.size()) {
            out = ImageSize{static_cast<int64_t>(le24(b, off + 4)) + 1,
                            static_cast<int64_t>(le24(b, off + 7)) + 1};
        } else if (fourcc == "VP8 " && off + 10 <= b.size()) {
            out = ImageSize{le16(b, off + 6) & 0x3FFF, le16(b, off + 8) & 0x3FFF};
        } else if (fourcc == "VP8L" && off + 5 <= b.size()) {
            uint8_t b0 = u8(b, off + 1), b1 = u8(b, off + 2), b2 = u8(b, off + 3),
                    b3 = u8(b, off + 4);
            out = ImageSize{1 + (((b1 & 0x3F) << 8) | b0),
                            1 + (((b3 & 0x0F) << 10) | (b2 << 2) | ((b1 & 0xC0) >> 6))};
        }
        return !out.has_value();
    });
    return out;
}

size_t skipGifSubBlocks(std::string_view b, size_t pos) {
    while (pos < b.size()) {
        uint8_t len = u8(b, pos);
        ++pos;
        if (len == 0) {
            return pos;
        }
        pos += len;
    }
    return b.size();
}

} // namespace

ImageFormat sniffFormat(std::string_view b) {
    if (b.size() >= 8 && b.substr(0, 8) == kPngSignature) {
        return ImageFormat::Png;
    }
    if (b.size() >= 3 && u8(b, 0) == 0xFF && u8(b, 1) == 0xD8 && u8(b, 2) == 0xFF) {
        return ImageFormat::Jpeg;
    }
    if (b.size() >= 6 && (b.substr(0, 6) == "GIF87a" || b.substr(0, 6) == "GIF89a")) {
        return ImageFormat::Gif;
    }
    if (b.size() >= 12 && b.substr(0, 4) == "RIFF" && b.substr(8, 4) == "WEBP") {
        return ImageFormat::WebP;
    }
    return ImageFormat::Unknown;
}

std::optional<ImageSize> parseImageSize(std::string_view b) {
    switch (sniffFormat(b)) {
        case ImageFormat::Png:
            if (b.size() >= 24 && b.substr(12, 4) == "IHDR") {
                return ImageSize{be32(b, 16), be32(b, 20)};
            }
            return std::nullopt;
        case ImageFormat::Jpeg:
            return jpegSize(b);
        case ImageFormat::Gif:
            if (b.size() >= 10) {
                return ImageSize{le16(b, 6), le16(b, 8)};
            }
            return std::nullopt;
        case ImageFormat::WebP:
            return webpSize(b);
        case ImageFormat::Unknown:
            break;
    }
    return std::nullopt;
}

std::optional<AnimationInfo> parseGifAnimation(std::string_view b) {
    if (sniffFormat(b) != ImageFormat::Gif || b.size() < 13) {
        return std::nullopt;
    }
    size_t pos = 13;
    uint8_t flags = u8(b, 10);
    if (flags & 0x80) {
        pos += 3u * (1u << ((flags & 0x07) + 1));
    }

    AnimationInfo info;
    std::optional<uint16_t> pendingDelay;
    while (pos < b.size()) {
        uint8_t block = u8(b, pos);
        if (block == 0x3B) {
            break;
        }
        if (block == 0x21) {
            if (pos + 2 > b.size()) {
                break;
            }
            uint8_t label = u8(b, pos + 1);
            if (label == 0xF9 && pos + 6 <= b.size()) {
                pendingDelay = le16(b, pos + 4);
            }
            pos = skipGifSubBlocks(b, pos + 2);
        } else if (block == 0x2C) {
            if (pos + 10 > b.size()) {
                break;
            }
            uint8_t local = u8(b, pos + 9);
            pos += 10;
            if (local & 0x80) {
                pos += 3u * (1u << ((local & 0x07) + 1));
            }
            pos = skipGifSubBlocks(b, pos + 1);
            uint16_t delay = pendingDelay.value_or(0);
            info.duration += std::chrono::milliseconds(delay == 0 ? 100 : delay * 10);
            ++info.frameCount;
            pendingDelay.reset();
        } else {
            break;
        }
    }
    return info;
}

std::optional<AnimationInfo> parseWebpAnimation(std::string_view b) {
    if (sniffFormat(b) != ImageFormat::WebP) {
        return std::nullopt;
    }
    AnimationInfo info;
    bool hasAnim = false;
    forEachRiffChunk(b, [&](std::string_view fourcc, size_t, size_t) {
        if (fourcc == "ANIM") {
            hasAnim = true;
        } else if (fourcc == "ANMF") {
            ++info.frameCount;
        }
        return true;
    });
    if (!hasAnim) {
        info.frameCount = info.frameCount > 0 ? info.frameCount : 1;
    }
    return info;
}

TextChunks parsePngTextChunks(std::string_view b) {
    TextChunks out;
    if (sniffFormat(b) != ImageFormat::Png) {
        return out;
    }
    size_t pos = 8;
    while (pos + 12 <= b.size()) {
        uint32_t len = be32(b, pos);
        std::string_view type = b.substr(pos + 4, 4);
        size_t dataOff = pos + 8;
        if (dataOff + len > b.size()) {
            break;
        }
        std::string_view data = b.substr(dataOff, len);
        if (type == "IEND") {
            break;
        }
        if (type == "tEXt") {
            auto nul = data.find('\0');
            if (nul != std::string_view::npos) {
                out.emplace_back(std::string(data.substr(0, nul)),
                                 std::string(data.substr(nul + 1)));
            }
        } else if (type == "iTXt") {
            // keyword \0 flag method language \0 translated \0 text
            auto nul = data.find('\0');
            if (nul != std::string_view::npos && nul + 3 <= data.size() && data[nul + 1] == 0) {
                auto lang = data.find('\0', nul + 3);
                auto translated =
                    lang == std::string_view::npos ? lang : data.find('\0', lang + 1);
                if (translated != std::string_view::npos) {
                    out.emplace_back(std::string(data.substr(0, nul)),
                                     std::string(data.substr(translated + 1)));
                }
            }
        }
        pos = dataOff + len + 4;
    }
    return out;
}

Result<std::string> readFileBytes(const std::filesystem::path& path, size_t maxBytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, fmt::format("cannot open {}", path.string())};
    }
    std::string data;
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (!ec) {
        data.resize(std::min<size_t>(static_cast<size_t>(size), maxBytes));
        in.read(data.data(), static_cast<std::streamsize>(data.size()));
        data.resize(static_cast<size_t>(in.gcount()));
        return data;
    }
    char buf[8192];
    while (data.size() < maxBytes && in.read(buf, sizeof(buf)).gcount() > 0) {
        data.append(buf, static_cast<size_t>(in.gcount()));
    }
    if (data.size() > maxBytes) {
        data.resize(maxBytes);
    }
    return data;
}

std::optional<ImageSize> probeImageSize(const std::filesystem::path& path) {
    auto bytes = readFileBytes(path, kProbeBytes);
    if (!bytes) {
        spdlog::debug("[ImageInfo] {}: {}", path.filename().string(), bytes.error().message);
        return std::nullopt;
    }
    return parseImageSize(bytes.value());
}

std::string formatDuration(double seconds) {
    if (!(seconds > 0)) {
        return "";
    }
    auto total = static_cast<int64_t>(seconds);
    int64_t s = total % 60;
    int64_t m = (total / 60) % 60;
    int64_t h = total / 3600;
    if (h > 0) {
        return fmt::format("{}:{:02d}:{:02d}", h, m, s);
    }
    return fmt::format("{:02d}:{:02d}", m, s);
}

} // namespace mediadex::media
