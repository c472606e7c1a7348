#include "encoding/mime_sniffer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

#include "encoding/base64.hpp"
#include "utils/common.hpp"

namespace runbox::encoding {
namespace {

constexpr std::size_t kSignatureBytes = 12;
constexpr std::size_t kTextSampleBytes = 512;
constexpr const char* kOctetStream = "application/octet-stream";

std::string HexSignature(const Bytes& bytes) {
    static const char* kDigits = "0123456789abcdef";
    const auto count = std::min(bytes.size(), kSignatureBytes);
    std::string hex;
    hex.reserve(count * 2);
    for (std::size_t i = 0; i < count; ++i) {
        hex.push_back(kDigits[bytes[i] >> 4]);
        hex.push_back(kDigits[bytes[i] & 0x0f]);
    }
    return hex;
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::optional<std::string> DetectBinarySignature(const std::string& sig) {
    using utils::StartsWith;

    // Images
    if (StartsWith(sig, "ffd8ff")) return "image/jpeg";
    if (StartsWith(sig, "89504e47")) return "image/png";
    if (StartsWith(sig, "47494638")) return "image/gif";
    if (StartsWith(sig, "52494646") && Contains(sig, "57454250")) return "image/webp";
    if (StartsWith(sig, "424d")) return "image/bmp";
    if (StartsWith(sig, "49492a00") || StartsWith(sig, "4d4d002a")) return "image/tiff";
    if (StartsWith(sig, "3c737667") || StartsWith(sig, "3c3f786d")) return "image/svg+xml";

    // ISO-BMFF: 32-bit box size, then "ftyp" and the major brand.
    if (StartsWith(sig, "0000") && sig.size() >= 24 && sig.compare(8, 8, "66747970") == 0) {
        const auto brand = sig.substr(16, 8);
        if (brand == "61766966" || brand == "61766973") {
            return "image/avif";
        }
        return "video/mp4";
    }
    if (StartsWith(sig, "000000") && (Contains(sig, "66747970") || Contains(sig, "6d646174"))) {
        return "video/mp4";
    }

    // Video
    if (StartsWith(sig, "1a45dfa3")) return "video/webm";
    if (StartsWith(sig, "464c56")) return "video/x-flv";

    // Audio
    if (StartsWith(sig, "494433") || StartsWith(sig, "fffb")) return "audio/mpeg";
    if (StartsWith(sig, "4f676753")) return "audio/ogg";
    if (StartsWith(sig, "52494646") && Contains(sig, "57415645")) return "audio/wav";

    // Documents
    if (StartsWith(sig, "25504446")) return "application/pdf";
    if (StartsWith(sig, "504b0304") || StartsWith(sig, "504b0506") || StartsWith(sig, "504b0708")) {
        return "application/zip";
    }
    if (StartsWith(sig, "d0cf11e0")) return "application/vnd.ms-office";

    // Archives
    if (StartsWith(sig, "1f8b")) return "application/gzip";
    if (StartsWith(sig, "425a68")) return "application/x-bzip2";
    if (StartsWith(sig, "377abcaf271c")) return "application/x-7z-compressed";
    if (StartsWith(sig, "526172211a07")) return "application/x-rar-compressed";

    return std::nullopt;
}

// Strict UTF-8 decoding: rejects overlong forms, surrogates and code
// points past U+10FFFF.
std::optional<std::u32string> DecodeUtf8(const std::uint8_t* data, std::size_t size) {
    std::u32string decoded;
    decoded.reserve(size);
    std::size_t i = 0;
    while (i < size) {
        const std::uint8_t lead = data[i];
        std::size_t extra = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            decoded.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xe0) == 0xc0) {
            extra = 1;
            code_point = lead & 0x1f;
        } else if ((lead & 0xf0) == 0xe0) {
            extra = 2;
            code_point = lead & 0x0f;
        } else if ((lead & 0xf8) == 0xf0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return std::nullopt;
        }
        if (i + extra >= size) {
            return std::nullopt;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const std::uint8_t next = data[i + k];
            if ((next & 0xc0) != 0x80) {
                return std::nullopt;
            }
            code_point = (code_point << 6) | (next & 0x3f);
        }
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            code_point > 0x10ffff ||
            (code_point >= 0xd800 && code_point <= 0xdfff)) {
            return std::nullopt;
        }
        decoded.push_back(static_cast<char32_t>(code_point));
        i += extra + 1;
    }
    return decoded;
}

// The JavaScript whitespace set (\s, String.prototype.trim).
bool IsWhitespace(char32_t c) {
    switch (c) {
        case U'\t': case U'\n': case U'\v': case U'\f': case U'\r': case U' ':
        case 0x00a0: case 0x1680: case 0x2028: case 0x2029: case 0x202f:
        case 0x205f: case 0x3000: case 0xfeff:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200a;
    }
}

bool IsPrintableText(const std::u32string& text) {
    return std::all_of(text.begin(), text.end(), [](char32_t c) {
        return (c >= 0x20 && c <= 0x7e) || IsWhitespace(c);
    });
}

// Trims and narrows printable text. Non-ASCII whitespace left inside the
// text becomes \x01 so it never matches a markup prefix.
std::string TrimToAscii(const std::u32string& text) {
    std::size_t first = 0;
    std::size_t last = text.size();
    while (first < last && IsWhitespace(text[first])) {
        ++first;
    }
    while (last > first && IsWhitespace(text[last - 1])) {
        --last;
    }
    std::string out;
    out.reserve(last - first);
    for (std::size_t i = first; i < last; ++i) {
        out.push_back(text[i] < 0x80 ? static_cast<char>(text[i]) : '\x01');
    }
    return out;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string DetectTextType(const std::string& trimmed) {
    const auto lowered = ToLower(trimmed);
    if (utils::StartsWith(trimmed, "{") || utils::StartsWith(trimmed, "[")) {
        return "application/json";
    }
    if (Contains(lowered, "<!doctype html") || Contains(lowered, "<html")) {
        return "text/html";
    }
    // SVG wins over generic XML whether or not there is a prolog.
    if (Contains(lowered, "<svg")) {
        return "image/svg+xml";
    }
    if (utils::StartsWith(trimmed, "<?xml") || utils::StartsWith(trimmed, "<")) {
        return "application/xml";
    }
    return "text/plain";
}

}  // namespace

std::string DetectMimeType(const Bytes& bytes) {
    if (bytes.empty()) {
        return kOctetStream;
    }

    if (auto binary = DetectBinarySignature(HexSignature(bytes))) {
        return *binary;
    }

    const auto sample = std::min(bytes.size(), kTextSampleBytes);
    auto text = DecodeUtf8(bytes.data(), sample);
    if (!text) {
        return kOctetStream;
    }
    // A leading byte order mark is not part of the text.
    if (!text->empty() && text->front() == 0xfeff) {
        text->erase(0, 1);
    }
    if (IsPrintableText(*text)) {
        return DetectTextType(TrimToAscii(*text));
    }
    return kOctetStream;
}

std::string EncodeDataUri(const Bytes& bytes) {
    return "data:" + DetectMimeType(bytes) + ";base64," + EncodeBase64(bytes);
}

std::optional<DataUri> DecodeDataUri(const std::string& uri) {
    static const std::string kPrefix = "data:";
    static const std::string kMarker = ";base64,";
    if (!utils::StartsWith(uri, kPrefix)) {
        return std::nullopt;
    }
    const auto marker = uri.find(kMarker, kPrefix.size());
    if (marker == std::string::npos) {
        return std::nullopt;
    }
    auto bytes = DecodeBase64(uri.substr(marker + kMarker.size()));
    if (!bytes) {
        return std::nullopt;
    }
    DataUri decoded{};
    decoded.mime_type = uri.substr(kPrefix.size(), marker - kPrefix.size());
    decoded.bytes = std::move(*bytes);
    return decoded;
}

}  // namespace runbox::encoding
