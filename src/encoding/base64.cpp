#include "encoding/base64.hpp"

#include <openssl/evp.h>

namespace runbox::encoding {

std::string EncodeBase64(const Bytes& bytes) {
    if (bytes.empty()) {
        return {};
    }
    std::string encoded(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()),
        bytes.data(),
        static_cast<int>(bytes.size()));
    encoded.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return encoded;
}

std::optional<Bytes> DecodeBase64(const std::string& text) {
    if (text.empty()) {
        return Bytes{};
    }
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }
    Bytes decoded(3 * (text.size() / 4));
    const int written = EVP_DecodeBlock(
        decoded.data(),
        reinterpret_cast<const unsigned char*>(text.data()),
        static_cast<int>(text.size()));
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t padding = 0;
    if (text[text.size() - 1] == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return decoded;
}

}  // namespace runbox::encoding
