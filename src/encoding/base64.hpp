#pragma once

#include <optional>
#include <string>

#include "core/value.hpp"

namespace runbox::encoding {

std::string EncodeBase64(const Bytes& bytes);
// Returns nullopt when input is not valid padded base64.
std::optional<Bytes> DecodeBase64(const std::string& text);

}  // namespace runbox::encoding
