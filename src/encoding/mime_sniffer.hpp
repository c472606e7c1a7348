#pragma once

#include <optional>
#include <string>

#include "core/value.hpp"

namespace runbox::encoding {

// Content type from magic numbers, falling back to a look at the text.
std::string DetectMimeType(const Bytes& bytes);

// data:<mime-type>;base64,<payload>
std::string EncodeDataUri(const Bytes& bytes);

struct DataUri {
    std::string mime_type;
    Bytes bytes;
};

// Only understands the base64 form produced by EncodeDataUri.
std::optional<DataUri> DecodeDataUri(const std::string& uri);

}  // namespace runbox::encoding
