#pragma once

#include <stdexcept>
#include <string>

#include "core/types.hpp"

namespace runbox::cli {

class RequestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Validates {script, fn, payload, timeout?, isolation?}. Throws RequestError.
ExecutionRequest ParseRequest(const Json& json);
ExecutionRequest ParseRequest(const std::string& text);

}  // namespace runbox::cli
