#pragma once

#include <string>

#include "core/types.hpp"

namespace runbox::executor {

struct Response {
    int status = 200;
    Json body = Json::object();
};

// 200 {result, logs}; 422 {message, stack, code?, logs} for failures of the
// caller's code; 400 {error} for everything else.
Response RenderResponse(const ExecutionOutcome& outcome);
Response RenderError(int status, const std::string& error);

}  // namespace runbox::executor
