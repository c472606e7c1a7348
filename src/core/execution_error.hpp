#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/types.hpp"

namespace runbox {

// Failure outcome delivered as an exception, for callers that prefer a
// rejected future over inspecting an ExecutionOutcome.
class ExecutionError : public std::runtime_error {
public:
    explicit ExecutionError(ExecutionFailure failure)
        : std::runtime_error(failure.message.empty() ? "Unknown error" : failure.message)
        , failure_(std::move(failure)) {}

    FailureKind kind() const { return failure_.kind; }
    const std::optional<std::string>& stack() const { return failure_.stack; }
    const std::optional<std::string>& code() const { return failure_.code; }
    const std::vector<LogEntry>& logs() const { return failure_.logs; }
    const ExecutionFailure& failure() const { return failure_; }

private:
    ExecutionFailure failure_;
};

}  // namespace runbox
