#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/value.hpp"

namespace runbox {

enum class ConsoleLevel {
    kLog,
    kInfo,
    kWarn,
    kError
};

const char* ToString(ConsoleLevel level);
std::optional<ConsoleLevel> ParseConsoleLevel(const std::string& value);

struct LogEntry {
    std::int64_t timestamp_ms = 0;
    ConsoleLevel level = ConsoleLevel::kLog;
    std::string message;

    bool operator==(const LogEntry& other) const {
        return timestamp_ms == other.timestamp_ms && level == other.level && message == other.message;
    }
};

// Wire form is {"ts", "level", "message"}.
Json LogEntryToJson(const LogEntry& entry);
Json LogsToJson(const std::vector<LogEntry>& logs);
// Malformed entries are skipped.
std::vector<LogEntry> LogsFromJson(const Json& json);

enum class IsolationMode {
    kProcess,
    kNone
};

const char* ToString(IsolationMode mode);
std::optional<IsolationMode> ParseIsolationMode(const std::string& value);

struct ExecutionRequest {
    std::string script;
    std::string function_name;
    Json payload = Json::object();
    std::optional<std::int64_t> timeout_ms;
    IsolationMode isolation = IsolationMode::kProcess;
};

enum class FailureKind {
    kTimeout,
    kRuntimeError,
    kMemoryError,
    kProcessError,
    kUnknown
};

const char* ToString(FailureKind kind);

struct ExecutionSuccess {
    Value result;
    std::vector<LogEntry> logs;
};

struct ExecutionFailure {
    FailureKind kind = FailureKind::kUnknown;
    std::string message;
    std::optional<std::string> stack;
    std::optional<std::string> code;
    std::vector<LogEntry> logs;
};

using ExecutionOutcome = std::variant<ExecutionSuccess, ExecutionFailure>;

inline bool IsSuccess(const ExecutionOutcome& outcome) {
    return std::holds_alternative<ExecutionSuccess>(outcome);
}

inline ExecutionFailure MakeFailure(FailureKind kind,
                                    std::string message,
                                    std::optional<std::string> stack = std::nullopt,
                                    std::optional<std::string> code = std::nullopt) {
    ExecutionFailure failure{};
    failure.kind = kind;
    failure.message = std::move(message);
    failure.stack = std::move(stack);
    failure.code = std::move(code);
    return failure;
}

}  // namespace runbox
