#include "core/types.hpp"

namespace runbox {

const char* ToString(ConsoleLevel level) {
    switch (level) {
        case ConsoleLevel::kLog: return "log";
        case ConsoleLevel::kInfo: return "info";
        case ConsoleLevel::kWarn: return "warn";
        case ConsoleLevel::kError: return "error";
    }
    return "log";
}

std::optional<ConsoleLevel> ParseConsoleLevel(const std::string& value) {
    if (value == "log") {
        return ConsoleLevel::kLog;
    }
    if (value == "info") {
        return ConsoleLevel::kInfo;
    }
    if (value == "warn") {
        return ConsoleLevel::kWarn;
    }
    if (value == "error") {
        return ConsoleLevel::kError;
    }
    return std::nullopt;
}

Json LogEntryToJson(const LogEntry& entry) {
    Json json = Json::object();
    json["ts"] = entry.timestamp_ms;
    json["level"] = ToString(entry.level);
    json["message"] = entry.message;
    return json;
}

Json LogsToJson(const std::vector<LogEntry>& logs) {
    Json json = Json::array();
    for (const auto& entry : logs) {
        json.push_back(LogEntryToJson(entry));
    }
    return json;
}

std::vector<LogEntry> LogsFromJson(const Json& json) {
    std::vector<LogEntry> logs;
    if (!json.is_array()) {
        return logs;
    }
    for (const auto& item : json) {
        if (!item.is_object()) {
            continue;
        }
        LogEntry entry{};
        if (item.contains("ts") && item["ts"].is_number()) {
            entry.timestamp_ms = item["ts"].get<std::int64_t>();
        }
        if (item.contains("level") && item["level"].is_string()) {
            const auto level = ParseConsoleLevel(item["level"].get<std::string>());
            if (!level) {
                continue;
            }
            entry.level = *level;
        }
        if (item.contains("message") && item["message"].is_string()) {
            entry.message = item["message"].get<std::string>();
        }
        logs.push_back(std::move(entry));
    }
    return logs;
}

const char* ToString(IsolationMode mode) {
    switch (mode) {
        case IsolationMode::kProcess: return "process";
        case IsolationMode::kNone: return "none";
    }
    return "process";
}

std::optional<IsolationMode> ParseIsolationMode(const std::string& value) {
    if (value == "process") {
        return IsolationMode::kProcess;
    }
    if (value == "none") {
        return IsolationMode::kNone;
    }
    return std::nullopt;
}

const char* ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::kTimeout: return "TIMEOUT";
        case FailureKind::kRuntimeError: return "RUNTIME_ERROR";
        case FailureKind::kMemoryError: return "MEMORY_ERROR";
        case FailureKind::kProcessError: return "PROCESS_ERROR";
        case FailureKind::kUnknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

}  // namespace runbox
