#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace runbox::sandbox {

// Exit status the worker reserves for heap exhaustion.
constexpr int kOutOfMemoryExitCode = 3;
// Exit status for requests the worker could not read.
constexpr int kBadRequestExitCode = 1;

struct WorkerRequest {
    std::string script;
    std::string function_name;
    Json payload = Json::object();
};

// Single JSON document written to the worker's stdin.
std::string EncodeWorkerRequest(const ExecutionRequest& request);
// Throws nlohmann::json::exception or std::invalid_argument.
WorkerRequest DecodeWorkerRequest(const std::string& text);

// Result lines the worker prints on stdout.
Json EncodeWorkerSuccess(const Value& result, const std::vector<LogEntry>& logs);
Json EncodeWorkerError(const std::string& message,
                       const std::optional<std::string>& stack,
                       const std::optional<std::string>& code,
                       const std::vector<LogEntry>& logs);
// Diagnostic the worker prints on stderr before exiting with kBadRequestExitCode.
Json EncodeWorkerDiagnostic(const std::string& error);

struct WorkerExit {
    int exit_code = 0;
    // Non-zero when the worker was killed by a signal.
    int signal = 0;
    std::string stdout_text;
    std::string stderr_text;
};

ExecutionOutcome InterpretWorkerExit(const WorkerExit& exit);

}  // namespace runbox::sandbox
