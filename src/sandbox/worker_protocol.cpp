#include "sandbox/worker_protocol.hpp"

#include <stdexcept>

namespace runbox::sandbox {
namespace {

std::optional<std::string> OptionalString(const Json& object, const char* key) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return std::nullopt;
}

std::string TrimTrailing(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

}  // namespace

std::string EncodeWorkerRequest(const ExecutionRequest& request) {
    Json json = Json::object();
    json["script"] = request.script;
    json["fn"] = request.function_name;
    json["payload"] = request.payload;
    return json.dump();
}

WorkerRequest DecodeWorkerRequest(const std::string& text) {
    const auto json = Json::parse(text);
    if (!json.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }
    WorkerRequest request{};
    if (!json.contains("script") || !json["script"].is_string()) {
        throw std::invalid_argument("request.script must be a string");
    }
    if (!json.contains("fn") || !json["fn"].is_string()) {
        throw std::invalid_argument("request.fn must be a string");
    }
    request.script = json["script"].get<std::string>();
    request.function_name = json["fn"].get<std::string>();
    if (json.contains("payload") && !json["payload"].is_null()) {
        request.payload = json["payload"];
    }
    return request;
}

Json EncodeWorkerSuccess(const Value& result, const std::vector<LogEntry>& logs) {
    Json json = Json::object();
    json["type"] = "success";
    json["result"] = result.ToJson();
    json["logs"] = LogsToJson(logs);
    return json;
}

Json EncodeWorkerError(const std::string& message,
                       const std::optional<std::string>& stack,
                       const std::optional<std::string>& code,
                       const std::vector<LogEntry>& logs) {
    Json json = Json::object();
    json["type"] = "error";
    json["error"] = message;
    json["message"] = message;
    if (stack) {
        json["stack"] = *stack;
    }
    if (code) {
        json["code"] = *code;
    }
    json["logs"] = LogsToJson(logs);
    return json;
}

Json EncodeWorkerDiagnostic(const std::string& error) {
    Json json = Json::object();
    json["type"] = "error";
    json["error"] = error;
    json["message"] = "Failed to process request";
    return json;
}

ExecutionOutcome InterpretWorkerExit(const WorkerExit& exit) {
    if (exit.signal == 0 && exit.exit_code == kOutOfMemoryExitCode) {
        return MakeFailure(FailureKind::kMemoryError, "Memory limit exceeded",
                           exit.stderr_text, std::string("MEMORY_ERROR"));
    }
    if (exit.signal != 0 || exit.exit_code != 0) {
        return MakeFailure(FailureKind::kProcessError, "Process failed", exit.stderr_text);
    }

    Json output;
    try {
        output = Json::parse(TrimTrailing(exit.stdout_text));
    } catch (const Json::parse_error& ex) {
        return MakeFailure(FailureKind::kProcessError, "Failed to parse output", std::string(ex.what()));
    }
    if (!output.is_object()) {
        return MakeFailure(FailureKind::kProcessError, "Failed to parse output",
                           std::string("worker output is not an object"));
    }

    const auto type = OptionalString(output, "type");
    if (type && *type == "success") {
        ExecutionSuccess success{};
        success.result = Value::FromJson(output.contains("result") ? output["result"] : Json());
        success.logs = LogsFromJson(output.contains("logs") ? output["logs"] : Json::array());
        return success;
    }

    auto failure = MakeFailure(FailureKind::kRuntimeError,
                               OptionalString(output, "error").value_or("Unknown error"),
                               OptionalString(output, "stack"),
                               OptionalString(output, "code"));
    failure.logs = LogsFromJson(output.contains("logs") ? output["logs"] : Json::array());
    return failure;
}

}  // namespace runbox::sandbox
