#include "executor/response.hpp"

namespace runbox::executor {

Response RenderResponse(const ExecutionOutcome& outcome) {
    if (const auto* success = std::get_if<ExecutionSuccess>(&outcome)) {
        Response response{};
        response.status = 200;
        response.body["result"] = success->result.ToJson();
        response.body["logs"] = LogsToJson(success->logs);
        return response;
    }

    const auto& failure = std::get<ExecutionFailure>(outcome);
    switch (failure.kind) {
        case FailureKind::kRuntimeError:
        case FailureKind::kMemoryError: {
            Response response{};
            response.status = 422;
            response.body["message"] = failure.message;
            response.body["stack"] = failure.stack.value_or("");
            if (failure.code) {
                response.body["code"] = *failure.code;
            }
            response.body["logs"] = LogsToJson(failure.logs);
            return response;
        }
        case FailureKind::kTimeout:
        case FailureKind::kProcessError:
        case FailureKind::kUnknown:
            break;
    }
    return RenderError(400, failure.message.empty() ? "Unknown error" : failure.message);
}

Response RenderError(int status, const std::string& error) {
    Response response{};
    response.status = status;
    response.body["error"] = error;
    return response;
}

}  // namespace runbox::executor
