#include "cli/request_parser.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace runbox::cli {
namespace {

std::string RequireNonEmptyString(const Json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_string()) {
        throw RequestError(std::string(key) + ": expected string");
    }
    auto value = json[key].get<std::string>();
    if (value.empty()) {
        throw RequestError(std::string(key) + ": must contain at least 1 character");
    }
    return value;
}

std::int64_t ParseTimeout(const Json& value) {
    if (value.is_number_unsigned()) {
        const auto timeout = value.get<std::uint64_t>();
        if (timeout < 1) {
            throw RequestError("timeout: must be greater than or equal to 1");
        }
        // The executor caps it anyway.
        return static_cast<std::int64_t>(
            std::min<std::uint64_t>(timeout, std::numeric_limits<std::int64_t>::max()));
    }
    if (value.is_number_integer()) {
        const auto timeout = value.get<std::int64_t>();
        if (timeout < 1) {
            throw RequestError("timeout: must be greater than or equal to 1");
        }
        return timeout;
    }
    if (value.is_number_float()) {
        const auto number = value.get<double>();
        if (!std::isfinite(number) || std::floor(number) != number) {
            throw RequestError("timeout: expected integer");
        }
        if (number < 1) {
            throw RequestError("timeout: must be greater than or equal to 1");
        }
        if (number >= 9.2e18) {
            return std::numeric_limits<std::int64_t>::max();
        }
        return static_cast<std::int64_t>(number);
    }
    throw RequestError("timeout: expected number");
}

}  // namespace

ExecutionRequest ParseRequest(const Json& json) {
    if (!json.is_object()) {
        throw RequestError("request: expected object");
    }
    ExecutionRequest request{};
    request.script = RequireNonEmptyString(json, "script");
    request.function_name = RequireNonEmptyString(json, "fn");

    if (!json.contains("payload") || !json["payload"].is_object()) {
        throw RequestError("payload: expected object");
    }
    request.payload = json["payload"];

    if (json.contains("timeout") && !json["timeout"].is_null()) {
        request.timeout_ms = ParseTimeout(json["timeout"]);
    }

    if (json.contains("isolation") && !json["isolation"].is_null()) {
        if (!json["isolation"].is_string()) {
            throw RequestError("isolation: expected string");
        }
        const auto mode = ParseIsolationMode(json["isolation"].get<std::string>());
        if (!mode) {
            throw RequestError("isolation: expected 'process' | 'none'");
        }
        request.isolation = *mode;
    }
    return request;
}

ExecutionRequest ParseRequest(const std::string& text) {
    Json json;
    try {
        json = Json::parse(text);
    } catch (const Json::parse_error& ex) {
        throw RequestError(std::string("invalid JSON: ") + ex.what());
    }
    return ParseRequest(json);
}

}  // namespace runbox::cli
