#include "script/script_source.hpp"

#include <fstream>
#include <sstream>

#include "httplib.h"

#include "utils/common.hpp"

namespace runbox::script {
namespace {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (utils::StartsWith(working, "https://")) {
        parsed.https = true;
        working = working.substr(8);
    } else if (utils::StartsWith(working, "http://")) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.path = working.substr(slash_pos);
    } else {
        parsed.path = "/";
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            throw ScriptLoadError("invalid port in " + url);
        }
    } else {
        parsed.host = host_port;
    }
    if (parsed.host.empty()) {
        throw ScriptLoadError("missing host in " + url);
    }
    return parsed;
}

std::string ReadFileUrl(const std::string& url) {
    const auto path = url.substr(7);
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw ScriptLoadError("cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::string FetchHttp(const std::string& url, std::chrono::milliseconds timeout) {
    const auto parsed = ParseUrl(url);
    const auto scheme_host_port = std::string(parsed.https ? "https://" : "http://") +
                                  parsed.host + ":" + std::to_string(parsed.port);
    httplib::Client client(scheme_host_port);
    client.set_follow_location(true);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);

    auto response = client.Get(parsed.path);
    if (!response) {
        throw ScriptLoadError("request to " + url + " failed: " + httplib::to_string(response.error()));
    }
    if (response->status != 200) {
        throw ScriptLoadError("request to " + url + " returned HTTP " + std::to_string(response->status));
    }
    return response->body;
}

}  // namespace

bool IsUrlReference(const std::string& script) {
    return utils::StartsWith(script, "http://") ||
           utils::StartsWith(script, "https://") ||
           utils::StartsWith(script, "file://");
}

std::string FetchScript(const std::string& url, std::chrono::milliseconds timeout) {
    if (utils::StartsWith(url, "file://")) {
        return ReadFileUrl(url);
    }
    if (utils::StartsWith(url, "http://") || utils::StartsWith(url, "https://")) {
        return FetchHttp(url, timeout);
    }
    throw ScriptLoadError("unsupported module reference " + url);
}

}  // namespace runbox::script
