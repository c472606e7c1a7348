#include "cli/gateway.hpp"

#include <algorithm>
#include <utility>

#include "cli/request_parser.hpp"
#include "executor/response.hpp"
#include "utils/logging.hpp"

namespace runbox::cli {
namespace {

constexpr const char* kAnyPath = R"(/.*)";

GatewayReply ToReply(const executor::Response& response) {
    GatewayReply reply{};
    reply.status = response.status;
    reply.body = response.body.dump(-1, ' ', false, Json::error_handler_t::replace);
    return reply;
}

}  // namespace

Gateway::Gateway(executor::Orchestrator& orchestrator, config::GatewayConfig config)
    : orchestrator_(orchestrator)
    , config_(std::move(config))
    , threads_(static_cast<std::size_t>(std::max(1, config_.threads))) {
    const auto threads = threads_;
    server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    const auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        Respond(req, res);
    };
    server_.Post(kAnyPath, handler);
    server_.Get(kAnyPath, handler);
    server_.Put(kAnyPath, handler);
    server_.Patch(kAnyPath, handler);
    server_.Delete(kAnyPath, handler);
    server_.Options(kAnyPath, handler);
}

bool Gateway::Listen() {
    int port = config_.port;
    if (port == 0) {
        port = server_.bind_to_any_port(config_.host);
    } else if (!server_.bind_to_port(config_.host, port)) {
        port = -1;
    }
    if (port <= 0) {
        utils::LogError("gateway", "failed to listen on " + config_.host + ":" + std::to_string(config_.port));
        return false;
    }
    bound_port_.store(port);
    utils::LogInfo("gateway", "listening on " + config_.host + ":" + std::to_string(port) +
                                  " threads=" + std::to_string(threads_));
    return server_.listen_after_bind();
}

void Gateway::Stop() {
    server_.stop();
}

void Gateway::Respond(const httplib::Request& req, httplib::Response& res) {
    const auto reply = Handle(req.method, req.body);
    res.status = reply.status;
    res.set_content(reply.body, reply.content_type);
}

GatewayReply Gateway::Handle(const std::string& method, const std::string& body) {
    if (method != "POST") {
        GatewayReply reply{};
        reply.status = 405;
        reply.body = "Only POST";
        reply.content_type = "text/plain";
        return reply;
    }

    ExecutionRequest request;
    try {
        request = ParseRequest(body);
    } catch (const RequestError& ex) {
        utils::LogDebug("gateway", std::string("rejected request: ") + ex.what());
        return ToReply(executor::RenderError(400, ex.what()));
    }

    const auto outcome = orchestrator_.Execute(std::move(request)).get();
    const auto response = executor::RenderResponse(outcome);
    utils::LogInfo("gateway", "POST " + std::to_string(response.status));
    return ToReply(response);
}

}  // namespace runbox::cli
