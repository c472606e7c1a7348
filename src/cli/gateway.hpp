#pragma once

#include <atomic>
#include <cstddef>
#include <string>

#include "config/config_schema.hpp"
#include "executor/orchestrator.hpp"
#include "httplib.h"

namespace runbox::cli {

struct GatewayReply {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

// HTTP front end: POST a request document to any path, get the rendered
// outcome back.
class Gateway {
public:
    Gateway(executor::Orchestrator& orchestrator, config::GatewayConfig config);

    // Blocks until Stop(). False when the socket could not be bound.
    // Port 0 binds any free port; see port().
    bool Listen();
    void Stop();
    bool running() const { return server_.is_running(); }
    int port() const { return bound_port_.load(); }
    std::size_t threads() const { return threads_; }

    GatewayReply Handle(const std::string& method, const std::string& body);

private:
    void Respond(const httplib::Request& req, httplib::Response& res);

    executor::Orchestrator& orchestrator_;
    config::GatewayConfig config_;
    std::size_t threads_;
    std::atomic<int> bound_port_{0};
    httplib::Server server_;
};

}  // namespace runbox::cli
