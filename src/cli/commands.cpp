#include <atomic>
#include <chrono>
#include <csignal>
#include <signal.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>

#include "cli/gateway.hpp"
#include "cli/request_parser.hpp"
#include "config/config_loader.hpp"
#include "executor/orchestrator.hpp"
#include "executor/response.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void ConfigureLoggingFrom(const runbox::config::Config& config) {
    runbox::utils::LogConfig log_config{};
    log_config.min_level = runbox::utils::ParseLogLevel(config.logging.level);
    runbox::utils::ConfigureLogging(log_config);
}

bool ReadInput(const std::string& source, std::string& out) {
    if (source == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    out = buffer.str();
    return true;
}

int RunOnce(const std::string& source) {
    const auto config = runbox::config::LoadConfig();
    ConfigureLoggingFrom(config);

    std::string text;
    if (!ReadInput(source, text)) {
        std::cerr << "Failed to read request: " << source << std::endl;
        return 1;
    }

    runbox::executor::Response response;
    try {
        auto request = runbox::cli::ParseRequest(text);
        auto orchestrator = runbox::executor::MakeOrchestrator(config);
        response = runbox::executor::RenderResponse(orchestrator->Execute(std::move(request)).get());
    } catch (const runbox::cli::RequestError& ex) {
        response = runbox::executor::RenderError(400, ex.what());
    }

    std::cout << response.body.dump(2, ' ', false, runbox::Json::error_handler_t::replace) << std::endl;
    return response.status == 200 ? 0 : 1;
}

int RunGateway() {
    const auto config = runbox::config::LoadConfig();
    ConfigureLoggingFrom(config);

    auto orchestrator = runbox::executor::MakeOrchestrator(config);
    runbox::cli::Gateway gateway(*orchestrator, config.gateway);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&gateway, &listen_failed]() {
        if (!gateway.Listen()) {
            listen_failed.store(true);
        }
    });

    std::cout << "runbox gateway started on " << config.gateway.host << ":" << config.gateway.port
              << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    gateway.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int PrintConfig() {
    const auto config = runbox::config::LoadConfig();
    std::cout << runbox::config::ConfigToJson(config).dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "serve") {
        return RunGateway();
    }

    if (argc >= 3 && std::string(argv[1]) == "run") {
        return RunOnce(argv[2]);
    }

    if (argc >= 2 && std::string(argv[1]) == "config") {
        return PrintConfig();
    }

    std::cout << "Usage: runbox serve | runbox run <request.json|-> | runbox config" << std::endl;
    return 1;
}
