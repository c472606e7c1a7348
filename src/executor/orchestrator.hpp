#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "config/config_schema.hpp"
#include "core/execution_error.hpp"
#include "core/types.hpp"
#include "sandbox/sandbox_handle.hpp"

namespace runbox::executor {

struct OrchestratorOptions {
    std::int64_t default_timeout_ms = 5000;
    std::int64_t max_timeout_ms = 300000;
    int io_threads = 2;
};

// Runs requests against the sandbox runner matching their isolation mode,
// racing each one against its deadline. Destruction waits for in-flight
// executions to resolve.
class Orchestrator {
public:
    Orchestrator(OrchestratorOptions options,
                 std::unique_ptr<sandbox::SandboxRunner> process_runner,
                 std::unique_ptr<sandbox::SandboxRunner> isolate_runner);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Never throws; every failure is an ExecutionFailure.
    std::future<ExecutionOutcome> Execute(ExecutionRequest request);
    // Failures reject the future with ExecutionError.
    std::future<ExecutionSuccess> ExecuteOrThrow(ExecutionRequest request);

    std::int64_t EffectiveTimeout(const ExecutionRequest& request) const;
    const OrchestratorOptions& options() const { return options_; }

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    struct Execution {
        explicit Execution(boost::asio::io_context& io)
            : strand(boost::asio::make_strand(io)), timer(strand) {}

        Strand strand;
        boost::asio::steady_timer timer;
        ExecutionRequest request;
        std::int64_t started_ms = 0;
        sandbox::SandboxRunner* runner = nullptr;
        std::unique_ptr<sandbox::SandboxHandle> handle;
        std::function<void(ExecutionOutcome)> deliver;
        bool resolved = false;
    };

    void Submit(ExecutionRequest request, std::function<void(ExecutionOutcome)> deliver);
    void Begin(const std::shared_ptr<Execution>& execution);
    void OnCompleted(const std::shared_ptr<Execution>& execution, ExecutionOutcome outcome);
    void OnDeadline(const std::shared_ptr<Execution>& execution);
    void Resolve(const std::shared_ptr<Execution>& execution, ExecutionOutcome outcome, sandbox::ReleaseMode mode);
    sandbox::SandboxRunner& RunnerFor(IsolationMode mode);
    void RunIo();

    OrchestratorOptions options_;
    std::unique_ptr<sandbox::SandboxRunner> process_runner_;
    std::unique_ptr<sandbox::SandboxRunner> isolate_runner_;
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::vector<std::thread> threads_;
};

// Process runner and isolate pool wired from configuration.
std::unique_ptr<Orchestrator> MakeOrchestrator(const config::Config& config);

}  // namespace runbox::executor
