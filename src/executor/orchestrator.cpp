#include "executor/orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include "encoding/result_normalizer.hpp"
#include "sandbox/isolate_pool.hpp"
#include "sandbox/process_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::executor {

Orchestrator::Orchestrator(OrchestratorOptions options,
                           std::unique_ptr<sandbox::SandboxRunner> process_runner,
                           std::unique_ptr<sandbox::SandboxRunner> isolate_runner)
    : options_(options)
    , process_runner_(std::move(process_runner))
    , isolate_runner_(std::move(isolate_runner))
    , work_(boost::asio::make_work_guard(io_)) {
    const int threads = std::max(1, options_.io_threads);
    threads_.reserve(static_cast<std::size_t>(threads));
    for (int i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { RunIo(); });
    }
}

Orchestrator::~Orchestrator() {
    work_.reset();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    // Retired isolates may still complete and post to io_; it must outlive them.
    isolate_runner_.reset();
    process_runner_.reset();
}

void Orchestrator::RunIo() {
    while (true) {
        try {
            io_.run();
            return;
        } catch (const std::exception& ex) {
            utils::LogError("executor", std::string("io handler failed: ") + ex.what());
        }
    }
}

std::int64_t Orchestrator::EffectiveTimeout(const ExecutionRequest& request) const {
    return std::min(request.timeout_ms.value_or(options_.default_timeout_ms), options_.max_timeout_ms);
}

std::future<ExecutionOutcome> Orchestrator::Execute(ExecutionRequest request) {
    auto promise = std::make_shared<std::promise<ExecutionOutcome>>();
    auto future = promise->get_future();
    Submit(std::move(request), [promise](ExecutionOutcome outcome) {
        promise->set_value(std::move(outcome));
    });
    return future;
}

std::future<ExecutionSuccess> Orchestrator::ExecuteOrThrow(ExecutionRequest request) {
    auto promise = std::make_shared<std::promise<ExecutionSuccess>>();
    auto future = promise->get_future();
    Submit(std::move(request), [promise](ExecutionOutcome outcome) {
        if (auto* success = std::get_if<ExecutionSuccess>(&outcome)) {
            promise->set_value(std::move(*success));
            return;
        }
        promise->set_exception(std::make_exception_ptr(
            ExecutionError(std::move(std::get<ExecutionFailure>(outcome)))));
    });
    return future;
}

void Orchestrator::Submit(ExecutionRequest request, std::function<void(ExecutionOutcome)> deliver) {
    auto execution = std::make_shared<Execution>(io_);
    execution->request = std::move(request);
    execution->deliver = std::move(deliver);
    execution->started_ms = utils::NowMs();
    boost::asio::dispatch(execution->strand, [this, execution] { Begin(execution); });
}

sandbox::SandboxRunner& Orchestrator::RunnerFor(IsolationMode mode) {
    return mode == IsolationMode::kNone ? *isolate_runner_ : *process_runner_;
}

void Orchestrator::Begin(const std::shared_ptr<Execution>& execution) {
    const auto timeout_ms = EffectiveTimeout(execution->request);
    // Runners bound blocking host work by the same deadline.
    execution->request.timeout_ms = timeout_ms;
    execution->runner = &RunnerFor(execution->request.isolation);
    utils::LogDebug("executor", "starting " + execution->request.function_name + " isolation=" +
                                    ToString(execution->request.isolation) +
                                    " timeout=" + std::to_string(timeout_ms) + "ms");
    try {
        execution->handle = execution->runner->Acquire();

        execution->timer.expires_after(std::chrono::milliseconds(timeout_ms));
        execution->timer.async_wait([this, execution](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            OnDeadline(execution);
        });

        execution->handle->Start(execution->request, [this, execution](ExecutionOutcome outcome) {
            boost::asio::post(execution->strand, [this, execution, outcome = std::move(outcome)]() mutable {
                OnCompleted(execution, std::move(outcome));
            });
        });
    } catch (const sandbox::SandboxError& ex) {
        utils::LogWarn("executor", std::string("sandbox unavailable: ") + ex.what());
        Resolve(execution, MakeFailure(FailureKind::kProcessError, "Process error", std::string(ex.what())),
                sandbox::ReleaseMode::kDestroy);
    } catch (const std::exception& ex) {
        utils::LogError("executor", std::string("execution failed to start: ") + ex.what());
        Resolve(execution, MakeFailure(FailureKind::kUnknown, ex.what()), sandbox::ReleaseMode::kDestroy);
    }
}

void Orchestrator::OnCompleted(const std::shared_ptr<Execution>& execution, ExecutionOutcome outcome) {
    if (execution->resolved) {
        return;
    }
    const auto mode = IsSuccess(outcome) ? sandbox::ReleaseMode::kReuse : sandbox::ReleaseMode::kDestroy;
    Resolve(execution, std::move(outcome), mode);
}

void Orchestrator::OnDeadline(const std::shared_ptr<Execution>& execution) {
    if (execution->resolved) {
        return;
    }
    utils::LogInfo("executor", "timeout after " + std::to_string(EffectiveTimeout(execution->request)) +
                                   "ms, terminating " + execution->request.function_name);
    if (execution->handle) {
        execution->handle->Terminate();
    }
    Resolve(execution,
            MakeFailure(FailureKind::kTimeout, "Execution timeout", std::nullopt, std::string("TIMEOUT_ERROR")),
            sandbox::ReleaseMode::kDestroy);
}

void Orchestrator::Resolve(const std::shared_ptr<Execution>& execution,
                           ExecutionOutcome outcome,
                           sandbox::ReleaseMode mode) {
    execution->resolved = true;
    execution->timer.cancel();
    if (execution->handle) {
        execution->runner->Release(std::move(execution->handle), mode);
    }

    if (auto* success = std::get_if<ExecutionSuccess>(&outcome)) {
        success->result = encoding::NormalizeResult(std::move(success->result));
        utils::LogDebug("executor", execution->request.function_name + " succeeded in " +
                                        std::to_string(utils::NowMs() - execution->started_ms) + "ms");
    } else {
        const auto& failure = std::get<ExecutionFailure>(outcome);
        utils::LogDebug("executor", execution->request.function_name + " failed: " +
                                        ToString(failure.kind) + " " + failure.message);
    }

    auto deliver = std::move(execution->deliver);
    execution->deliver = nullptr;
    deliver(std::move(outcome));
}

std::unique_ptr<Orchestrator> MakeOrchestrator(const config::Config& config) {
    OrchestratorOptions options{};
    options.default_timeout_ms = config.executor.default_timeout_ms;
    options.max_timeout_ms = config.executor.max_timeout_ms;
    options.io_threads = config.executor.io_threads;

    sandbox::ProcessOptions process{};
    process.worker_path = config.process.worker_path;
    process.memory_mb = config.process.memory_mb;

    sandbox::PoolOptions pool{};
    pool.size = static_cast<std::size_t>(std::max(0, config.pool.size));
    pool.recycle_after = static_cast<std::uint32_t>(std::max(1, config.pool.recycle_after));
    pool.memory_mb = static_cast<std::size_t>(std::max(1, config.pool.memory_mb));

    return std::make_unique<Orchestrator>(options,
                                          std::make_unique<sandbox::ProcessRunner>(process),
                                          std::make_unique<sandbox::IsolatePool>(pool));
}

}  // namespace runbox::executor
