#include <gtest/gtest.h>

#include <chrono>
#include <future>

#include "sandbox/process_runner.hpp"

using runbox::ExecutionFailure;
using runbox::ExecutionOutcome;
using runbox::ExecutionRequest;
using runbox::ExecutionSuccess;
using runbox::FailureKind;
using runbox::Value;
using runbox::sandbox::ProcessOptions;
using runbox::sandbox::ProcessRunner;
using runbox::sandbox::ReleaseMode;
using runbox::sandbox::SandboxError;

namespace {

ProcessOptions WorkerOptions(int memory_mb = 128) {
    ProcessOptions options{};
    options.worker_path = RUNBOX_WORKER_BINARY;
    options.memory_mb = memory_mb;
    return options;
}

ExecutionRequest Request(const std::string& script, const std::string& fn) {
    ExecutionRequest request{};
    request.script = script;
    request.function_name = fn;
    return request;
}

ExecutionOutcome RunToCompletion(ProcessRunner& runner, const ExecutionRequest& request) {
    auto handle = runner.Acquire();
    std::promise<ExecutionOutcome> done;
    auto future = done.get_future();
    handle->Start(request, [&done](ExecutionOutcome outcome) { done.set_value(std::move(outcome)); });
    auto outcome = future.get();
    runner.Release(std::move(handle), ReleaseMode::kDestroy);
    return outcome;
}

}  // namespace

TEST(ProcessRunner, RunsExportInWorker) {
    ProcessRunner runner(WorkerOptions());
    const auto outcome = RunToCompletion(runner, Request(
        "export function main() { console.log('from child'); return new Uint8Array([72, 101, 108, 108, 111]); }",
        "main"));
    ASSERT_TRUE(runbox::IsSuccess(outcome)) << std::get<ExecutionFailure>(outcome).message;
    const auto& success = std::get<ExecutionSuccess>(outcome);
    EXPECT_EQ(success.result, Value("data:text/plain;base64,SGVsbG8="));
    ASSERT_EQ(success.logs.size(), 1u);
    EXPECT_EQ(success.logs[0].message, "from child");
}

TEST(ProcessRunner, MissingExportMessage) {
    ProcessRunner runner(WorkerOptions());
    const auto outcome = RunToCompletion(runner, Request("export function other() {}", "main"));
    const auto& failure = std::get<ExecutionFailure>(outcome);
    EXPECT_EQ(failure.kind, FailureKind::kRuntimeError);
    EXPECT_EQ(failure.message, "Function \"main\" not found in module");
}

TEST(ProcessRunner, ThrownErrorIsRuntimeError) {
    ProcessRunner runner(WorkerOptions());
    const auto outcome = RunToCompletion(runner, Request(
        "export function main() { const e = new Error('nope'); e.code = 'E_NOPE'; throw e; }", "main"));
    const auto& failure = std::get<ExecutionFailure>(outcome);
    EXPECT_EQ(failure.kind, FailureKind::kRuntimeError);
    EXPECT_EQ(failure.message, "nope");
    EXPECT_EQ(failure.code, std::string("E_NOPE"));
    ASSERT_TRUE(failure.stack.has_value());
    EXPECT_EQ(failure.stack->rfind("Error: nope", 0), 0u);
}

TEST(ProcessRunner, HeapExhaustionIsMemoryError) {
    ProcessRunner runner(WorkerOptions(32));
    const auto outcome = RunToCompletion(runner, Request(
        "export function main() { const parts = []; while (true) { parts.push('x'.repeat(1 << 20) + parts.length); } }",
        "main"));
    const auto& failure = std::get<ExecutionFailure>(outcome);
    EXPECT_EQ(failure.kind, FailureKind::kMemoryError);
    EXPECT_EQ(failure.message, "Memory limit exceeded");
    EXPECT_EQ(failure.code, std::string("MEMORY_ERROR"));
}

TEST(ProcessRunner, TerminateKillsTheChild) {
    ProcessRunner runner(WorkerOptions());
    auto handle = runner.Acquire();
    std::promise<ExecutionOutcome> done;
    auto future = done.get_future();
    handle->Start(Request("export function main() { while (true) {} }", "main"),
                  [&done](ExecutionOutcome outcome) { done.set_value(std::move(outcome)); });

    ASSERT_EQ(future.wait_for(std::chrono::milliseconds(300)), std::future_status::timeout);
    const auto started = std::chrono::steady_clock::now();
    handle->Terminate();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));

    const auto outcome = future.get();
    EXPECT_EQ(std::get<ExecutionFailure>(outcome).kind, FailureKind::kProcessError);
    runner.Release(std::move(handle), ReleaseMode::kDestroy);
}

TEST(ProcessRunner, MissingWorkerBinary) {
    ProcessOptions options{};
    options.worker_path = "/nonexistent/runbox-worker";
    ProcessRunner runner(options);
    EXPECT_THROW(runner.Acquire(), SandboxError);
}
