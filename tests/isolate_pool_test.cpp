#include <gtest/gtest.h>

#include <chrono>
#include <future>

#include "sandbox/isolate_pool.hpp"
#include "slow_script_server.hpp"

using runbox::ExecutionFailure;
using runbox::ExecutionOutcome;
using runbox::ExecutionRequest;
using runbox::ExecutionSuccess;
using runbox::FailureKind;
using runbox::Value;
using runbox::sandbox::IsolateHandle;
using runbox::sandbox::IsolatePool;
using runbox::sandbox::PoolOptions;
using runbox::sandbox::ReleaseMode;
using runbox::sandbox::SandboxHandle;

namespace {

ExecutionRequest Request(const std::string& script, const std::string& fn) {
    ExecutionRequest request{};
    request.script = script;
    request.function_name = fn;
    request.isolation = runbox::IsolationMode::kNone;
    return request;
}

ExecutionOutcome Run(SandboxHandle& handle, const ExecutionRequest& request) {
    std::promise<ExecutionOutcome> done;
    auto future = done.get_future();
    handle.Start(request, [&done](ExecutionOutcome outcome) { done.set_value(std::move(outcome)); });
    return future.get();
}

PoolOptions Options(std::size_t size, std::uint32_t recycle_after) {
    PoolOptions options{};
    options.size = size;
    options.recycle_after = recycle_after;
    options.memory_mb = 64;
    return options;
}

}  // namespace

TEST(IsolatePool, ReusesEntryAfterSuccess) {
    IsolatePool pool(Options(2, 100));

    auto first = pool.Acquire();
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.busy(), 1u);
    const auto outcome = Run(*first, Request("export function main(p) { return p.n * 2; }", "main"));
    ASSERT_TRUE(runbox::IsSuccess(outcome));
    pool.Release(std::move(first), ReleaseMode::kReuse);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.busy(), 0u);

    auto second = pool.Acquire();
    EXPECT_EQ(pool.size(), 1u);
    pool.Release(std::move(second), ReleaseMode::kDestroy);
    EXPECT_EQ(pool.size(), 0u);
}

TEST(IsolatePool, PayloadReachesTheFunction) {
    IsolatePool pool(Options(1, 100));
    auto handle = pool.Acquire();
    auto request = Request("export async function main(p) { return { sum: p.a + p.b }; }", "main");
    request.payload = {{"a", 2}, {"b", 3}};
    const auto outcome = Run(*handle, request);
    pool.Release(std::move(handle), ReleaseMode::kReuse);

    ASSERT_TRUE(runbox::IsSuccess(outcome));
    const auto* sum = std::get<ExecutionSuccess>(outcome).result.Find("sum");
    ASSERT_NE(sum, nullptr);
    EXPECT_EQ(*sum, Value(5));
}

TEST(IsolatePool, StateDoesNotLeakBetweenRequests) {
    IsolatePool pool(Options(1, 100));
    const auto script =
        "export function main() { const seen = globalThis.marker; globalThis.marker = 1; return seen === undefined; }";

    for (int i = 0; i < 2; ++i) {
        auto handle = pool.Acquire();
        const auto outcome = Run(*handle, Request(script, "main"));
        pool.Release(std::move(handle), ReleaseMode::kReuse);
        ASSERT_TRUE(runbox::IsSuccess(outcome));
        EXPECT_EQ(std::get<ExecutionSuccess>(outcome).result, Value(true));
    }
    EXPECT_EQ(pool.size(), 1u);
}

TEST(IsolatePool, RecyclesAfterThreshold) {
    IsolatePool pool(Options(1, 2));
    for (int i = 0; i < 2; ++i) {
        auto handle = pool.Acquire();
        ASSERT_TRUE(runbox::IsSuccess(Run(*handle, Request("export const main = () => 1;", "main"))));
        pool.Release(std::move(handle), ReleaseMode::kReuse);
    }
    EXPECT_EQ(pool.size(), 0u);
}

TEST(IsolatePool, ErrorsDiscardTheEntry) {
    IsolatePool pool(Options(1, 100));
    auto handle = pool.Acquire();
    const auto outcome = Run(*handle, Request("export function main() { throw new Error('bad'); }", "main"));
    pool.Release(std::move(handle), ReleaseMode::kDestroy);

    const auto& failure = std::get<ExecutionFailure>(outcome);
    EXPECT_EQ(failure.kind, FailureKind::kRuntimeError);
    EXPECT_EQ(failure.message, "bad");
    EXPECT_EQ(pool.size(), 0u);
}

TEST(IsolatePool, MissingExportMessage) {
    IsolatePool pool(Options(1, 100));
    auto handle = pool.Acquire();
    const auto outcome = Run(*handle, Request("export function other() {}", "main"));
    pool.Release(std::move(handle), ReleaseMode::kDestroy);
    EXPECT_EQ(std::get<ExecutionFailure>(outcome).message, "Code must export function main");
}

TEST(IsolatePool, FullPoolHandsOutTemporaryIsolates) {
    IsolatePool pool(Options(1, 100));
    auto pooled = pool.Acquire();
    auto extra = pool.Acquire();

    EXPECT_FALSE(dynamic_cast<IsolateHandle&>(*pooled).temporary());
    EXPECT_TRUE(dynamic_cast<IsolateHandle&>(*extra).temporary());
    EXPECT_EQ(pool.size(), 1u);

    ASSERT_TRUE(runbox::IsSuccess(Run(*extra, Request("export const main = () => 'x';", "main"))));
    pool.Release(std::move(extra), ReleaseMode::kReuse);
    pool.Release(std::move(pooled), ReleaseMode::kReuse);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(IsolatePool, ZeroSizeNeverPools) {
    IsolatePool pool(Options(0, 100));
    auto handle = pool.Acquire();
    EXPECT_TRUE(dynamic_cast<IsolateHandle&>(*handle).temporary());
    pool.Release(std::move(handle), ReleaseMode::kReuse);
    EXPECT_EQ(pool.size(), 0u);
}

TEST(IsolatePool, TerminateInterruptsRunawayCode) {
    IsolatePool pool(Options(1, 100));
    auto handle = pool.Acquire();
    std::promise<ExecutionOutcome> done;
    auto future = done.get_future();
    handle->Start(Request("export function main() { for (;;) {} }", "main"),
                  [&done](ExecutionOutcome outcome) { done.set_value(std::move(outcome)); });

    ASSERT_EQ(future.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);
    handle->Terminate();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    const auto outcome = future.get();
    EXPECT_EQ(std::get<ExecutionFailure>(outcome).kind, FailureKind::kTimeout);

    pool.Release(std::move(handle), ReleaseMode::kDestroy);
    EXPECT_EQ(pool.size(), 0u);
}

TEST(IsolatePool, ReleaseDoesNotWaitForStuckIsolate) {
    for (const std::size_t size : {std::size_t{1}, std::size_t{0}}) {
        runbox::testing::SlowScriptServer server;
        std::promise<ExecutionOutcome> done;
        auto future = done.get_future();
        IsolatePool pool(Options(size, 100));

        auto handle = pool.Acquire();
        EXPECT_EQ(dynamic_cast<IsolateHandle&>(*handle).temporary(), size == 0);
        handle->Start(Request(server.url(), "main"),
                      [&done](ExecutionOutcome outcome) { done.set_value(std::move(outcome)); });
        ASSERT_EQ(future.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);

        // The isolate thread is inside the module fetch and cannot see the interrupt.
        handle->Terminate();
        const auto started = std::chrono::steady_clock::now();
        pool.Release(std::move(handle), ReleaseMode::kDestroy);
        EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(100));
        EXPECT_EQ(pool.size(), 0u);
        EXPECT_EQ(pool.retiring(), 1u);

        server.Release();
        ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        EXPECT_FALSE(runbox::IsSuccess(future.get()));
    }
}
