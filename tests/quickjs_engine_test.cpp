#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "script/quickjs_engine.hpp"
#include "slow_script_server.hpp"

using runbox::Bytes;
using runbox::ConsoleLevel;
using runbox::Json;
using runbox::Value;
using runbox::script::EngineOptions;
using runbox::script::InvocationResult;
using runbox::script::InvocationSpec;
using runbox::script::InvocationStatus;
using runbox::script::ScriptEngine;

namespace {

InvocationSpec Spec(const std::string& script, const std::string& fn, Json payload = Json::object()) {
    InvocationSpec spec{};
    spec.script = script;
    spec.function_name = fn;
    spec.payload = std::move(payload);
    spec.missing_function_message = "Code must export function " + fn;
    return spec;
}

}  // namespace

TEST(ScriptEngine, ReturnsPlainValue) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec("export function main(p) { return p.a + 1; }", "main", {{"a", 41}}));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    EXPECT_EQ(result.result, Value(42));
    EXPECT_TRUE(result.reusable);
}

TEST(ScriptEngine, AwaitsAsyncExports) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "export async function main() { await null; return { ok: true, items: [1, 'two'] }; }", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    EXPECT_EQ(result.result.ToJson(), Json::parse(R"({"ok":true,"items":[1,"two"]})"));
}

TEST(ScriptEngine, CapturesConsoleInOrder) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "export function main() { console.log('first'); console.warn('second', 2); console.error('third'); return 0; }",
        "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess);
    ASSERT_EQ(result.logs.size(), 3u);
    EXPECT_EQ(result.logs[0].message, "first");
    EXPECT_EQ(result.logs[1].message, "second 2");
    EXPECT_EQ(result.logs[1].level, ConsoleLevel::kWarn);
    EXPECT_EQ(result.logs[2].level, ConsoleLevel::kError);
}

TEST(ScriptEngine, ThrownErrorCarriesStackAndCode) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "export function main() { console.log('about to fail');"
        " const e = new TypeError('bad input'); e.code = 'E_BAD'; throw e; }",
        "main"));
    ASSERT_EQ(result.status, InvocationStatus::kError);
    EXPECT_EQ(result.message, "bad input");
    ASSERT_TRUE(result.stack.has_value());
    EXPECT_EQ(result.stack->rfind("TypeError: bad input", 0), 0u);
    ASSERT_TRUE(result.code.has_value());
    EXPECT_EQ(*result.code, "E_BAD");
    ASSERT_EQ(result.logs.size(), 1u);
    EXPECT_EQ(result.logs[0].message, "about to fail");
    EXPECT_FALSE(result.reusable);
}

TEST(ScriptEngine, RejectedPromiseIsAnError) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "export async function main() { await null; throw new Error('late'); }", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kError);
    EXPECT_EQ(result.message, "late");
}

TEST(ScriptEngine, ThrownNonErrorUsesItsString) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec("export function main() { throw 'oops'; }", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kError);
    EXPECT_EQ(result.message, "oops");
    EXPECT_FALSE(result.stack.has_value());
}

TEST(ScriptEngine, MissingExport) {
    ScriptEngine engine;
    auto result = engine.Invoke(Spec("export function other() {}", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kError);
    EXPECT_EQ(result.message, "Code must export function main");

    result = engine.Invoke(Spec("export const main = 5;", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kError);
    EXPECT_EQ(result.message, "Code must export function main");
}

TEST(ScriptEngine, SyntaxErrorIsAnError) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec("export function main( {", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kError);
    ASSERT_TRUE(result.stack.has_value());
    EXPECT_EQ(result.stack->rfind("SyntaxError", 0), 0u);
}

TEST(ScriptEngine, Uint8ArrayBecomesBinary) {
    ScriptEngine engine;
    const auto bytes = engine.Invoke(Spec(
        "export function main() { return new Uint8Array([72, 101, 108, 108, 111]); }", "main"));
    ASSERT_EQ(bytes.status, InvocationStatus::kSuccess) << bytes.message;
    ASSERT_TRUE(bytes.result.IsBinary());
    EXPECT_EQ(bytes.result.AsBinary(), (Bytes{72, 101, 108, 108, 111}));
}

TEST(ScriptEngine, Uint8ArrayViewRespectsOffset) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "export function main() { const b = new Uint8Array([1, 2, 3, 4, 5]); return b.subarray(1, 3); }",
        "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    EXPECT_EQ(result.result.AsBinary(), (Bytes{2, 3}));
}

TEST(ScriptEngine, NestedBuffersStayBinary) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "export function main() {"
        " const png = new Uint8Array([0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a]);"
        " return { image: png, list: [png, 1], meta: { inner: png } }; }",
        "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    EXPECT_TRUE(result.result.Find("image")->IsBinary());
    EXPECT_TRUE(result.result.Find("list")->AsSequence()[0].IsBinary());
    EXPECT_TRUE(result.result.Find("meta")->Find("inner")->IsBinary());
}

TEST(ScriptEngine, JsonSemanticsForUndefinedAndFunctions) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "export function main() { return { a: undefined, b: () => 1, c: [undefined, () => 1, 3], d: null }; }",
        "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess);
    EXPECT_EQ(result.result.ToJson().dump(), R"({"c":[null,null,3],"d":null})");

    const auto undefined_result = engine.Invoke(Spec("export function main() {}", "main"));
    ASSERT_EQ(undefined_result.status, InvocationStatus::kSuccess);
    EXPECT_TRUE(undefined_result.result.IsNull());
}

TEST(ScriptEngine, NumbersKeepIntegerShape) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec("export function main() { return [2.0, 1.5, 1e20, -0]; }", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess);
    const auto& items = result.result.AsSequence();
    EXPECT_EQ(items[0], Value(2));
    EXPECT_EQ(items[1], Value(1.5));
    EXPECT_TRUE(items[2].IsNumber());
    EXPECT_EQ(items[3], Value(0));
}

TEST(ScriptEngine, HostObjectsAreOpaque) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "class Point { constructor() { this.x = 1; } }"
        "export function main() { return { when: new Date(0), point: new Point() }; }",
        "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    const auto* when = result.result.Find("when");
    ASSERT_TRUE(when->IsOpaque());
    EXPECT_EQ(when->AsOpaque().type_name, "Date");
    EXPECT_EQ(when->ToJson(), Json("1970-01-01T00:00:00.000Z"));
    const auto* point = result.result.Find("point");
    ASSERT_TRUE(point->IsOpaque());
    EXPECT_EQ(point->AsOpaque().type_name, "Point");
    EXPECT_EQ(point->ToJson(), Json::parse(R"({"x":1})"));
}

TEST(ScriptEngine, CircularResultIsAnError) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec("export function main() { const a = {}; a.self = a; return a; }", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kError);
    EXPECT_EQ(result.message, "Converting circular structure to JSON");
}

TEST(ScriptEngine, SharedReferencesAreNotCycles) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "export function main() { const shared = { v: 1 }; return [shared, shared]; }", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    EXPECT_EQ(result.result.ToJson().dump(), R"([{"v":1},{"v":1}])");
}

TEST(ScriptEngine, GlobalsDoNotLeakBetweenInvocations) {
    ScriptEngine engine;
    auto first = engine.Invoke(Spec("export function main() { globalThis.leak = 1; return 1; }", "main"));
    ASSERT_EQ(first.status, InvocationStatus::kSuccess);
    auto second = engine.Invoke(Spec("export function main() { return typeof globalThis.leak; }", "main"));
    ASSERT_EQ(second.status, InvocationStatus::kSuccess);
    EXPECT_EQ(second.result, Value("undefined"));
}

TEST(ScriptEngine, NeverSettlingPromiseIsAnError) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec("export function main() { return new Promise(() => {}); }", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kError);
    EXPECT_EQ(result.message, "Promise never settled");
}

TEST(ScriptEngine, CancelInterruptsRunningCode) {
    std::atomic<bool> cancel{false};
    EngineOptions options{};
    options.cancel = &cancel;
    ScriptEngine engine(options);

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.store(true);
    });
    const auto result = engine.Invoke(Spec("export function main() { while (true) {} }", "main"));
    canceller.join();
    EXPECT_EQ(result.status, InvocationStatus::kInterrupted);
    EXPECT_FALSE(result.reusable);
}

TEST(ScriptEngine, HeapLimitReportsOutOfMemory) {
    EngineOptions options{};
    options.memory_limit_bytes = 16 * 1024 * 1024;
    ScriptEngine engine(options);
    const auto result = engine.Invoke(Spec(
        "export function main() { const parts = []; while (true) { parts.push('x'.repeat(1 << 20) + parts.length); } }",
        "main"));
    EXPECT_EQ(result.status, InvocationStatus::kOutOfMemory);
}

TEST(ScriptEngine, LoadsFileModulesWithRelativeImports) {
    const auto dir = std::filesystem::temp_directory_path() / "runbox_engine_modules";
    std::filesystem::create_directories(dir);
    {
        std::ofstream dep(dir / "dep.js", std::ios::trunc);
        dep << "export const base = 40;\n";
        std::ofstream main(dir / "main.js", std::ios::trunc);
        main << "import { base } from './dep.js';\nexport function main() { return base + 2; }\n";
    }

    ScriptEngine engine;
    const auto result = engine.Invoke(Spec("file://" + (dir / "main.js").string(), "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    EXPECT_EQ(result.result, Value(42));
    std::filesystem::remove_all(dir);
}

TEST(ScriptEngine, UnloadableModuleIsAnError) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec("file:///nonexistent/runbox/main.js", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kError);
    EXPECT_NE(result.message.find("could not load module"), std::string::npos);
}

TEST(ScriptEngine, SetTimeoutResolvesAfterDelay) {
    ScriptEngine engine;
    const auto started = std::chrono::steady_clock::now();
    const auto result = engine.Invoke(Spec(
        "export async function main() { await new Promise(r => setTimeout(r, 100)); return 'slept'; }", "main"));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    EXPECT_EQ(result.result, Value("slept"));
    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_TRUE(result.reusable);
}

TEST(ScriptEngine, TimersFireInDueOrderWithArguments) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "export async function main() {"
        "  const order = [];"
        "  setTimeout(x => order.push(x), 20, 'b');"
        "  setTimeout(x => order.push(x), 0, 'a');"
        "  setTimeout(x => order.push(x), 20, 'c');"
        "  await new Promise(r => setTimeout(r, 50));"
        "  return order.join(','); }",
        "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    EXPECT_EQ(result.result, Value("a,b,c"));
}

TEST(ScriptEngine, ClearTimeoutCancelsCallback) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec(
        "export async function main() {"
        "  let fired = false;"
        "  const id = setTimeout(() => { fired = true; }, 10);"
        "  clearTimeout(id);"
        "  clearTimeout(undefined);"
        "  await new Promise(r => setTimeout(r, 30));"
        "  return fired; }",
        "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    EXPECT_EQ(result.result, Value(false));
    EXPECT_TRUE(result.reusable);
}

TEST(ScriptEngine, SetTimeoutRejectsNonFunction) {
    ScriptEngine engine;
    const auto result = engine.Invoke(Spec("export function main() { setTimeout('code', 10); }", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kError);
    EXPECT_EQ(result.message, "setTimeout: callback is not a function");
}

TEST(ScriptEngine, PendingTimersAreDroppedWithTheContext) {
    ScriptEngine engine;
    const auto started = std::chrono::steady_clock::now();
    const auto result = engine.Invoke(Spec(
        "export function main() { setTimeout(() => { globalThis.late = 1; }, 10000); return 1; }", "main"));
    ASSERT_EQ(result.status, InvocationStatus::kSuccess) << result.message;
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_FALSE(result.reusable);

    const auto next = engine.Invoke(Spec("export function main() { return typeof globalThis.late; }", "main"));
    EXPECT_EQ(next.result, Value("undefined"));
}

TEST(ScriptEngine, CancelInterruptsTimerWait) {
    std::atomic<bool> cancel{false};
    EngineOptions options{};
    options.cancel = &cancel;
    ScriptEngine engine(options);

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.store(true);
    });
    const auto started = std::chrono::steady_clock::now();
    const auto result = engine.Invoke(Spec(
        "export async function main() { await new Promise(r => setTimeout(r, 3000)); return 1; }", "main"));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();
    EXPECT_EQ(result.status, InvocationStatus::kInterrupted);
    EXPECT_LT(elapsed, std::chrono::seconds(1));
}

TEST(ScriptEngine, DeadlineBoundsModuleFetch) {
    runbox::testing::SlowScriptServer server;
    ScriptEngine engine;
    auto spec = Spec(server.url(), "main");
    spec.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);

    const auto started = std::chrono::steady_clock::now();
    const auto result = engine.Invoke(spec);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    server.Release();
    ASSERT_EQ(result.status, InvocationStatus::kError);
    EXPECT_NE(result.message.find("could not load module"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}
