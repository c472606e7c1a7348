#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <quickjs.h>

#include "core/types.hpp"

namespace runbox::script {

struct EngineOptions {
    // 0 leaves the heap unbounded.
    std::size_t memory_limit_bytes = 0;
    std::size_t max_stack_bytes = 1024 * 1024;
    // Polled by the interrupt handler; once set, running code is aborted.
    const std::atomic<bool>* cancel = nullptr;
};

struct InvocationSpec {
    std::string script;
    std::string function_name;
    Json payload = Json::object();
    // Message of the error raised when the export is missing or not callable.
    std::string missing_function_message;
    // Bounds blocking host work such as URL module fetches.
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

enum class InvocationStatus {
    kSuccess,
    kError,
    kInterrupted,
    kOutOfMemory
};

struct InvocationResult {
    InvocationStatus status = InvocationStatus::kError;
    Value result;
    std::string message;
    std::optional<std::string> stack;
    std::optional<std::string> code;
    std::vector<LogEntry> logs;
    // False when the runtime is left with queued jobs or in an unknown state.
    bool reusable = false;
};

// One QuickJS runtime. Every Invoke runs in a fresh context, so globals and
// loaded modules never outlive the call. Not thread-safe: a ScriptEngine
// must be created, used and destroyed on the same thread.
class ScriptEngine {
public:
    explicit ScriptEngine(EngineOptions options = {});
    ~ScriptEngine();

    ScriptEngine(const ScriptEngine&) = delete;
    ScriptEngine& operator=(const ScriptEngine&) = delete;

    InvocationResult Invoke(const InvocationSpec& spec);

    bool Cancelled() const;

private:
    struct Timer {
        std::int32_t id = 0;
        std::chrono::steady_clock::time_point due;
        JSValue callback = JS_UNDEFINED;
        std::vector<JSValue> args;
    };

    struct Settlement {
        std::int32_t id = 0;
        bool settled = false;
        bool fulfilled = false;
        JSValue value = JS_UNDEFINED;
    };

    JSRuntime* runtime_ = nullptr;
    EngineOptions options_;
    std::uint64_t module_counter_ = 0;
    std::int32_t settle_counter_ = 0;
    Settlement* settlement_ = nullptr;
    std::unordered_map<std::string, std::string> inline_sources_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    // Pending setTimeout callbacks of the current context, in creation order.
    std::vector<Timer> timers_;
    std::int32_t timer_counter_ = 0;

    void RunInContext(JSContext* ctx, const InvocationSpec& spec, InvocationResult& result);
    // Takes ownership of value; waits for it if it is a thenable.
    bool Settle(JSContext* ctx, JSValue value, JSValue& settled);
    void OnSettled(JSContext* ctx, std::int32_t id, bool fulfilled, JSValueConst value);
    void FailFromException(JSContext* ctx, JSValue exception, InvocationResult& result);
    void InstallTimers(JSContext* ctx);
    // 1 when a timer ran, 0 when none is pending, -1 with an exception pending.
    int RunNextTimer(JSContext* ctx);
    // Returns the number of timers dropped.
    std::size_t ClearTimers();
    std::chrono::milliseconds FetchTimeout() const;

    static int InterruptHandler(JSRuntime* rt, void* opaque);
    static JSModuleDef* LoadModule(JSContext* ctx, const char* module_name, void* opaque);
    static JSValue SetTimeout(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv);
    static JSValue ClearTimeout(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv);
    static JSValue SettleCallback(JSContext* ctx, JSValueConst this_val, int argc,
                                  JSValueConst* argv, int magic, JSValue* func_data);
};

}  // namespace runbox::script
