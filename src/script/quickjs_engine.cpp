#include "script/quickjs_engine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <new>
#include <stdexcept>
#include <thread>
#include <utility>

#include "script/log_bridge.hpp"
#include "script/script_source.hpp"
#include "utils/logging.hpp"

namespace runbox::script {
namespace {

constexpr const char* kExportsKey = "__runbox_exports__";
constexpr const char* kInlinePrefix = "runbox:inline/";
constexpr std::size_t kMaxResultDepth = 512;
constexpr int kMaxDrainedJobs = 100000;
constexpr double kMaxSafeInteger = 9007199254740991.0;
constexpr double kMaxTimerDelayMs = 2147483647.0;
constexpr auto kTimerPollInterval = std::chrono::milliseconds(10);
constexpr auto kMaxFetchTimeout = std::chrono::milliseconds(10000);
// Lets the caller's own deadline fire before a fetch cut short by it fails.
constexpr auto kFetchDeadlineGrace = std::chrono::milliseconds(100);

// A JavaScript exception is pending on the context.
struct PendingException {};

class ConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ScopedValue {
public:
    ScopedValue(JSContext* ctx, JSValue value) : ctx_(ctx), value_(value) {}
    ~ScopedValue() { JS_FreeValue(ctx_, value_); }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

    JSValue get() const { return value_; }
    bool IsException() const { return JS_IsException(value_); }

private:
    JSContext* ctx_;
    JSValue value_;
};

void ClearException(JSContext* ctx) {
    JSValue exception = JS_GetException(ctx);
    JS_FreeValue(ctx, exception);
}

std::string ToStdString(JSContext* ctx, JSValueConst value) {
    std::size_t length = 0;
    const char* text = JS_ToCStringLen(ctx, &length, value);
    if (!text) {
        ClearException(ctx);
        return {};
    }
    std::string out(text, length);
    JS_FreeCString(ctx, text);
    return out;
}

std::optional<std::string> StringProperty(JSContext* ctx, JSValueConst object, const char* name) {
    ScopedValue property(ctx, JS_GetPropertyStr(ctx, object, name));
    if (property.IsException()) {
        ClearException(ctx);
        return std::nullopt;
    }
    if (JS_IsUndefined(property.get()) || JS_IsNull(property.get())) {
        return std::nullopt;
    }
    return ToStdString(ctx, property.get());
}

class PropertyList {
public:
    explicit PropertyList(JSContext* ctx) : ctx_(ctx) {}
    ~PropertyList() {
        for (std::uint32_t i = 0; i < count_; ++i) {
            JS_FreeAtom(ctx_, properties_[i].atom);
        }
        if (properties_) {
            js_free(ctx_, properties_);
        }
    }

    PropertyList(const PropertyList&) = delete;
    PropertyList& operator=(const PropertyList&) = delete;

    JSPropertyEnum** out() { return &properties_; }
    std::uint32_t* out_count() { return &count_; }
    std::uint32_t size() const { return count_; }
    JSAtom atom(std::uint32_t index) const { return properties_[index].atom; }

private:
    JSContext* ctx_;
    JSPropertyEnum* properties_ = nullptr;
    std::uint32_t count_ = 0;
};

// Walks a settled JavaScript value into a Value tree with JSON.stringify
// semantics for plain data. Uint8Array (and subclasses) become Binary, plain
// objects become Mappings, any other object becomes Opaque.
class ResultConverter {
public:
    explicit ResultConverter(JSContext* ctx)
        : ctx_(ctx)
        , global_(ctx, JS_GetGlobalObject(ctx))
        , uint8_array_(ctx, JS_GetPropertyStr(ctx, global_.get(), "Uint8Array"))
        , object_(ctx, JS_GetPropertyStr(ctx, global_.get(), "Object"))
        , object_prototype_(ctx, JS_GetPropertyStr(ctx, object_.get(), "prototype"))
        , get_prototype_of_(ctx, JS_GetPropertyStr(ctx, object_.get(), "getPrototypeOf")) {
        if (uint8_array_.IsException() || object_.IsException() ||
            object_prototype_.IsException() || get_prototype_of_.IsException()) {
            throw PendingException{};
        }
    }

    Value ConvertRoot(JSValueConst value) {
        auto converted = Convert(value, 0);
        return converted ? std::move(*converted) : Value();
    }

private:
    JSContext* ctx_;
    ScopedValue global_;
    ScopedValue uint8_array_;
    ScopedValue object_;
    ScopedValue object_prototype_;
    ScopedValue get_prototype_of_;
    std::vector<void*> active_;

    std::optional<Value> Convert(JSValueConst value, std::size_t depth) {
        if (depth > kMaxResultDepth) {
            throw ConversionError("Result is nested too deeply");
        }
        if (JS_IsUndefined(value) || JS_IsSymbol(value) || JS_IsFunction(ctx_, value)) {
            return std::nullopt;
        }
        if (JS_IsNull(value)) {
            return Value();
        }
        if (JS_IsBool(value)) {
            return Value(JS_ToBool(ctx_, value) != 0);
        }
        if (JS_VALUE_GET_TAG(value) == JS_TAG_INT) {
            return Value(static_cast<std::int64_t>(JS_VALUE_GET_INT(value)));
        }
        if (JS_IsNumber(value)) {
            double number = 0;
            if (JS_ToFloat64(ctx_, &number, value) < 0) {
                throw PendingException{};
            }
            if (std::isfinite(number) && std::floor(number) == number && std::fabs(number) <= kMaxSafeInteger) {
                return Value(static_cast<std::int64_t>(number));
            }
            return Value(number);
        }
        if (JS_IsString(value)) {
            return Value(ToStdString(ctx_, value));
        }
        if (!JS_IsObject(value)) {
            // BigInt: carried as its decimal text.
            return Value(Opaque{"BigInt", std::make_shared<const Json>(ToStdString(ctx_, value))});
        }
        return ConvertObject(value, depth);
    }

    Value ConvertObject(JSValueConst value, std::size_t depth) {
        void* identity = JS_VALUE_GET_PTR(value);
        if (std::find(active_.begin(), active_.end(), identity) != active_.end()) {
            throw ConversionError("Converting circular structure to JSON");
        }

        const int is_uint8 = JS_IsInstanceOf(ctx_, value, uint8_array_.get());
        if (is_uint8 < 0) {
            throw PendingException{};
        }
        if (is_uint8 > 0) {
            return Value(CopyBytes(value));
        }

        active_.push_back(identity);
        struct Pop {
            std::vector<void*>& stack;
            ~Pop() { stack.pop_back(); }
        } pop{active_};

        const int is_array = JS_IsArray(ctx_, value);
        if (is_array < 0) {
            throw PendingException{};
        }
        if (is_array > 0) {
            return ConvertArray(value, depth);
        }
        if (IsPlainObject(value)) {
            return ConvertMapping(value, depth);
        }
        return ConvertOpaque(value);
    }

    Bytes CopyBytes(JSValueConst value) {
        std::size_t offset = 0;
        std::size_t length = 0;
        std::size_t element_size = 0;
        ScopedValue buffer(ctx_, JS_GetTypedArrayBuffer(ctx_, value, &offset, &length, &element_size));
        if (buffer.IsException()) {
            throw PendingException{};
        }
        std::size_t buffer_size = 0;
        const std::uint8_t* data = JS_GetArrayBuffer(ctx_, &buffer_size, buffer.get());
        if (!data) {
            if (length == 0) {
                return {};
            }
            throw PendingException{};
        }
        if (offset > buffer_size) {
            return {};
        }
        length = std::min(length, buffer_size - offset);
        return Bytes(data + offset, data + offset + length);
    }

    bool IsPlainObject(JSValueConst value) {
        JSValueConst args[] = {value};
        ScopedValue prototype(ctx_, JS_Call(ctx_, get_prototype_of_.get(), object_.get(), 1, args));
        if (prototype.IsException()) {
            throw PendingException{};
        }
        if (JS_IsNull(prototype.get())) {
            return true;
        }
        return JS_IsObject(prototype.get()) &&
               JS_VALUE_GET_PTR(prototype.get()) == JS_VALUE_GET_PTR(object_prototype_.get());
    }

    Value ConvertArray(JSValueConst value, std::size_t depth) {
        ScopedValue length_value(ctx_, JS_GetPropertyStr(ctx_, value, "length"));
        if (length_value.IsException()) {
            throw PendingException{};
        }
        std::uint32_t length = 0;
        if (JS_ToUint32(ctx_, &length, length_value.get()) < 0) {
            throw PendingException{};
        }
        Sequence items;
        items.reserve(length);
        for (std::uint32_t i = 0; i < length; ++i) {
            ScopedValue element(ctx_, JS_GetPropertyUint32(ctx_, value, i));
            if (element.IsException()) {
                throw PendingException{};
            }
            auto converted = Convert(element.get(), depth + 1);
            items.push_back(converted ? std::move(*converted) : Value());
        }
        return Value(std::move(items));
    }

    Value ConvertMapping(JSValueConst value, std::size_t depth) {
        PropertyList properties(ctx_);
        if (JS_GetOwnPropertyNames(ctx_, properties.out(), properties.out_count(), value,
                                   JS_GPN_STRING_MASK | JS_GPN_ENUM_ONLY) < 0) {
            throw PendingException{};
        }
        Mapping entries;
        entries.reserve(properties.size());
        for (std::uint32_t i = 0; i < properties.size(); ++i) {
            const char* key = JS_AtomToCString(ctx_, properties.atom(i));
            if (!key) {
                throw PendingException{};
            }
            std::string name(key);
            JS_FreeCString(ctx_, key);

            ScopedValue item(ctx_, JS_GetProperty(ctx_, value, properties.atom(i)));
            if (item.IsException()) {
                throw PendingException{};
            }
            auto converted = Convert(item.get(), depth + 1);
            if (converted) {
                entries.emplace_back(std::move(name), std::move(*converted));
            }
        }
        return Value(std::move(entries));
    }

    Value ConvertOpaque(JSValueConst value) {
        std::string type_name = "Object";
        {
            ScopedValue constructor(ctx_, JS_GetPropertyStr(ctx_, value, "constructor"));
            if (constructor.IsException()) {
                ClearException(ctx_);
            } else if (JS_IsObject(constructor.get())) {
                auto name = StringProperty(ctx_, constructor.get(), "name");
                if (name && !name->empty()) {
                    type_name = std::move(*name);
                }
            }
        }

        ScopedValue serialized(ctx_, JS_JSONStringify(ctx_, value, JS_UNDEFINED, JS_UNDEFINED));
        if (serialized.IsException()) {
            throw PendingException{};
        }
        Json snapshot(nullptr);
        if (JS_IsString(serialized.get())) {
            snapshot = Json::parse(ToStdString(ctx_, serialized.get()), nullptr, false);
            if (snapshot.is_discarded()) {
                snapshot = nullptr;
            }
        }
        return Value(Opaque{type_name, std::make_shared<const Json>(std::move(snapshot))});
    }
};

}  // namespace

ScriptEngine::ScriptEngine(EngineOptions options) : options_(options) {
    runtime_ = JS_NewRuntime();
    if (!runtime_) {
        throw std::runtime_error("Failed to create QuickJS runtime");
    }
    JS_SetRuntimeInfo(runtime_, "runbox");
    JS_SetMaxStackSize(runtime_, options_.max_stack_bytes);
    if (options_.memory_limit_bytes > 0) {
        JS_SetMemoryLimit(runtime_, options_.memory_limit_bytes);
    }
    JS_SetRuntimeOpaque(runtime_, this);
    JS_SetInterruptHandler(runtime_, &ScriptEngine::InterruptHandler, this);
    JS_SetModuleLoaderFunc(runtime_, nullptr, &ScriptEngine::LoadModule, this);
}

ScriptEngine::~ScriptEngine() {
    ClearTimers();
    // Queued jobs keep their contexts alive; run them out before the
    // runtime goes away. A cancelled engine interrupts each job at once.
    for (int drained = 0; drained < kMaxDrainedJobs; ++drained) {
        JSContext* job_ctx = nullptr;
        const int status = JS_ExecutePendingJob(runtime_, &job_ctx);
        if (status == 0) {
            break;
        }
        if (status < 0 && job_ctx) {
            ClearException(job_ctx);
        }
    }
    JS_FreeRuntime(runtime_);
}

bool ScriptEngine::Cancelled() const {
    return options_.cancel && options_.cancel->load(std::memory_order_relaxed);
}

InvocationResult ScriptEngine::Invoke(const InvocationSpec& spec) {
    InvocationResult result{};
    deadline_ = spec.deadline;
    JSContext* ctx = JS_NewContext(runtime_);
    if (!ctx) {
        result.message = "Failed to create script context";
        return result;
    }

    {
        LogCapture capture;
        ConsoleBridge bridge(ctx);
        {
            ConsoleBridge::Scope scope(bridge, capture);
            try {
                RunInContext(ctx, spec, result);
            } catch (const std::exception& ex) {
                result.status = InvocationStatus::kError;
                result.message = ex.what();
                result.stack.reset();
            }
        }
        result.logs = capture.Take();
    }
    const auto dropped_timers = ClearTimers();
    inline_sources_.clear();
    deadline_.reset();
    JS_FreeContext(ctx);

    if (result.status != InvocationStatus::kSuccess && Cancelled()) {
        result.status = InvocationStatus::kInterrupted;
        result.message = "Execution interrupted";
    }
    result.reusable = result.status == InvocationStatus::kSuccess && dropped_timers == 0 &&
                      !JS_IsJobPending(runtime_);
    return result;
}

void ScriptEngine::RunInContext(JSContext* ctx, const InvocationSpec& spec, InvocationResult& result) {
    InstallTimers(ctx);

    std::string module_name;
    if (IsUrlReference(spec.script)) {
        module_name = spec.script;
    } else {
        module_name = kInlinePrefix + std::to_string(++module_counter_);
        inline_sources_[module_name] = spec.script;
    }

    const std::string driver = "import * as ns from " + Json(module_name).dump() + ";\n"
                               "globalThis." + kExportsKey + " = ns;\n";
    JSValue evaluated = JS_Eval(ctx, driver.c_str(), driver.size(), "<runbox>", JS_EVAL_TYPE_MODULE);
    if (JS_IsException(evaluated)) {
        FailFromException(ctx, JS_GetException(ctx), result);
        return;
    }
    JSValue loaded = JS_UNDEFINED;
    if (!Settle(ctx, evaluated, loaded)) {
        FailFromException(ctx, loaded, result);
        return;
    }
    JS_FreeValue(ctx, loaded);

    ScopedValue global(ctx, JS_GetGlobalObject(ctx));
    ScopedValue exports(ctx, JS_GetPropertyStr(ctx, global.get(), kExportsKey));
    if (exports.IsException() || !JS_IsObject(exports.get())) {
        result.status = InvocationStatus::kError;
        result.message = "Module did not load";
        return;
    }
    ScopedValue function(ctx, JS_GetPropertyStr(ctx, exports.get(), spec.function_name.c_str()));
    if (function.IsException()) {
        FailFromException(ctx, JS_GetException(ctx), result);
        return;
    }
    if (!JS_IsFunction(ctx, function.get())) {
        result.status = InvocationStatus::kError;
        result.message = spec.missing_function_message;
        result.stack = "Error: " + spec.missing_function_message;
        return;
    }

    const std::string payload_text = spec.payload.dump();
    ScopedValue payload(ctx, JS_ParseJSON(ctx, payload_text.c_str(), payload_text.size(), "<payload>"));
    if (payload.IsException()) {
        FailFromException(ctx, JS_GetException(ctx), result);
        return;
    }

    JSValueConst args[] = {payload.get()};
    JSValue returned = JS_Call(ctx, function.get(), JS_UNDEFINED, 1, args);
    if (JS_IsException(returned)) {
        FailFromException(ctx, JS_GetException(ctx), result);
        return;
    }
    JSValue value = JS_UNDEFINED;
    if (!Settle(ctx, returned, value)) {
        FailFromException(ctx, value, result);
        return;
    }
    ScopedValue settled(ctx, value);

    try {
        ResultConverter converter(ctx);
        result.result = converter.ConvertRoot(settled.get());
        result.status = InvocationStatus::kSuccess;
    } catch (const PendingException&) {
        FailFromException(ctx, JS_GetException(ctx), result);
    } catch (const ConversionError& ex) {
        result.status = InvocationStatus::kError;
        result.message = ex.what();
        result.stack = std::string("TypeError: ") + ex.what();
    }
}

bool ScriptEngine::Settle(JSContext* ctx, JSValue value, JSValue& settled) {
    ScopedValue input(ctx, value);
    Settlement settlement{};
    settlement.id = ++settle_counter_;
    settlement_ = &settlement;
    struct Reset {
        Settlement*& slot;
        ~Reset() { slot = nullptr; }
    } reset{settlement_};

    ScopedValue global(ctx, JS_GetGlobalObject(ctx));
    ScopedValue promise_ctor(ctx, JS_GetPropertyStr(ctx, global.get(), "Promise"));
    ScopedValue resolve(ctx, JS_GetPropertyStr(ctx, promise_ctor.get(), "resolve"));
    JSValueConst resolve_args[] = {input.get()};
    ScopedValue promise(ctx, JS_Call(ctx, resolve.get(), promise_ctor.get(), 1, resolve_args));
    if (promise.IsException()) {
        settled = JS_GetException(ctx);
        return false;
    }

    ScopedValue then(ctx, JS_GetPropertyStr(ctx, promise.get(), "then"));
    JSValue id = JS_NewInt32(ctx, settlement.id);
    ScopedValue on_fulfilled(ctx, JS_NewCFunctionData(ctx, &ScriptEngine::SettleCallback, 1, 1, 1, &id));
    ScopedValue on_rejected(ctx, JS_NewCFunctionData(ctx, &ScriptEngine::SettleCallback, 1, 0, 1, &id));
    JSValueConst then_args[] = {on_fulfilled.get(), on_rejected.get()};
    ScopedValue chained(ctx, JS_Call(ctx, then.get(), promise.get(), 2, then_args));
    if (chained.IsException()) {
        settled = JS_GetException(ctx);
        return false;
    }

    // Microtasks first; timers only once the job queue is empty.
    while (!settlement.settled) {
        JSContext* job_ctx = nullptr;
        const int status = JS_ExecutePendingJob(runtime_, &job_ctx);
        if (status < 0) {
            settled = JS_GetException(job_ctx ? job_ctx : ctx);
            return false;
        }
        if (status > 0) {
            continue;
        }
        const int timer = RunNextTimer(ctx);
        if (timer < 0) {
            settled = JS_GetException(ctx);
            return false;
        }
        if (timer == 0) {
            break;
        }
    }
    if (!settlement.settled) {
        JS_ThrowTypeError(ctx, "Promise never settled");
        settled = JS_GetException(ctx);
        return false;
    }
    settled = settlement.value;
    return settlement.fulfilled;
}

void ScriptEngine::OnSettled(JSContext* ctx, std::int32_t id, bool fulfilled, JSValueConst value) {
    if (!settlement_ || settlement_->id != id || settlement_->settled) {
        return;
    }
    settlement_->settled = true;
    settlement_->fulfilled = fulfilled;
    settlement_->value = JS_DupValue(ctx, value);
}

void ScriptEngine::FailFromException(JSContext* ctx, JSValue exception, InvocationResult& result) {
    ScopedValue error(ctx, exception);
    result.status = InvocationStatus::kError;
    result.stack.reset();
    result.code.reset();

    if (JS_IsError(ctx, error.get())) {
        const auto name = StringProperty(ctx, error.get(), "name").value_or("Error");
        result.message = StringProperty(ctx, error.get(), "message").value_or("");
        std::string stack = result.message.empty() ? name : name + ": " + result.message;
        auto frames = StringProperty(ctx, error.get(), "stack").value_or("");
        while (!frames.empty() && frames.back() == '\n') {
            frames.pop_back();
        }
        if (!frames.empty()) {
            stack += "\n" + frames;
        }
        result.stack = std::move(stack);
        if (name == "InternalError" && result.message == "out of memory") {
            result.status = InvocationStatus::kOutOfMemory;
        }
    } else {
        result.message = ToStdString(ctx, error.get());
    }
    if (JS_IsObject(error.get())) {
        result.code = StringProperty(ctx, error.get(), "code");
    }
    if (Cancelled()) {
        result.status = InvocationStatus::kInterrupted;
    }
}

void ScriptEngine::InstallTimers(JSContext* ctx) {
    ScopedValue global(ctx, JS_GetGlobalObject(ctx));
    if (JS_SetPropertyStr(ctx, global.get(), "setTimeout",
                          JS_NewCFunction(ctx, &ScriptEngine::SetTimeout, "setTimeout", 2)) < 0 ||
        JS_SetPropertyStr(ctx, global.get(), "clearTimeout",
                          JS_NewCFunction(ctx, &ScriptEngine::ClearTimeout, "clearTimeout", 1)) < 0) {
        ClearException(ctx);
        throw std::runtime_error("Failed to install timers");
    }
}

int ScriptEngine::RunNextTimer(JSContext* ctx) {
    if (timers_.empty()) {
        return 0;
    }
    auto next = std::min_element(timers_.begin(), timers_.end(), [](const Timer& a, const Timer& b) {
        return a.due < b.due;
    });
    const auto due = next->due;
    while (true) {
        if (Cancelled()) {
            JS_ThrowInternalError(ctx, "interrupted");
            return -1;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= due) {
            break;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(due - now, kTimerPollInterval));
    }

    Timer timer = std::move(*next);
    timers_.erase(next);
    JSValue returned = JS_Call(ctx, timer.callback, JS_UNDEFINED,
                               static_cast<int>(timer.args.size()), timer.args.data());
    JS_FreeValue(ctx, timer.callback);
    for (auto& arg : timer.args) {
        JS_FreeValue(ctx, arg);
    }
    if (JS_IsException(returned)) {
        return -1;
    }
    JS_FreeValue(ctx, returned);
    return 1;
}

std::size_t ScriptEngine::ClearTimers() {
    const auto dropped = timers_.size();
    for (auto& timer : timers_) {
        JS_FreeValueRT(runtime_, timer.callback);
        for (auto& arg : timer.args) {
            JS_FreeValueRT(runtime_, arg);
        }
    }
    timers_.clear();
    return dropped;
}

std::chrono::milliseconds ScriptEngine::FetchTimeout() const {
    if (!deadline_) {
        return kMaxFetchTimeout;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline_ - std::chrono::steady_clock::now());
    return std::clamp(remaining + kFetchDeadlineGrace, std::chrono::milliseconds(1), kMaxFetchTimeout);
}

int ScriptEngine::InterruptHandler(JSRuntime*, void* opaque) {
    return static_cast<ScriptEngine*>(opaque)->Cancelled() ? 1 : 0;
}

JSModuleDef* ScriptEngine::LoadModule(JSContext* ctx, const char* module_name, void* opaque) {
    auto* engine = static_cast<ScriptEngine*>(opaque);
    std::string source;
    try {
        const auto it = engine->inline_sources_.find(module_name);
        if (it != engine->inline_sources_.end()) {
            source = it->second;
        } else if (IsUrlReference(module_name)) {
            source = FetchScript(module_name, engine->FetchTimeout());
        } else {
            JS_ThrowReferenceError(ctx, "could not load module '%s'", module_name);
            return nullptr;
        }
    } catch (const std::exception& ex) {
        utils::LogDebug("script", std::string("module load failed: ") + ex.what());
        JS_ThrowReferenceError(ctx, "could not load module '%s': %s", module_name, ex.what());
        return nullptr;
    }
    if (engine->Cancelled()) {
        JS_ThrowInternalError(ctx, "interrupted");
        return nullptr;
    }

    JSValue compiled = JS_Eval(ctx, source.c_str(), source.size(), module_name,
                               JS_EVAL_TYPE_MODULE | JS_EVAL_FLAG_COMPILE_ONLY);
    if (JS_IsException(compiled)) {
        return nullptr;
    }
    // The module stays referenced by the context's module list.
    auto* module = static_cast<JSModuleDef*>(JS_VALUE_GET_PTR(compiled));
    JS_FreeValue(ctx, compiled);
    return module;
}

JSValue ScriptEngine::SetTimeout(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* engine = static_cast<ScriptEngine*>(JS_GetRuntimeOpaque(JS_GetRuntime(ctx)));
    if (argc < 1 || !JS_IsFunction(ctx, argv[0])) {
        return JS_ThrowTypeError(ctx, "setTimeout: callback is not a function");
    }
    double delay = 0;
    if (argc > 1 && JS_ToFloat64(ctx, &delay, argv[1]) < 0) {
        return JS_EXCEPTION;
    }
    if (!std::isfinite(delay) || delay < 0) {
        delay = 0;
    }
    delay = std::min(delay, kMaxTimerDelayMs);

    Timer timer{};
    timer.id = ++engine->timer_counter_;
    timer.due = std::chrono::steady_clock::now() + std::chrono::milliseconds(static_cast<std::int64_t>(delay));
    timer.callback = JS_DupValue(ctx, argv[0]);
    const auto id = timer.id;
    try {
        for (int i = 2; i < argc; ++i) {
            timer.args.push_back(JS_DupValue(ctx, argv[i]));
        }
        engine->timers_.push_back(std::move(timer));
    } catch (const std::bad_alloc&) {
        JS_FreeValue(ctx, timer.callback);
        for (auto& arg : timer.args) {
            JS_FreeValue(ctx, arg);
        }
        return JS_ThrowOutOfMemory(ctx);
    }
    return JS_NewInt32(ctx, id);
}

JSValue ScriptEngine::ClearTimeout(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* engine = static_cast<ScriptEngine*>(JS_GetRuntimeOpaque(JS_GetRuntime(ctx)));
    if (argc < 1 || !JS_IsNumber(argv[0])) {
        return JS_UNDEFINED;
    }
    std::int32_t id = 0;
    if (JS_ToInt32(ctx, &id, argv[0]) < 0) {
        return JS_EXCEPTION;
    }
    auto& timers = engine->timers_;
    const auto it = std::find_if(timers.begin(), timers.end(), [id](const Timer& timer) {
        return timer.id == id;
    });
    if (it != timers.end()) {
        JS_FreeValue(ctx, it->callback);
        for (auto& arg : it->args) {
            JS_FreeValue(ctx, arg);
        }
        timers.erase(it);
    }
    return JS_UNDEFINED;
}

JSValue ScriptEngine::SettleCallback(JSContext* ctx, JSValueConst, int argc,
                                     JSValueConst* argv, int magic, JSValue* func_data) {
    auto* engine = static_cast<ScriptEngine*>(JS_GetRuntimeOpaque(JS_GetRuntime(ctx)));
    std::int32_t id = 0;
    if (JS_ToInt32(ctx, &id, func_data[0]) < 0) {
        return JS_EXCEPTION;
    }
    if (engine) {
        engine->OnSettled(ctx, id, magic == 1, argc > 0 ? argv[0] : JS_UNDEFINED);
    }
    return JS_UNDEFINED;
}

}  // namespace runbox::script
