#include "script/log_bridge.hpp"

#include <string>
#include <utility>
#include <vector>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::script {
namespace {

// Same rendering as Array.prototype.join(" "): null and undefined become
// empty strings, everything else goes through String().
JSValue ConsoleCall(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    auto* bridge = static_cast<ConsoleBridge*>(JS_GetContextOpaque(ctx));
    std::vector<std::string> parts;
    parts.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        if (JS_IsNull(argv[i]) || JS_IsUndefined(argv[i])) {
            parts.emplace_back();
            continue;
        }
        std::size_t length = 0;
        const char* text = JS_ToCStringLen(ctx, &length, argv[i]);
        if (!text) {
            return JS_EXCEPTION;
        }
        parts.emplace_back(text, length);
        JS_FreeCString(ctx, text);
    }
    if (bridge) {
        try {
            bridge->Emit(static_cast<ConsoleLevel>(magic), utils::Join(parts, " "));
        } catch (const std::exception& ex) {
            return JS_ThrowInternalError(ctx, "console: %s", ex.what());
        }
    }
    return JS_UNDEFINED;
}

}  // namespace

void LogCapture::Append(ConsoleLevel level, std::string message) {
    LogEntry entry{};
    entry.timestamp_ms = utils::NowMs();
    entry.level = level;
    entry.message = std::move(message);
    entries_.push_back(std::move(entry));
}

std::vector<LogEntry> LogCapture::Take() {
    std::vector<LogEntry> taken;
    taken.swap(entries_);
    return taken;
}

ConsoleBridge::ConsoleBridge(JSContext* ctx) : ctx_(ctx) {
    JS_SetContextOpaque(ctx_, this);

    JSValue console = JS_NewObject(ctx_);
    const std::pair<const char*, ConsoleLevel> kMethods[] = {
        {"log", ConsoleLevel::kLog},
        {"info", ConsoleLevel::kInfo},
        {"warn", ConsoleLevel::kWarn},
        {"error", ConsoleLevel::kError},
    };
    for (const auto& [name, level] : kMethods) {
        JS_SetPropertyStr(ctx_, console, name,
                          JS_NewCFunctionMagic(ctx_, &ConsoleCall, name, 1,
                                               JS_CFUNC_generic_magic, static_cast<int>(level)));
    }

    JSValue global = JS_GetGlobalObject(ctx_);
    JS_SetPropertyStr(ctx_, global, "console", console);
    JS_FreeValue(ctx_, global);
}

ConsoleBridge::~ConsoleBridge() {
    if (JS_GetContextOpaque(ctx_) == this) {
        JS_SetContextOpaque(ctx_, nullptr);
    }
}

void ConsoleBridge::Emit(ConsoleLevel level, std::string message) {
    if (sink_) {
        sink_->Append(level, std::move(message));
        return;
    }
    utils::LogDebug("sandbox", std::string("console.") + ToString(level) + " " + message);
}

ConsoleBridge::Scope::Scope(ConsoleBridge& bridge, LogCapture& capture)
    : bridge_(bridge), previous_(bridge.sink_) {
    bridge_.sink_ = &capture;
}

ConsoleBridge::Scope::~Scope() {
    bridge_.sink_ = previous_;
}

}  // namespace runbox::script
