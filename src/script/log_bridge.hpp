#pragma once

#include <string>
#include <vector>

#include <quickjs.h>

#include "core/types.hpp"

namespace runbox::script {

// Ordered console output of one invocation.
class LogCapture {
public:
    void Append(ConsoleLevel level, std::string message);
    const std::vector<LogEntry>& entries() const { return entries_; }
    std::vector<LogEntry> Take();

private:
    std::vector<LogEntry> entries_;
};

// Installs console.log/info/warn/error into a QuickJS context. Calls are
// routed to the sink of the innermost live Scope; with no scope they only
// reach the debug log. Owns the context opaque slot while alive.
class ConsoleBridge {
public:
    explicit ConsoleBridge(JSContext* ctx);
    ~ConsoleBridge();

    ConsoleBridge(const ConsoleBridge&) = delete;
    ConsoleBridge& operator=(const ConsoleBridge&) = delete;

    class Scope {
    public:
        Scope(ConsoleBridge& bridge, LogCapture& capture);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ConsoleBridge& bridge_;
        LogCapture* previous_;
    };

    void Emit(ConsoleLevel level, std::string message);

private:
    JSContext* ctx_;
    LogCapture* sink_ = nullptr;
};

}  // namespace runbox::script
