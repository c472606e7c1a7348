#pragma once

#include <functional>
#include <memory>
#include <stdexcept>

#include "core/types.hpp"

namespace runbox::sandbox {

class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ReleaseMode {
    kReuse,
    kDestroy
};

using CompletionHandler = std::function<void(ExecutionOutcome)>;

// One live execution environment bound to a single request.
class SandboxHandle {
public:
    virtual ~SandboxHandle() = default;

    // Begins the execution. The completion is invoked exactly once, from a
    // thread owned by the handle, also after Terminate(). Throws SandboxError
    // when the execution cannot be started.
    virtual void Start(const ExecutionRequest& request, CompletionHandler completion) = 0;

    // Forcibly stops the execution. Safe to call at any time, more than once.
    virtual void Terminate() = 0;
};

class SandboxRunner {
public:
    virtual ~SandboxRunner() = default;

    // Throws SandboxError.
    virtual std::unique_ptr<SandboxHandle> Acquire() = 0;

    virtual void Release(std::unique_ptr<SandboxHandle> handle, ReleaseMode mode) = 0;
};

}  // namespace runbox::sandbox
