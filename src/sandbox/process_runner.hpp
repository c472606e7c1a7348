#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <sys/types.h>

#include "sandbox/sandbox_handle.hpp"
#include "sandbox/worker_protocol.hpp"

namespace runbox::sandbox {

struct ProcessOptions {
    std::filesystem::path worker_path;
    int memory_mb = 128;
};

// Runs one request in a dedicated runbox-worker process. The child is
// spawned and waited for on the handle's own thread.
class ProcessSandbox : public SandboxHandle {
public:
    explicit ProcessSandbox(ProcessOptions options);
    ~ProcessSandbox() override;

    ProcessSandbox(const ProcessSandbox&) = delete;
    ProcessSandbox& operator=(const ProcessSandbox&) = delete;

    void Start(const ExecutionRequest& request, CompletionHandler completion) override;
    void Terminate() override;

private:
    void Run(std::string input, CompletionHandler completion);
    WorkerExit Spawn(const std::string& input);

    ProcessOptions options_;
    std::mutex mutex_;
    // Live, unreaped child; 0 otherwise.
    pid_t pid_ = 0;
    bool terminate_requested_ = false;
    std::thread thread_;
};

class ProcessRunner : public SandboxRunner {
public:
    explicit ProcessRunner(ProcessOptions options);

    std::unique_ptr<SandboxHandle> Acquire() override;
    void Release(std::unique_ptr<SandboxHandle> handle, ReleaseMode mode) override;

    const ProcessOptions& options() const { return options_; }

private:
    ProcessOptions options_;
};

// runbox-worker beside the running executable.
std::filesystem::path DefaultWorkerPath();

}  // namespace runbox::sandbox
