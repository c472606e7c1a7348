#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "sandbox/sandbox_handle.hpp"
#include "script/quickjs_engine.hpp"

namespace runbox::sandbox {

struct PoolOptions {
    // Pooled entries; 0 disables reuse entirely.
    std::size_t size = 5;
    std::uint32_t recycle_after = 100;
    std::size_t memory_mb = 128;
};

// A thread owning one ScriptEngine. Jobs run one at a time, in order.
class IsolateWorker {
public:
    using Job = std::function<void(script::ScriptEngine*)>;

    explicit IsolateWorker(std::size_t memory_limit_bytes);
    // Cancels the running job and joins the thread. Queued jobs still run,
    // interrupted.
    ~IsolateWorker();

    IsolateWorker(const IsolateWorker&) = delete;
    IsolateWorker& operator=(const IsolateWorker&) = delete;

    // Clears any earlier cancellation.
    void Post(Job job);
    void Cancel();

private:
    void Loop();

    std::size_t memory_limit_bytes_;
    std::atomic<bool> cancel_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool stopping_ = false;
    std::thread thread_;
};

// Destroys retired workers on its own thread. A worker stuck in host code
// that does not poll for cancellation only holds up the reaper.
class IsolateReaper {
public:
    IsolateReaper();
    // Destroys everything still queued.
    ~IsolateReaper();

    IsolateReaper(const IsolateReaper&) = delete;
    IsolateReaper& operator=(const IsolateReaper&) = delete;

    // Cancels the worker's current job and queues it. Never blocks on it.
    void Retire(std::unique_ptr<IsolateWorker> worker);
    std::size_t pending() const;

private:
    void Loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<IsolateWorker>> retired_;
    // Retired but not destroyed yet, including the one being destroyed.
    std::size_t pending_ = 0;
    bool stopping_ = false;
    std::thread thread_;
};

class IsolatePool;

// Lease on a pooled entry, or sole owner of a temporary worker. Destroying
// a lease that was not released for reuse retires the entry.
class IsolateHandle : public SandboxHandle {
public:
    IsolateHandle(IsolatePool* pool, std::uint64_t entry_id, IsolateWorker* worker);
    IsolateHandle(IsolatePool* pool, std::unique_ptr<IsolateWorker> temporary);
    ~IsolateHandle() override;

    IsolateHandle(const IsolateHandle&) = delete;
    IsolateHandle& operator=(const IsolateHandle&) = delete;

    void Start(const ExecutionRequest& request, CompletionHandler completion) override;
    void Terminate() override;

    bool temporary() const { return owned_ != nullptr; }
    void set_release_mode(ReleaseMode mode) { release_mode_ = mode; }

private:
    IsolatePool* pool_ = nullptr;
    std::uint64_t entry_id_ = 0;
    std::unique_ptr<IsolateWorker> owned_;
    IsolateWorker* worker_ = nullptr;
    ReleaseMode release_mode_ = ReleaseMode::kDestroy;
    // Written by the worker thread once the invocation finishes.
    std::shared_ptr<std::atomic<bool>> reusable_;
    bool started_ = false;
};

// Bounded set of reusable isolate workers. Entries past the recycle
// threshold, or that saw an error or timeout, are retired on release.
// Every lease must be gone before the pool is destroyed.
class IsolatePool : public SandboxRunner {
public:
    explicit IsolatePool(PoolOptions options = {});
    ~IsolatePool() override;

    std::unique_ptr<SandboxHandle> Acquire() override;
    void Release(std::unique_ptr<SandboxHandle> handle, ReleaseMode mode) override;

    std::size_t size() const;
    std::size_t busy() const;
    // Discarded workers whose threads have not finished yet.
    std::size_t retiring() const { return reaper_.pending(); }
    const PoolOptions& options() const { return options_; }

private:
    friend class IsolateHandle;

    struct Entry {
        std::uint64_t id = 0;
        std::unique_ptr<IsolateWorker> worker;
        bool busy = false;
        std::uint32_t request_count = 0;
    };

    void Return(std::uint64_t entry_id, bool reuse);
    void Retire(std::unique_ptr<IsolateWorker> worker);
    std::size_t MemoryLimitBytes() const;

    PoolOptions options_;
    mutable std::mutex mutex_;
    std::list<Entry> entries_;
    std::uint64_t next_id_ = 0;
    IsolateReaper reaper_;
};

}  // namespace runbox::sandbox
