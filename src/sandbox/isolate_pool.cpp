#include "sandbox/isolate_pool.hpp"

#include <chrono>
#include <system_error>
#include <utility>

#include "encoding/result_normalizer.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace {

ExecutionOutcome ToOutcome(script::InvocationResult result) {
    switch (result.status) {
        case script::InvocationStatus::kSuccess: {
            ExecutionSuccess success{};
            success.result = encoding::NormalizeResult(std::move(result.result));
            success.logs = std::move(result.logs);
            return success;
        }
        case script::InvocationStatus::kOutOfMemory: {
            auto failure = MakeFailure(FailureKind::kMemoryError, "Memory limit exceeded",
                                       std::move(result.stack), std::string("MEMORY_ERROR"));
            failure.logs = std::move(result.logs);
            return failure;
        }
        case script::InvocationStatus::kInterrupted: {
            auto failure = MakeFailure(FailureKind::kTimeout, "Execution timeout",
                                       std::nullopt, std::string("TIMEOUT_ERROR"));
            failure.logs = std::move(result.logs);
            return failure;
        }
        case script::InvocationStatus::kError:
            break;
    }
    auto failure = MakeFailure(FailureKind::kRuntimeError, std::move(result.message),
                               std::move(result.stack), std::move(result.code));
    failure.logs = std::move(result.logs);
    return failure;
}

}  // namespace

IsolateWorker::IsolateWorker(std::size_t memory_limit_bytes)
    : memory_limit_bytes_(memory_limit_bytes) {
    thread_ = std::thread(&IsolateWorker::Loop, this);
}

IsolateWorker::~IsolateWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cancel_.store(true);
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void IsolateWorker::Post(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_.store(false);
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void IsolateWorker::Cancel() {
    cancel_.store(true);
}

void IsolateWorker::Loop() {
    std::unique_ptr<script::ScriptEngine> engine;
    try {
        script::EngineOptions options{};
        options.memory_limit_bytes = memory_limit_bytes_;
        options.cancel = &cancel_;
        engine = std::make_unique<script::ScriptEngine>(options);
    } catch (const std::exception& ex) {
        utils::LogError("pool", std::string("failed to create isolate: ") + ex.what());
    }

    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job(engine.get());
    }
}

IsolateReaper::IsolateReaper() {
    thread_ = std::thread(&IsolateReaper::Loop, this);
}

IsolateReaper::~IsolateReaper() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void IsolateReaper::Retire(std::unique_ptr<IsolateWorker> worker) {
    if (!worker) {
        return;
    }
    worker->Cancel();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired_.push_back(std::move(worker));
        ++pending_;
    }
    cv_.notify_one();
}

std::size_t IsolateReaper::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

void IsolateReaper::Loop() {
    while (true) {
        std::unique_ptr<IsolateWorker> worker;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !retired_.empty(); });
            if (retired_.empty()) {
                break;
            }
            worker = std::move(retired_.front());
            retired_.pop_front();
        }
        worker.reset();
        std::lock_guard<std::mutex> lock(mutex_);
        --pending_;
    }
}

IsolateHandle::IsolateHandle(IsolatePool* pool, std::uint64_t entry_id, IsolateWorker* worker)
    : pool_(pool)
    , entry_id_(entry_id)
    , worker_(worker)
    , reusable_(std::make_shared<std::atomic<bool>>(false)) {}

IsolateHandle::IsolateHandle(IsolatePool* pool, std::unique_ptr<IsolateWorker> temporary)
    : pool_(pool)
    , owned_(std::move(temporary))
    , worker_(owned_.get())
    , reusable_(std::make_shared<std::atomic<bool>>(false)) {}

IsolateHandle::~IsolateHandle() {
    if (owned_) {
        pool_->Retire(std::move(owned_));
        return;
    }
    const bool reuse = release_mode_ == ReleaseMode::kReuse && reusable_->load();
    pool_->Return(entry_id_, reuse);
}

void IsolateHandle::Start(const ExecutionRequest& request, CompletionHandler completion) {
    if (started_) {
        throw SandboxError("isolate lease already started");
    }
    started_ = true;

    script::InvocationSpec spec{};
    spec.script = request.script;
    spec.function_name = request.function_name;
    spec.payload = request.payload;
    spec.missing_function_message = "Code must export function " + request.function_name;
    if (request.timeout_ms) {
        spec.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(*request.timeout_ms);
    }

    auto reusable = reusable_;
    worker_->Post([spec = std::move(spec), completion = std::move(completion), reusable](
                      script::ScriptEngine* engine) {
        if (!engine) {
            completion(MakeFailure(FailureKind::kProcessError, "Isolate unavailable"));
            return;
        }
        ExecutionOutcome outcome;
        try {
            auto result = engine->Invoke(spec);
            reusable->store(result.reusable);
            outcome = ToOutcome(std::move(result));
        } catch (const std::exception& ex) {
            outcome = MakeFailure(FailureKind::kUnknown, ex.what());
        }
        completion(std::move(outcome));
    });
}

void IsolateHandle::Terminate() {
    worker_->Cancel();
}

IsolatePool::IsolatePool(PoolOptions options) : options_(options) {}

IsolatePool::~IsolatePool() {
    std::list<Entry> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        doomed.swap(entries_);
    }
}

std::size_t IsolatePool::MemoryLimitBytes() const {
    return options_.memory_mb * 1024 * 1024;
}

std::unique_ptr<SandboxHandle> IsolatePool::Acquire() {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& entry : entries_) {
                if (!entry.busy) {
                    entry.busy = true;
                    ++entry.request_count;
                    return std::make_unique<IsolateHandle>(this, entry.id, entry.worker.get());
                }
            }
            if (entries_.size() < options_.size) {
                Entry entry{};
                entry.id = ++next_id_;
                entry.worker = std::make_unique<IsolateWorker>(MemoryLimitBytes());
                entry.busy = true;
                entry.request_count = 1;
                entries_.push_back(std::move(entry));
                utils::LogDebug("pool", "created isolate " + std::to_string(entries_.back().id));
                return std::make_unique<IsolateHandle>(this, entries_.back().id, entries_.back().worker.get());
            }
        }
        utils::LogDebug("pool", "pool exhausted, using a temporary isolate");
        return std::make_unique<IsolateHandle>(this, std::make_unique<IsolateWorker>(MemoryLimitBytes()));
    } catch (const std::system_error& ex) {
        throw SandboxError(std::string("failed to start isolate: ") + ex.what());
    }
}

void IsolatePool::Release(std::unique_ptr<SandboxHandle> handle, ReleaseMode mode) {
    if (auto* lease = dynamic_cast<IsolateHandle*>(handle.get())) {
        lease->set_release_mode(mode);
    }
    handle.reset();
}

void IsolatePool::Return(std::uint64_t entry_id, bool reuse) {
    std::unique_ptr<IsolateWorker> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->id != entry_id) {
                continue;
            }
            if (reuse && it->request_count < options_.recycle_after) {
                it->busy = false;
                return;
            }
            utils::LogDebug("pool", "discarding isolate " + std::to_string(entry_id) + " after " +
                                        std::to_string(it->request_count) + " requests");
            doomed = std::move(it->worker);
            entries_.erase(it);
            break;
        }
    }
    Retire(std::move(doomed));
}

void IsolatePool::Retire(std::unique_ptr<IsolateWorker> worker) {
    reaper_.Retire(std::move(worker));
}

std::size_t IsolatePool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t IsolatePool::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : entries_) {
        if (entry.busy) {
            ++count;
        }
    }
    return count;
}

}  // namespace runbox::sandbox
