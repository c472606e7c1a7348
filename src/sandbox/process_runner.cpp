#include "sandbox/process_runner.hpp"

#include <boost/process.hpp>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace bp = boost::process;

namespace {

std::atomic<std::uint64_t> g_spawn_counter{0};

struct TempFiles {
    std::filesystem::path input;
    std::filesystem::path output;
    std::filesystem::path error;

    TempFiles() {
        const auto stamp = std::to_string(::getpid()) + "_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
            std::to_string(g_spawn_counter.fetch_add(1));
        const auto dir = std::filesystem::temp_directory_path();
        input = dir / ("runbox_stdin_" + stamp + ".json");
        output = dir / ("runbox_stdout_" + stamp + ".log");
        error = dir / ("runbox_stderr_" + stamp + ".log");
    }

    ~TempFiles() {
        std::error_code ec;
        std::filesystem::remove(input, ec);
        std::filesystem::remove(output, ec);
        std::filesystem::remove(error, ec);
    }
};

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

std::filesystem::path DefaultWorkerPath() {
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return "runbox-worker";
    }
    return self.parent_path() / "runbox-worker";
}

ProcessSandbox::ProcessSandbox(ProcessOptions options) : options_(std::move(options)) {}

ProcessSandbox::~ProcessSandbox() {
    Terminate();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProcessSandbox::Start(const ExecutionRequest& request, CompletionHandler completion) {
    if (thread_.joinable()) {
        throw SandboxError("process sandbox already started");
    }
    try {
        thread_ = std::thread(&ProcessSandbox::Run, this, EncodeWorkerRequest(request), std::move(completion));
    } catch (const std::system_error& ex) {
        throw SandboxError(std::string("failed to start worker thread: ") + ex.what());
    }
}

void ProcessSandbox::Terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    terminate_requested_ = true;
    if (pid_ > 0) {
        ::kill(pid_, SIGKILL);
    }
}

void ProcessSandbox::Run(std::string input, CompletionHandler completion) {
    ExecutionOutcome outcome;
    try {
        outcome = InterpretWorkerExit(Spawn(input));
    } catch (const bp::process_error& ex) {
        utils::LogWarn("process", std::string("spawn failed: ") + ex.what());
        outcome = MakeFailure(FailureKind::kProcessError, "Process error", std::string(ex.what()));
    } catch (const std::exception& ex) {
        utils::LogWarn("process", std::string("worker failed: ") + ex.what());
        outcome = MakeFailure(FailureKind::kProcessError, "Process error", std::string(ex.what()));
    }
    completion(std::move(outcome));
}

WorkerExit ProcessSandbox::Spawn(const std::string& input) {
    TempFiles files;
    {
        std::ofstream stdin_file(files.input, std::ios::binary | std::ios::trunc);
        if (!stdin_file.is_open()) {
            throw SandboxError("failed to write worker input: " + files.input.string());
        }
        stdin_file << input;
    }

    bp::child child_process(
        options_.worker_path.string(),
        "--memory-mb=" + std::to_string(options_.memory_mb),
        bp::std_in < files.input.string(),
        bp::std_out > files.output.string(),
        bp::std_err > files.error.string());
    const pid_t pid = child_process.id();
    child_process.detach();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid_ = pid;
        if (terminate_requested_) {
            ::kill(pid, SIGKILL);
        }
    }
    utils::LogDebug("process", "spawned worker pid " + std::to_string(pid));

    // Wait without reaping so Terminate() never signals a recycled pid.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) < 0 && errno == EINTR) {
    }
    int status = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid_ = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    WorkerExit exit{};
    if (WIFEXITED(status)) {
        exit.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.signal = WTERMSIG(status);
        exit.exit_code = 128 + exit.signal;
    }
    exit.stdout_text = ReadFile(files.output);
    exit.stderr_text = ReadFile(files.error);
    return exit;
}

ProcessRunner::ProcessRunner(ProcessOptions options) : options_(std::move(options)) {
    if (options_.worker_path.empty()) {
        options_.worker_path = DefaultWorkerPath();
    }
}

std::unique_ptr<SandboxHandle> ProcessRunner::Acquire() {
    std::error_code ec;
    if (!std::filesystem::exists(options_.worker_path, ec)) {
        throw SandboxError("worker executable not found: " + options_.worker_path.string());
    }
    return std::make_unique<ProcessSandbox>(options_);
}

void ProcessRunner::Release(std::unique_ptr<SandboxHandle> handle, ReleaseMode) {
    // Processes are never reused.
    handle.reset();
}

}  // namespace runbox::sandbox
