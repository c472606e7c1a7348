#include <cstdlib>
#include <iostream>
#include <iterator>
#include <new>
#include <string>
#include <utility>
#include <sys/resource.h>
#include <unistd.h>

#include "encoding/result_normalizer.hpp"
#include "sandbox/worker_protocol.hpp"
#include "script/quickjs_engine.hpp"
#include "utils/logging.hpp"

namespace {

// Address space on top of the script heap for the binary, stacks and libc.
constexpr std::size_t kHeadroomBytes = 256ull * 1024 * 1024;
constexpr int kDefaultMemoryMb = 128;

void OnOutOfMemory() {
    static const char kMessage[] = "out of memory\n";
    const auto written = ::write(STDERR_FILENO, kMessage, sizeof(kMessage) - 1);
    (void)written;
    std::_Exit(runbox::sandbox::kOutOfMemoryExitCode);
}

int ParseMemoryMb(int argc, char** argv) {
    const std::string prefix = "--memory-mb=";
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind(prefix, 0) != 0) {
            continue;
        }
        try {
            const int value = std::stoi(arg.substr(prefix.size()));
            if (value > 0) {
                return value;
            }
        } catch (const std::exception&) {
        }
    }
    return kDefaultMemoryMb;
}

void LimitAddressSpace(std::size_t heap_bytes) {
    struct rlimit limit {};
    limit.rlim_cur = heap_bytes + kHeadroomBytes;
    limit.rlim_max = heap_bytes + kHeadroomBytes;
    if (::setrlimit(RLIMIT_AS, &limit) != 0) {
        runbox::utils::LogWarn("worker", "failed to cap address space");
    }
}

std::string Dump(const runbox::Json& json) {
    return json.dump(-1, ' ', false, runbox::Json::error_handler_t::replace);
}

}  // namespace

int main(int argc, char** argv) {
    runbox::utils::ConfigureLogging({runbox::utils::LogLevel::kWarn});
    std::set_new_handler(OnOutOfMemory);

    const std::string input{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    runbox::sandbox::WorkerRequest request;
    try {
        request = runbox::sandbox::DecodeWorkerRequest(input);
    } catch (const std::exception& ex) {
        std::cerr << Dump(runbox::sandbox::EncodeWorkerDiagnostic(ex.what())) << std::endl;
        return runbox::sandbox::kBadRequestExitCode;
    }

    const std::size_t heap_bytes = static_cast<std::size_t>(ParseMemoryMb(argc, argv)) * 1024 * 1024;
    LimitAddressSpace(heap_bytes);

    runbox::script::InvocationSpec spec{};
    spec.script = std::move(request.script);
    spec.function_name = std::move(request.function_name);
    spec.payload = std::move(request.payload);
    spec.missing_function_message = "Function \"" + spec.function_name + "\" not found in module";

    runbox::script::InvocationResult result;
    try {
        runbox::script::EngineOptions options{};
        options.memory_limit_bytes = heap_bytes;
        runbox::script::ScriptEngine engine(options);
        result = engine.Invoke(spec);
    } catch (const std::exception& ex) {
        std::cerr << Dump(runbox::sandbox::EncodeWorkerDiagnostic(ex.what())) << std::endl;
        return runbox::sandbox::kBadRequestExitCode;
    }
    if (result.status == runbox::script::InvocationStatus::kOutOfMemory) {
        std::cerr << "out of memory";
        if (result.stack) {
            std::cerr << ": " << *result.stack;
        }
        std::cerr << std::endl;
        return runbox::sandbox::kOutOfMemoryExitCode;
    }

    runbox::Json line;
    if (result.status == runbox::script::InvocationStatus::kSuccess) {
        line = runbox::sandbox::EncodeWorkerSuccess(
            runbox::encoding::NormalizeResult(std::move(result.result)), result.logs);
    } else {
        line = runbox::sandbox::EncodeWorkerError(result.message, result.stack, result.code, result.logs);
    }
    std::cout << Dump(line) << std::endl;
    return 0;
}
