#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

namespace runbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("executor") && data["executor"].is_object()) {
        const auto& executor = data["executor"];
        ApplyInt(config.executor.default_timeout_ms, executor, "defaultTimeoutMs");
        ApplyInt(config.executor.max_timeout_ms, executor, "maxTimeoutMs");
        ApplyInt(config.executor.io_threads, executor, "ioThreads");
    }

    if (data.contains("process") && data["process"].is_object()) {
        const auto& process = data["process"];
        ApplyInt(config.process.memory_mb, process, "memoryMb");
        ApplyString(config.process.worker_path, process, "workerPath");
    }

    if (data.contains("pool") && data["pool"].is_object()) {
        const auto& pool = data["pool"];
        ApplyInt(config.pool.size, pool, "size");
        ApplyInt(config.pool.recycle_after, pool, "recycleAfter");
        ApplyInt(config.pool.memory_mb, pool, "memoryMb");
    }

    if (data.contains("gateway") && data["gateway"].is_object()) {
        const auto& gateway = data["gateway"];
        ApplyString(config.gateway.host, gateway, "host");
        ApplyInt(config.gateway.port, gateway, "port");
        ApplyInt(config.gateway.threads, gateway, "threads");
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyEnvInt(int& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void ApplyEnvString(std::string& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".runbox" / "config.json";
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception&) {
            // Keep defaults on parse errors
        }
    }

    ApplyEnvInt(config.executor.default_timeout_ms,
                "RUNBOX_EXECUTOR__DEFAULT_TIMEOUT_MS", "RUNBOX_DEFAULT_TIMEOUT_MS");
    ApplyEnvInt(config.executor.max_timeout_ms,
                "RUNBOX_EXECUTOR__MAX_TIMEOUT_MS", "RUNBOX_MAX_TIMEOUT_MS");
    ApplyEnvInt(config.executor.io_threads,
                "RUNBOX_EXECUTOR__IO_THREADS", "RUNBOX_IO_THREADS");

    ApplyEnvInt(config.process.memory_mb,
                "RUNBOX_PROCESS__MEMORY_MB", "PER_WORKER_MEMORY_MB");
    ApplyEnvString(config.process.worker_path,
                   "RUNBOX_PROCESS__WORKER_PATH", "RUNBOX_WORKER_PATH");

    ApplyEnvInt(config.pool.size, "RUNBOX_POOL__SIZE", "RUNBOX_POOL_SIZE");
    ApplyEnvInt(config.pool.recycle_after,
                "RUNBOX_POOL__RECYCLE_AFTER", "RUNBOX_POOL_RECYCLE_AFTER");
    ApplyEnvInt(config.pool.memory_mb, "RUNBOX_POOL__MEMORY_MB", "RUNBOX_POOL_MEMORY_MB");

    ApplyEnvString(config.gateway.host, "RUNBOX_GATEWAY__HOST", "RUNBOX_HOST");
    ApplyEnvInt(config.gateway.port, "RUNBOX_GATEWAY__PORT", "PORT");
    ApplyEnvInt(config.gateway.threads, "RUNBOX_GATEWAY__THREADS", "RUNBOX_GATEWAY_THREADS");

    ApplyEnvString(config.logging.level, "RUNBOX_LOGGING__LEVEL", "RUNBOX_LOG_LEVEL");

    return config;
}

nlohmann::json ConfigToJson(const Config& config) {
    return {
        {"executor", {
            {"defaultTimeoutMs", config.executor.default_timeout_ms},
            {"maxTimeoutMs", config.executor.max_timeout_ms},
            {"ioThreads", config.executor.io_threads}
        }},
        {"process", {
            {"memoryMb", config.process.memory_mb},
            {"workerPath", config.process.worker_path}
        }},
        {"pool", {
            {"size", config.pool.size},
            {"recycleAfter", config.pool.recycle_after},
            {"memoryMb", config.pool.memory_mb}
        }},
        {"gateway", {
            {"host", config.gateway.host},
            {"port", config.gateway.port},
            {"threads", config.gateway.threads}
        }},
        {"logging", {
            {"level", config.logging.level}
        }}
    };
}

}  // namespace runbox::config
