#pragma once

#include <string>

namespace runbox::config {

struct ExecutorConfig {
    int default_timeout_ms = 5000;
    int max_timeout_ms = 300000;
    int io_threads = 2;
};

struct ProcessConfig {
    int memory_mb = 128;
    // Empty means runbox-worker next to the running executable.
    std::string worker_path;
};

struct PoolConfig {
    int size = 5;
    int recycle_after = 100;
    int memory_mb = 128;
};

struct GatewayConfig {
    std::string host = "0.0.0.0";
    int port = 3333;
    // Each in-flight request holds one of these until its outcome is ready.
    int threads = 64;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ExecutorConfig executor;
    ProcessConfig process;
    PoolConfig pool;
    GatewayConfig gateway;
    LoggingConfig logging;
};

}  // namespace runbox::config
