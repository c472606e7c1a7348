#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace runbox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_output_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

bool IsLogEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!IsLogEnabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (level == LogLevel::kInfo) {
        std::cerr << "[" << tag << "] " << message << std::endl;
    } else {
        std::cerr << "[" << tag << "] " << ToString(level) << " " << message << std::endl;
    }
}

}  // namespace runbox::utils
