#include "orthoedge/backends/DefaultBackend.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <iostream>

namespace orthoedge {

DefaultBackend::DefaultBackend()
    : currentLevel_(LogLevel::Info) {}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < currentLevel_ || level == LogLevel::Off) {
        return;
    }
    std::cout << "[" << getTimestamp() << "] ["
              << levelToColor(level) << levelToString(level) << "\033[0m] "
              << message << '\n';
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
}

const char* DefaultBackend::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

const char* DefaultBackend::levelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Critical: return "\033[1;31m";
        case LogLevel::Off: break;
    }
    return "";
}

std::string DefaultBackend::getTimestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&t, &local);
    return std::format("{:02}:{:02}:{:02}.{:03}",
                       local.tm_hour, local.tm_min, local.tm_sec, ms.count());
}

}  // namespace orthoedge
