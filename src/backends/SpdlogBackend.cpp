#include "orthoedge/backends/SpdlogBackend.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace orthoedge {

namespace {

constexpr const char* kLoggerName = "orthoedge";
constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

/// Level requested through LOG_LEVEL (or SPDLOG_LEVEL), if any
bool levelFromEnvironment(spdlog::level::level_enum& out) {
    const char* envLevel = std::getenv("LOG_LEVEL");
    if (!envLevel) {
        envLevel = std::getenv("SPDLOG_LEVEL");
    }
    if (!envLevel) {
        return false;
    }

    std::string level(envLevel);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "warning") {
        level = "warn";
    } else if (level == "error") {
        level = "err";
    }

    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    out = parsed;
    return true;
}

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    // A previous backend instance may still be registered under our name
    spdlog::drop(kLoggerName);

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern(kConsolePattern);
    sinks.push_back(consoleSink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "orthoedge.log";

        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            logPath.string(), true);
        fileSink->set_pattern(kFilePattern);
        sinks.push_back(fileSink);
    }

    logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    spdlog::register_logger(logger_);

    logger_->set_level(spdlog::level::info);

    spdlog::level::level_enum envLevel = spdlog::level::info;
    if (levelFromEnvironment(envLevel)) {
        logger_->set_level(envLevel);
    }
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace orthoedge
