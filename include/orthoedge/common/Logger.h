#pragma once

#include "orthoedge/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace orthoedge {

/**
 * @brief Process-wide logging facade used by every OrthoEdge module
 *
 * The facade forwards to an ILoggerBackend. Unless a host injects its own
 * backend, the first log call installs the built-in one (SpdlogBackend when
 * built with ORTHOEDGE_USE_SPDLOG, DefaultBackend otherwise).
 *
 * Capture mode keeps a copy of every message in memory so tests can assert
 * on what the optimizer or drag controller reported.
 *
 * Example:
 * @code
 * orthoedge::Logger::initialize();
 * orthoedge::Logger::enableCapture(true);
 * LOG_DEBUG("merged {} coordinates", count);
 * auto lines = orthoedge::Logger::getCapturedLogs("merged");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend Host logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Install the default backend (console only) if none is set
    static void initialize();

    /**
     * @brief Install the default backend with optional file output
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Log Capture API =====

    /// Start or stop keeping log lines in memory
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured logs with optional filtering
     * @param pattern Substring filter (empty = all lines)
     * @param maxLines Return only the last N matching lines (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const std::string& message,
                         const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace orthoedge

// Logging macros with std::format support
#define LOG_TRACE(...) orthoedge::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) orthoedge::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  orthoedge::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  orthoedge::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) orthoedge::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
