#pragma once

#include <source_location>
#include <string>

namespace orthoedge {

/// Severity of a log line, lowest first
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Logger backend interface for dependency injection
 *
 * Hosts that already own a logging system (an editor, a diagram service)
 * implement this interface so connector routing messages end up in the
 * host's log instead of stdout.
 *
 * Example:
 * @code
 * class EditorLog : public orthoedge::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         console_->append(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { console_->setThreshold(level); }
 *     void flush() override {}
 * };
 *
 * orthoedge::Logger::setBackend(std::make_unique<EditorLog>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Write one line
     * @param level Severity; the backend applies its own level filter
     * @param message Formatted text including the "Func() - " prefix
     * @param loc Call site of the LOG_* macro
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace orthoedge
