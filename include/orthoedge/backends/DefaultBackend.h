#pragma once

#include "orthoedge/common/ILoggerBackend.h"
#include <mutex>

namespace orthoedge {

/**
 * @brief Dependency-free stdout logger
 *
 * Used when the library is built without spdlog. Lines carry an
 * HH:MM:SS.mmm timestamp and an ANSI-colored level tag.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    static const char* levelToString(LogLevel level);
    static const char* levelToColor(LogLevel level);
    static std::string getTimestamp();
};

}  // namespace orthoedge
