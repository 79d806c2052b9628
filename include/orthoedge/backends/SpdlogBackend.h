#pragma once

#include "orthoedge/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace orthoedge {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink always, plus a file sink (orthoedge.log) when a log
 * directory is given. Default backend when ORTHOEDGE_USE_SPDLOG=ON.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace orthoedge
