#include "orthoedge/common/Logger.h"

#ifdef ORTHOEDGE_USE_SPDLOG
#include "orthoedge/backends/SpdlogBackend.h"
#else
#include "orthoedge/backends/DefaultBackend.h"
#endif

#include <cctype>
#include <mutex>

namespace orthoedge {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {

std::mutex backendMutex;

bool captureEnabled = false;
std::vector<std::string> capturedLogs;
std::mutex captureMutex;

const char* captureTag(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "[trace] ";
        case LogLevel::Debug: return "[debug] ";
        case LogLevel::Info: return "[info] ";
        case LogLevel::Warn: return "[warn] ";
        case LogLevel::Error: return "[error] ";
        case LogLevel::Critical: return "[critical] ";
        case LogLevel::Off: break;
    }
    return "";
}

std::unique_ptr<ILoggerBackend> makeDefaultBackend(
    [[maybe_unused]] const std::string& logDir,
    [[maybe_unused]] bool logToFile) {
#ifdef ORTHOEDGE_USE_SPDLOG
    return std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
    return std::make_unique<DefaultBackend>();
#endif
}

}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    initialize("", false);
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = makeDefaultBackend(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::dispatch(LogLevel level, const std::string& message,
                      const std::source_location& loc) {
    ensureBackend();
    std::string enhanced = extractFunctionName(loc) + "() - " + message;
    backend_->log(level, enhanced, loc);
    captureLog(captureTag(level) + enhanced);
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

// ===== Log Capture Implementation =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(captureMutex);
    captureEnabled = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(captureMutex);
    return captureEnabled;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(captureMutex);

    std::vector<std::string> result;
    for (const auto& line : capturedLogs) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    // Keep the most recent lines
    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.begin() + static_cast<long>(result.size() - maxLines));
    }

    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(captureMutex);
    capturedLogs.clear();
}

void Logger::captureLog(const std::string& message) {
    std::lock_guard<std::mutex> lock(captureMutex);
    if (captureEnabled) {
        capturedLogs.push_back(message);
    }
}

std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "Unknown";
    }

    // Last space outside template brackets marks the start of the qualified name
    int angleDepth = 0;
    size_t nameStart = 0;
    for (size_t i = 0; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') angleDepth++;
        else if (c == '>') angleDepth--;
        else if (c == ' ' && angleDepth == 0) nameStart = i + 1;
    }

    std::string result;
    angleDepth = 0;
    for (size_t i = nameStart; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') angleDepth++;
        else if (c == '>') angleDepth--;
        else if (angleDepth == 0) result += c;
    }

    while (!result.empty() && (std::isspace(static_cast<unsigned char>(result.front())) ||
                               result.front() == '*' || result.front() == '&')) {
        result.erase(0, 1);
    }
    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    // Drop the namespace prefix, it is the same for every line
    const std::string prefix = "orthoedge::";
    if (result.rfind(prefix, 0) == 0) {
        result.erase(0, prefix.size());
    }

    return result.empty() ? "Unknown" : result;
}

}  // namespace orthoedge
