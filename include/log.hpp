#ifndef LOG_HPP
#define LOG_HPP

#include <sstream>
#include <string>

namespace vigil {

/**
 * @file log.hpp
 * @brief Tagged line logging to stdout/stderr with a process-wide level.
 *
 * Lines read `[WARN] storage: usage at 83.1%`. WARN and ERROR go to stderr,
 * everything else to stdout. Each line is written in one piece so concurrent
 * threads never interleave inside a line.
 */

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

/** @brief Parse debug|info|warn|error; false on unknown names. */
bool parseLogLevel(const std::string& name, LogLevel& out);
const char* logLevelName(LogLevel level);

void setLogLevel(LogLevel level);
LogLevel logLevel();
bool logEnabled(LogLevel level);

/**
 * @brief Accumulates one log line and emits it on destruction.
 * @threading Each instance is confined to the constructing thread.
 */
class LogLine {
public:
    LogLine(LogLevel level, const char* component);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template<typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) oss_ << value;
        return *this;
    }

private:
    LogLevel level_;
    bool enabled_;
    std::ostringstream oss_;
};

} // namespace vigil

#define VIGIL_LOG_DEBUG(component) ::vigil::LogLine(::vigil::LogLevel::Debug, component)
#define VIGIL_LOG_INFO(component) ::vigil::LogLine(::vigil::LogLevel::Info, component)
#define VIGIL_LOG_WARN(component) ::vigil::LogLine(::vigil::LogLevel::Warn, component)
#define VIGIL_LOG_ERROR(component) ::vigil::LogLine(::vigil::LogLevel::Error, component)

#endif // LOG_HPP
