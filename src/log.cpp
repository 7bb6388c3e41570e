#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

/**
 * @file log.cpp
 * @brief Level filter and serialized line output.
 */

namespace vigil {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_out_mu;
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info") { out = LogLevel::Info; return true; }
    if (name == "warn" || name == "warning") { out = LogLevel::Warn; return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_level.load());
}

bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load();
}

LogLine::LogLine(LogLevel level, const char* component)
    : level_(level), enabled_(logEnabled(level)) {
    if (enabled_) {
        oss_ << '[' << logLevelName(level) << "] ";
        if (component && *component) oss_ << component << ": ";
    }
}

LogLine::~LogLine() {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(g_out_mu);
    if (level_ >= LogLevel::Warn) {
        std::cerr << oss_.str() << std::endl;
    } else {
        std::cout << oss_.str() << std::endl;
    }
}

} // namespace vigil
