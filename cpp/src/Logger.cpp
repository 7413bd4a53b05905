#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace ensemble;

namespace {
    const char* levelName(const LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::NONE: break;
        }
        return "NONE";
    }

    LogLevel levelFromEnvironment() {
        const char* value = std::getenv("ENSEMBLE_LOG_LEVEL");
        if (value == nullptr || *value == '\0') return LogLevel::WARNING;
        try {
            return parseLogLevel(value);
        }
        catch (const std::invalid_argument& e) {
            std::cerr << "[WARNING] [Logger] " << e.what() << ", using WARNING" << std::endl;
            return LogLevel::WARNING;
        }
    }
}

LogLevel ensemble::parseLogLevel(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](const unsigned char c) { return std::toupper(c); });
    if (n == "DEBUG") return LogLevel::DEBUG;
    if (n == "INFO") return LogLevel::INFO;
    if (n == "WARNING" || n == "WARN") return LogLevel::WARNING;
    if (n == "ERROR") return LogLevel::ERROR;
    if (n == "NONE" || n == "OFF") return LogLevel::NONE;
    throw std::invalid_argument("unknown log level '" + name + "'");
}

Logger::Logger(): level_(levelFromEnvironment()), stream_(&std::clog) {}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLogLevel(const LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::logLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::setStream(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = &stream;
}

bool Logger::enabled(const LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::NONE && level >= level_;
}

void Logger::log(const LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::NONE || level < level_) return;
    *stream_ << '[' << levelName(level) << "] [" << component << "] " << message << '\n';
    if (level >= LogLevel::WARNING) stream_->flush();
}
