#pragma once
/**
 * @file Logger.h
 * @brief Process-wide, thread-safe logger.
 */
#include <iosfwd>
#include <mutex>
#include <string>

namespace ensemble {
    enum class LogLevel : int { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, NONE = 4 };

    /**
     * @brief Parse a level name ("debug", "INFO", ...).
     * @throws std::invalid_argument on an unknown name
     */
    LogLevel parseLogLevel(const std::string& name);

    /**
     * @brief Singleton writing "[LEVEL] [component] message" lines.
     *
     * The initial threshold is WARNING, or the value of ENSEMBLE_LOG_LEVEL when set.
     */
    class Logger {
    public:
        static Logger& getInstance();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void setLogLevel(LogLevel level);
        LogLevel logLevel() const;

        /**
         * @brief Redirect output, e.g. to a std::ostringstream in tests.
         * @param stream  must outlive every later log call
         */
        void setStream(std::ostream& stream);

        void debug(const std::string& component, const std::string& message) { log(LogLevel::DEBUG, component, message); }
        void info(const std::string& component, const std::string& message) { log(LogLevel::INFO, component, message); }
        void warning(const std::string& component, const std::string& message) { log(LogLevel::WARNING, component, message); }
        void error(const std::string& component, const std::string& message) { log(LogLevel::ERROR, component, message); }

        /** @brief Would a message at `level` be written? */
        bool enabled(LogLevel level) const;

    private:
        Logger();

        void log(LogLevel level, const std::string& component, const std::string& message);

        mutable std::mutex mutex_;
        LogLevel level_;
        std::ostream* stream_;
    };
}
