/**
 * @file Logger.hpp
 * @brief Process-wide logger shared by every FingerLaunch module
 *
 * Lines go to stdout (stderr from ERROR up) and, once
 * initializeWithTimestamp() succeeds, to log_fingerlaunch_<date>_<time>.txt.
 */

#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <memory>
#include <chrono>
#include <fstream>

namespace fingerlaunch {
namespace core {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse a level name as written in the config file or on the command line.
 * Case-insensitive; "WARN" is accepted for WARNING.
 * @return false and leaves level untouched if the name is unknown
 */
bool parseLogLevel(const std::string& name, LogLevel& level);

std::string logLevelToString(LogLevel level);

/**
 * @brief Mutex-guarded singleton; log() may be called from any thread
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_ = level; }

    LogLevel getLevel() const { return minLevel_; }

    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    /**
     * Console-only setup: sets the level and console flag, leaves any open file alone
     */
    void configure(LogLevel level, bool consoleOutput);

    /**
     * Open a fresh timestamped log file under logDirectory.
     * Missing parent directories are created. On failure console output is
     * forced back on so nothing is lost.
     * @return false if the directory or the file could not be created
     */
    bool initializeWithTimestamp(const std::string& logDirectory,
                                 LogLevel level = LogLevel::INFO);

    void closeLogFile();

    /// Empty when no log file is open
    std::string getCurrentLogFile() const;

    void flush();

    /**
     * Write one line if level >= the current level.
     * file/line are appended as "(name.cpp:42)" when given.
     */
    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    void debug(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::DEBUG, msg, file, line);
    }

    void info(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::INFO, msg, file, line);
    }

    void warning(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::WARNING, msg, file, line);
    }

    void error(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::ERROR, msg, file, line);
    }

    void critical(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::CRITICAL, msg, file, line);
    }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;
    std::string generateTimestampedFilename(const std::string& directory) const;
    bool createDirectoryIfNeeded(const std::string& directory) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

#define LOG_DEBUG(msg) fingerlaunch::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) fingerlaunch::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) fingerlaunch::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) fingerlaunch::core::Logger::getInstance().error(msg, __FILE__, __LINE__)

/**
 * @brief Collects a line with operator<< and logs it on destruction,
 * prefixed with "[component] "
 */
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        if (component_.empty()) {
            Logger::getInstance().log(level_, stream_.str());
        } else {
            Logger::getInstance().log(level_, "[" + component_ + "] " + stream_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

#define FINGERLAUNCH_LOG_DEBUG(component) \
    fingerlaunch::core::LogStream(fingerlaunch::core::LogLevel::DEBUG, component)

#define FINGERLAUNCH_LOG_INFO(component) \
    fingerlaunch::core::LogStream(fingerlaunch::core::LogLevel::INFO, component)

#define FINGERLAUNCH_LOG_WARNING(component) \
    fingerlaunch::core::LogStream(fingerlaunch::core::LogLevel::WARNING, component)

#define FINGERLAUNCH_LOG_ERROR(component) \
    fingerlaunch::core::LogStream(fingerlaunch::core::LogLevel::ERROR, component)

} // namespace core
} // namespace fingerlaunch
