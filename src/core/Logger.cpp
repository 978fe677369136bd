/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "fingerlaunch/core/Logger.hpp"
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <cstring>

namespace fingerlaunch {
namespace core {

bool parseLogLevel(const std::string& name, LogLevel& level) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") {
        level = LogLevel::TRACE;
    } else if (upper == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        level = LogLevel::WARNING;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR;
    } else if (upper == "CRITICAL") {
        level = LogLevel::CRITICAL;
    } else {
        return false;
    }
    return true;
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

Logger::Logger() : minLevel_(LogLevel::INFO), consoleOutput_(true) {
}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();
}

void Logger::configure(LogLevel level, bool consoleOutput) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
    consoleOutput_ = consoleOutput;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_) {
        std::cout.flush();
        std::cerr.flush();
    }
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line) {
    if (level < minLevel_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string formatted = formatMessage(level, message, file, line);

    if (consoleOutput_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    if (logFile_.is_open()) {
        logFile_ << formatted << std::endl;
    }
}

std::string Logger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::formatMessage(LogLevel level, const std::string& message,
                                  const std::string& file, int line) const {
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] [" << logLevelToString(level) << "] " << message;

    if (!file.empty() && line > 0) {
        size_t pos = file.find_last_of("/\\");
        std::string filename = (pos != std::string::npos) ? file.substr(pos + 1) : file;
        oss << " (" << filename << ":" << line << ")";
    }

    return oss.str();
}

std::string Logger::generateTimestampedFilename(const std::string& directory) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream oss;
    oss << directory;
    if (!directory.empty() && directory.back() != '/') {
        oss << '/';
    }
    oss << "log_fingerlaunch_";
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d_%H-%M-%S");
    oss << ".txt";

    return oss.str();
}

bool Logger::createDirectoryIfNeeded(const std::string& directory) const {
    struct stat st;

    if (stat(directory.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return true;
        }
        std::cerr << "[Logger] Error: " << directory << " exists but is not a directory" << std::endl;
        return false;
    }

    if (mkdir(directory.c_str(), 0755) == 0) {
        return true;
    }

    // mkdir -p
    if (errno == ENOENT) {
        size_t pos = directory.find_last_of('/');
        if (pos != std::string::npos && pos > 0) {
            std::string parent = directory.substr(0, pos);
            if (createDirectoryIfNeeded(parent)) {
                return mkdir(directory.c_str(), 0755) == 0;
            }
        }
    }

    std::cerr << "[Logger] Failed to create directory " << directory
              << ": " << std::strerror(errno) << std::endl;
    return false;
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    minLevel_ = level;

    if (!createDirectoryIfNeeded(logDirectory)) {
        std::cerr << "[Logger] Warning: Could not create log directory, file logging disabled" << std::endl;
        consoleOutput_ = true;
        return false;
    }

    currentLogFile_ = generateTimestampedFilename(logDirectory);

    if (logFile_.is_open()) {
        logFile_.close();
    }

    logFile_.open(currentLogFile_, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Error: Failed to open log file " << currentLogFile_
                  << ": " << std::strerror(errno) << std::endl;
        currentLogFile_.clear();
        consoleOutput_ = true;
        return false;
    }

    logFile_ << "===========================================" << std::endl;
    logFile_ << "FingerLaunch Log" << std::endl;
    logFile_ << "Started: " << getTimestamp() << std::endl;
    logFile_ << "Log Level: " << logLevelToString(level) << std::endl;
    logFile_ << "===========================================" << std::endl;
    logFile_.flush();

    return true;
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

} // namespace core
} // namespace fingerlaunch
