#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception hierarchy for FingerLaunch
 *
 * Exceptions are reserved for startup failures and capability faults.
 * Capability faults never leave the ActionDispatcher.
 */

namespace fingerlaunch {
namespace core {

/**
 * @brief Base exception class for all FingerLaunch exceptions
 *
 * Carries a result code, the bare message and an optional context
 * string (usually file:line from FINGERLAUNCH_THROW).
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }

    const std::string& getMessage() const noexcept { return message_; }

    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Invalid or unreadable configuration
 */
class ConfigurationException : public Exception {
public:
    ConfigurationException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIG_INVALID, message, context) {}
};

/**
 * @brief Frame source could not be opened or read
 */
class CameraException : public Exception {
public:
    CameraException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_CAMERA_NOT_FOUND, message, context) {}
};

/**
 * @brief Hand landmark backend failure
 */
class HandTrackerException : public Exception {
public:
    HandTrackerException(const std::string& message,
                         const std::string& context = "")
        : Exception(ResultCode::ERROR_HAND_TRACKER_FAILURE, message, context) {}
};

/**
 * @brief Fault raised by an external capability (browser, process, speech)
 */
class CapabilityException : public Exception {
public:
    CapabilityException(ResultCode code,
                        const std::string& message,
                        const std::string& context = "")
        : Exception(code, message, context) {}

    CapabilityException(const std::string& message,
                        const std::string& context = "")
        : Exception(ResultCode::ERROR_CAPABILITY_FAILURE, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define FINGERLAUNCH_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define FINGERLAUNCH_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace fingerlaunch
