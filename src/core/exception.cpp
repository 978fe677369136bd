#include "fingerlaunch/core/exception.h"
#include <sstream>

namespace fingerlaunch {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_CONFIG_INVALID:
            return "ERROR_CONFIG_INVALID";
        case ResultCode::ERROR_CAMERA_NOT_FOUND:
            return "ERROR_CAMERA_NOT_FOUND";
        case ResultCode::ERROR_HAND_TRACKER_FAILURE:
            return "ERROR_HAND_TRACKER_FAILURE";
        case ResultCode::ERROR_CAPABILITY_UNAVAILABLE:
            return "ERROR_CAPABILITY_UNAVAILABLE";
        case ResultCode::ERROR_CAPABILITY_FAILURE:
            return "ERROR_CAPABILITY_FAILURE";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace fingerlaunch
