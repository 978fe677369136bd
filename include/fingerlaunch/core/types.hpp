/**
 * @file types.hpp
 * @brief Common type definitions for FingerLaunch
 */

#ifndef FINGERLAUNCH_CORE_TYPES_HPP
#define FINGERLAUNCH_CORE_TYPES_HPP

namespace fingerlaunch {
namespace core {

/**
 * @brief Result codes shared by all FingerLaunch modules
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_INVALID_PARAMETER,
    ERROR_CONFIG_INVALID,
    ERROR_CAMERA_NOT_FOUND,
    ERROR_HAND_TRACKER_FAILURE,
    ERROR_CAPABILITY_UNAVAILABLE,
    ERROR_CAPABILITY_FAILURE
};

} // namespace core
} // namespace fingerlaunch

#endif // FINGERLAUNCH_CORE_TYPES_HPP
