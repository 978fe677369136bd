/**
 * @file GestureTypes.hpp
 * @brief Core data types for finger-count gesture detection
 *
 * Defines the per-tick observation consumed from the hand tracker, the
 * finger state derived from it, the gesture event handed to the action
 * layer and the debounce configuration.
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_GESTURE_TYPES_HPP
#define FINGERLAUNCH_GESTURE_TYPES_HPP

#include <array>
#include <vector>
#include <string>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <opencv2/core.hpp>

namespace fingerlaunch {
namespace gesture {

/// Monotonic clock driving stability and cooldown decisions
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Seconds = std::chrono::duration<double>;

/// Number of extended fingers, always in [0, 5]
using FingerCount = int;

constexpr FingerCount kMinFingerCount = 0;
constexpr FingerCount kMaxFingerCount = 5;

/// Number of MediaPipe hand landmarks
constexpr int kNumHandLandmarks = 21;

/**
 * @brief Handedness label reported by the hand tracker
 */
enum class Handedness {
    Unknown = 0,
    Left,
    Right
};

/**
 * @brief Finger order inside a FingerVector
 */
enum class Finger {
    Thumb = 0,
    Index,
    Middle,
    Ring,
    Pinky
};

/**
 * @brief Extension flags (0 or 1) for thumb, index, middle, ring, pinky
 */
using FingerVector = std::array<uint8_t, 5>;

/**
 * @brief One hand as seen by the tracker during a single tick
 *
 * Landmarks follow the MediaPipe convention (normalized image coordinates,
 * y grows downward):
 * 0: Wrist
 * 1-4: Thumb (CMC, MCP, IP, TIP)
 * 5-8: Index finger (MCP, PIP, DIP, TIP)
 * 9-12: Middle finger (MCP, PIP, DIP, TIP)
 * 13-16: Ring finger (MCP, PIP, DIP, TIP)
 * 17-20: Pinky (MCP, PIP, DIP, TIP)
 *
 * The vector may be shorter than 21 entries or hold non-finite values when
 * the tracker output is partial; extraction tolerates both.
 */
struct HandObservation {
    std::vector<cv::Point3f> landmarks;
    Handedness handedness = Handedness::Unknown;

    /// Tracker confidence for this hand [0, 1], informational only
    float confidence = 0.0f;
};

/**
 * @brief Result of finger-state extraction
 */
struct FingerState {
    FingerCount count = 0;
    FingerVector fingers{{0, 0, 0, 0, 0}};
};

/**
 * @brief A debounced gesture that cleared stability and cooldown
 */
struct GestureEvent {
    FingerCount count = 0;
    Timestamp timestamp;
};

/**
 * @brief Debounce configuration
 */
struct GestureConfig {
    /// Consecutive ticks a count must be held before it is stable
    int stable_frames = 6;

    /// Minimum time between two acted dispatches
    double cooldown_seconds = 3.0;

    /**
     * @brief Validate configuration
     * @return true if configuration is valid
     */
    bool is_valid() const {
        return stable_frames >= 1 &&
               std::isfinite(cooldown_seconds) &&
               cooldown_seconds >= 0.0;
    }
};

inline bool is_valid_finger_count(FingerCount count) {
    return count >= kMinFingerCount && count <= kMaxFingerCount;
}

/**
 * @brief Convert Handedness enum to string
 */
inline std::string handedness_to_string(Handedness handedness) {
    switch (handedness) {
        case Handedness::Left: return "Left";
        case Handedness::Right: return "Right";
        case Handedness::Unknown: return "Unknown";
        default: return "Invalid";
    }
}

/**
 * @brief Parse a tracker handedness label ("Left"/"Right"), anything else is Unknown
 */
inline Handedness handedness_from_string(const std::string& label) {
    if (label == "Left") {
        return Handedness::Left;
    }
    if (label == "Right") {
        return Handedness::Right;
    }
    return Handedness::Unknown;
}

/**
 * @brief Render a finger vector as "[1, 0, 0, 0, 1]"
 */
inline std::string finger_vector_to_string(const FingerVector& fingers) {
    std::string out = "[";
    for (size_t i = 0; i < fingers.size(); ++i) {
        out += std::to_string(static_cast<int>(fingers[i]));
        if (i + 1 < fingers.size()) {
            out += ", ";
        }
    }
    out += "]";
    return out;
}

} // namespace gesture
} // namespace fingerlaunch

#endif // FINGERLAUNCH_GESTURE_TYPES_HPP
