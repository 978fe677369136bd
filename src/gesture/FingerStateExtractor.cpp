/**
 * @file FingerStateExtractor.cpp
 * @brief Implementation of landmark-based finger counting
 */

#include "fingerlaunch/gesture/FingerStateExtractor.hpp"
#include <cmath>

namespace fingerlaunch {
namespace gesture {

FingerState FingerStateExtractor::extract(const HandObservation& observation) {
    const auto& landmarks = observation.landmarks;

    FingerVector fingers{{0, 0, 0, 0, 0}};
    fingers[static_cast<size_t>(Finger::Thumb)] =
        isThumbExtended(landmarks, observation.handedness) ? 1 : 0;
    fingers[static_cast<size_t>(Finger::Index)] = isFingerExtended(landmarks, kIndexTip) ? 1 : 0;
    fingers[static_cast<size_t>(Finger::Middle)] = isFingerExtended(landmarks, kMiddleTip) ? 1 : 0;
    fingers[static_cast<size_t>(Finger::Ring)] = isFingerExtended(landmarks, kRingTip) ? 1 : 0;
    fingers[static_cast<size_t>(Finger::Pinky)] = isFingerExtended(landmarks, kPinkyTip) ? 1 : 0;

    return fromFingerVector(fingers);
}

FingerState FingerStateExtractor::fromFingerVector(const FingerVector& fingers) {
    FingerState state;
    for (size_t i = 0; i < fingers.size(); ++i) {
        state.fingers[i] = fingers[i] != 0 ? 1 : 0;
        state.count += state.fingers[i];
    }
    return state;
}

bool FingerStateExtractor::isThumbExtended(const std::vector<cv::Point3f>& landmarks,
                                           Handedness handedness) {
    if (!hasLandmark(landmarks, kThumbTip) || !hasLandmark(landmarks, kThumbIp)) {
        return false;
    }

    const float tip_x = landmarks[kThumbTip].x;
    const float ip_x = landmarks[kThumbIp].x;

    if (handedness == Handedness::Left) {
        return tip_x > ip_x;
    }
    // Right and Unknown share the mirrored right-hand rule
    return tip_x < ip_x;
}

bool FingerStateExtractor::isFingerExtended(const std::vector<cv::Point3f>& landmarks, int tip_index) {
    const int pip_index = tip_index - kPipOffset;
    if (!hasLandmark(landmarks, tip_index) || !hasLandmark(landmarks, pip_index)) {
        return false;
    }
    return landmarks[tip_index].y < landmarks[pip_index].y;
}

bool FingerStateExtractor::hasLandmark(const std::vector<cv::Point3f>& landmarks, int index) {
    if (index < 0 || static_cast<size_t>(index) >= landmarks.size()) {
        return false;
    }
    const cv::Point3f& p = landmarks[static_cast<size_t>(index)];
    return std::isfinite(p.x) && std::isfinite(p.y);
}

} // namespace gesture
} // namespace fingerlaunch
