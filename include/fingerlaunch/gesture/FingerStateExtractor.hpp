/**
 * @file FingerStateExtractor.hpp
 * @brief Reduces 21 hand landmarks to a finger-extension vector
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_GESTURE_FINGER_STATE_EXTRACTOR_HPP
#define FINGERLAUNCH_GESTURE_FINGER_STATE_EXTRACTOR_HPP

#include "GestureTypes.hpp"

namespace fingerlaunch {
namespace gesture {

/**
 * @brief Finger extension classifier
 *
 * Thumb: compares TIP (4) with IP (3) along x. The frame is mirrored before
 * tracking, so a right thumb is extended when tip.x < ip.x and a left thumb
 * when tip.x > ip.x. Unknown handedness uses the right-hand rule.
 *
 * Index..pinky: extended when TIP.y < PIP.y (tip is higher in the image).
 *
 * A finger whose landmarks are missing or non-finite is reported as not
 * extended. Extraction never throws and has no side effects.
 */
class FingerStateExtractor {
public:
    static constexpr int kThumbTip = 4;
    static constexpr int kThumbIp = 3;
    static constexpr int kIndexTip = 8;
    static constexpr int kMiddleTip = 12;
    static constexpr int kRingTip = 16;
    static constexpr int kPinkyTip = 20;

    /// PIP joint sits two landmarks before each fingertip
    static constexpr int kPipOffset = 2;

    /**
     * @brief Extract finger count and extension vector from one observation
     */
    static FingerState extract(const HandObservation& observation);

    /**
     * @brief Build a FingerState from an already reduced finger vector
     *
     * Non-zero entries count as extended.
     */
    static FingerState fromFingerVector(const FingerVector& fingers);

    static bool isThumbExtended(const std::vector<cv::Point3f>& landmarks,
                                Handedness handedness);

    /**
     * @brief Check one of index/middle/ring/pinky by its tip landmark index
     */
    static bool isFingerExtended(const std::vector<cv::Point3f>& landmarks, int tip_index);

private:
    static bool hasLandmark(const std::vector<cv::Point3f>& landmarks, int index);
};

} // namespace gesture
} // namespace fingerlaunch

#endif // FINGERLAUNCH_GESTURE_FINGER_STATE_EXTRACTOR_HPP
