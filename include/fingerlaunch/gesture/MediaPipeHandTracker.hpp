#pragma once

/**
 * @file MediaPipeHandTracker.hpp
 * @brief Hand landmark source backed by MediaPipe Hands through pybind11
 *
 * Architecture:
 * - C++ interface (this class) -> pybind11 embedded interpreter ->
 *   mediapipe.solutions.hands.Hands
 * - One interpreter per process, created on first use
 * - Only the first detected hand is reported
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#include <fingerlaunch/gesture/GestureTypes.hpp>

#include <opencv2/core.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace fingerlaunch {
namespace gesture {

/**
 * @brief MediaPipe Hands parameters
 */
struct HandTrackerConfig {
    int max_num_hands = 1;
    float min_detection_confidence = 0.6f;
    float min_tracking_confidence = 0.6f;
};

/**
 * @brief Produces a HandObservation per BGR camera frame
 *
 * Usage example:
 * @code
 * MediaPipeHandTracker tracker;
 * std::optional<HandObservation> hand;
 * if (tracker.detect(frame, hand) && hand) {
 *     FingerState state = FingerStateExtractor::extract(*hand);
 * }
 * @endcode
 */
class MediaPipeHandTracker {
public:
    /**
     * @brief Start the interpreter and create the MediaPipe Hands solver
     * @throws core::HandTrackerException if mediapipe cannot be imported or initialized
     */
    explicit MediaPipeHandTracker(const HandTrackerConfig& config = HandTrackerConfig());

    ~MediaPipeHandTracker();

    MediaPipeHandTracker(const MediaPipeHandTracker&) = delete;
    MediaPipeHandTracker& operator=(const MediaPipeHandTracker&) = delete;

    /**
     * @brief Run hand tracking on one frame
     *
     * @param frame BGR image (CV_8UC3)
     * @param observation Set to the first hand, or reset when no hand is visible
     * @return false on a per-frame failure (see getLastError()), observation is reset
     */
    bool detect(const cv::Mat& frame, std::optional<HandObservation>& observation);

    /**
     * @brief Frames passed to MediaPipe since construction
     */
    uint64_t getProcessedFrames() const;

    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace gesture
} // namespace fingerlaunch
