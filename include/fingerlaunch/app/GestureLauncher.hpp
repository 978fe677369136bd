/**
 * @file GestureLauncher.hpp
 * @brief Host tick loop: camera capture, hand tracking and gesture dispatch
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_APP_GESTURE_LAUNCHER_HPP
#define FINGERLAUNCH_APP_GESTURE_LAUNCHER_HPP

#include <fingerlaunch/app/LauncherConfiguration.hpp>
#include <fingerlaunch/action/ActionDispatcher.hpp>
#include <fingerlaunch/gesture/GestureEventEmitter.hpp>
#include <fingerlaunch/gesture/MediaPipeHandTracker.hpp>

#include <opencv2/videoio.hpp>

#include <QTimer>

#include <cstdint>
#include <functional>

namespace fingerlaunch {
namespace app {

/**
 * @brief Counters reported in the status line and at shutdown
 */
struct LauncherStatistics {
    uint64_t ticks = 0;
    uint64_t hand_frames = 0;        ///< Ticks with a hand in view
    uint64_t tracker_failures = 0;   ///< Per-frame tracker errors (treated as no hand)
    uint64_t events = 0;             ///< Gesture events emitted
    uint64_t dispatched = 0;         ///< Events whose action was performed
};

/**
 * @brief Drives one GestureEventEmitter tick per timer interval
 *
 * Each tick reads a frame, mirrors it if configured, runs the hand
 * tracker and feeds the observation to the emitter with the current
 * steady-clock time. Must live in the thread running the Qt event loop.
 */
class GestureLauncher {
public:
    static constexpr uint64_t kStatusInterval = 30;   ///< Ticks between status lines

    /**
     * @brief Open the camera, start the hand tracker and build the dispatch chain
     *
     * @throws core::CameraException if the webcam cannot be opened
     * @throws core::HandTrackerException if MediaPipe cannot be initialized
     */
    GestureLauncher(const LauncherConfiguration& config, action::CapabilitySet capabilities);

    ~GestureLauncher();

    GestureLauncher(const GestureLauncher&) = delete;
    GestureLauncher& operator=(const GestureLauncher&) = delete;

    /**
     * @brief Predicate polled every tick; returning true stops the loop
     */
    void setStopCondition(std::function<bool()> condition);

    /**
     * @brief Start ticking on the Qt event loop
     *
     * QCoreApplication::quit() is called once the loop stops.
     */
    void start();

    void stop();

    /**
     * @brief Run a single tick
     * @return false when the loop should end (stop requested or camera lost)
     */
    bool step();

    const LauncherStatistics& statistics() const { return stats_; }

private:
    void logStatus(const gesture::TickResult& tick, gesture::Handedness handedness) const;
    void logSummary() const;

    LauncherConfiguration config_;
    cv::VideoCapture capture_;
    gesture::MediaPipeHandTracker tracker_;
    action::ActionDispatcher dispatcher_;
    gesture::GestureEventEmitter emitter_;
    QTimer timer_;
    std::function<bool()> stop_condition_;
    LauncherStatistics stats_;
    bool running_ = false;
};

} // namespace app
} // namespace fingerlaunch

#endif // FINGERLAUNCH_APP_GESTURE_LAUNCHER_HPP
