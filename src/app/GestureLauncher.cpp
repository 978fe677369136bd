/**
 * @file GestureLauncher.cpp
 * @brief Host tick loop implementation
 */

#include <fingerlaunch/app/GestureLauncher.hpp>
#include <fingerlaunch/core/Logger.hpp>
#include <fingerlaunch/core/exception.h>

#include <opencv2/core.hpp>

#include <QCoreApplication>

#include <iomanip>
#include <sstream>

namespace fingerlaunch {
namespace app {

namespace {

gesture::HandTrackerConfig trackerConfig(const CaptureConfig& capture) {
    gesture::HandTrackerConfig config;
    config.max_num_hands = capture.max_num_hands;
    config.min_detection_confidence = capture.min_detection_confidence;
    config.min_tracking_confidence = capture.min_tracking_confidence;
    return config;
}

} // anonymous namespace

GestureLauncher::GestureLauncher(const LauncherConfiguration& config, action::CapabilitySet capabilities)
    : config_(config)
    , capture_(config.capture.webcam_index)
    , tracker_(trackerConfig(config.capture))
    , dispatcher_(std::move(capabilities),
                  std::make_unique<action::ExecutableResolver>(config.program_lookup))
    , emitter_(config.gesture, config.actions, dispatcher_)
{
    if (!capture_.isOpened()) {
        FINGERLAUNCH_THROW(core::CameraException,
                           "Could not open webcam " + std::to_string(config.capture.webcam_index));
    }

    dispatcher_.setVoiceFeedback(config.feedback.voice);

    emitter_.setEventCallback([this](const gesture::GestureEvent&, bool acted) {
        ++stats_.events;
        if (acted) {
            ++stats_.dispatched;
        }
    });

    timer_.setInterval(config.capture.tick_interval_ms);
    QObject::connect(&timer_, &QTimer::timeout, [this]() {
        if (!step()) {
            stop();
            QCoreApplication::quit();
        }
    });

    FINGERLAUNCH_LOG_INFO("GestureLauncher")
        << "Webcam " << config.capture.webcam_index << " open, stable_frames="
        << config.gesture.stable_frames << ", cooldown=" << config.gesture.cooldown_seconds
        << "s, voice=" << (dispatcher_.hasSpeech() && config.feedback.voice ? "on" : "off");
}

GestureLauncher::~GestureLauncher() {
    stop();
    capture_.release();
}

void GestureLauncher::setStopCondition(std::function<bool()> condition) {
    stop_condition_ = std::move(condition);
}

void GestureLauncher::start() {
    if (running_) {
        return;
    }
    running_ = true;
    timer_.start();
    LOG_INFO("GestureLauncher: Listening for gestures (Ctrl+C to quit)");
}

void GestureLauncher::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    timer_.stop();
    logSummary();
}

bool GestureLauncher::step() {
    if (stop_condition_ && stop_condition_()) {
        LOG_INFO("GestureLauncher: Stop requested");
        return false;
    }

    cv::Mat frame;
    if (!capture_.read(frame) || frame.empty()) {
        LOG_ERROR("GestureLauncher: Failed reading frame from webcam");
        return false;
    }
    if (config_.capture.mirror_frame) {
        cv::flip(frame, frame, 1);
    }

    std::optional<gesture::HandObservation> hand;
    if (!tracker_.detect(frame, hand)) {
        ++stats_.tracker_failures;
        hand.reset();
    }

    const gesture::TickResult tick = emitter_.process(hand, gesture::Clock::now());
    ++stats_.ticks;
    if (tick.finger_state) {
        ++stats_.hand_frames;
    }

    if (stats_.ticks % kStatusInterval == 0) {
        logStatus(tick, hand ? hand->handedness : gesture::Handedness::Unknown);
    }
    return true;
}

void GestureLauncher::logStatus(const gesture::TickResult& tick, gesture::Handedness handedness) const {
    std::ostringstream oss;
    if (tick.finger_state) {
        oss << "Fingers: " << tick.finger_state->count
            << "  pattern: " << gesture::finger_vector_to_string(tick.finger_state->fingers)
            << "  hand: " << gesture::handedness_to_string(handedness);
    } else {
        oss << "No hand";
    }
    oss << "  stable: " << tick.stability.consecutive_ticks << "/" << emitter_.stability().stableFrames()
        << "  cooldown: " << std::fixed << std::setprecision(1)
        << emitter_.cooldown().remainingSeconds(gesture::Clock::now()) << "s";
    FINGERLAUNCH_LOG_DEBUG("GestureLauncher") << oss.str();
}

void GestureLauncher::logSummary() const {
    FINGERLAUNCH_LOG_INFO("GestureLauncher")
        << "Frames processed: " << stats_.ticks
        << ", with hand: " << stats_.hand_frames
        << ", tracker failures: " << stats_.tracker_failures
        << ", gestures: " << stats_.events
        << ", dispatched: " << stats_.dispatched;
}

} // namespace app
} // namespace fingerlaunch
