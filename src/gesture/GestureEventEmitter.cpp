/**
 * @file GestureEventEmitter.cpp
 * @brief Implementation of the per-tick gesture decision
 */

#include "fingerlaunch/gesture/GestureEventEmitter.hpp"
#include "fingerlaunch/gesture/FingerStateExtractor.hpp"
#include "fingerlaunch/core/exception.h"
#include "fingerlaunch/core/Logger.hpp"

namespace fingerlaunch {
namespace gesture {

namespace {

GestureConfig validated(const GestureConfig& config) {
    if (!config.is_valid()) {
        FINGERLAUNCH_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                                "Invalid gesture configuration (stable_frames=" +
                                std::to_string(config.stable_frames) + ", cooldown_seconds=" +
                                std::to_string(config.cooldown_seconds) + ")");
    }
    return config;
}

} // namespace

GestureEventEmitter::GestureEventEmitter(const GestureConfig& config,
                                         action::ActionMapping mapping,
                                         action::ActionDispatcher& dispatcher)
    : stability_(validated(config).stable_frames)
    , cooldown_(config.cooldown_seconds)
    , mapping_(std::move(mapping))
    , dispatcher_(dispatcher) {
}

TickResult GestureEventEmitter::process(const std::optional<HandObservation>& observation,
                                        Timestamp now) {
    if (!observation) {
        return processCount(std::nullopt, now);
    }

    FingerState state = FingerStateExtractor::extract(*observation);
    TickResult result = processCount(state.count, now);
    result.finger_state = state;
    return result;
}

TickResult GestureEventEmitter::processCount(std::optional<FingerCount> count, Timestamp now) {
    TickResult result;
    result.stability = stability_.update(count);
    if (result.stability.consecutive_ticks <= 1) {
        unmapped_reported_ = false;
    }

    if (!result.stability.is_stable || !cooldown_.allow(now)) {
        return result;
    }

    GestureEvent event;
    event.count = *result.stability.last_count;
    event.timestamp = now;
    result.event = event;

    auto it = mapping_.find(event.count);
    if (it == mapping_.end()) {
        // Unmapped counts retry every tick; report once per hold
        const auto level = unmapped_reported_ ? core::LogLevel::DEBUG : core::LogLevel::INFO;
        unmapped_reported_ = true;
        core::LogStream(level, "GestureEventEmitter")
            << "No action mapped for " << event.count << " fingers, treating as noop";
    }
    const action::ActionDescriptor descriptor = action::lookup_action(mapping_, event.count);

    result.acted = dispatcher_.dispatch(descriptor);

    if (result.acted) {
        cooldown_.record(now);
        ++acted_count_;
        FINGERLAUNCH_LOG_INFO("GestureEventEmitter")
            << event.count << " fingers -> " << action::action_kind_to_string(descriptor.kind)
            << (descriptor.parameter ? " " + *descriptor.parameter : std::string());
        dispatcher_.announce(descriptor);
    }

    if (callback_) {
        callback_(event, result.acted);
    }

    return result;
}

void GestureEventEmitter::setEventCallback(GestureEventCallback callback) {
    callback_ = std::move(callback);
}

} // namespace gesture
} // namespace fingerlaunch
