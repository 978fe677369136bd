/**
 * @file GestureEventEmitter.hpp
 * @brief Per-tick gesture decision: extraction, debounce, cooldown, dispatch
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_GESTURE_EVENT_EMITTER_HPP
#define FINGERLAUNCH_GESTURE_EVENT_EMITTER_HPP

#include <functional>
#include <optional>
#include "GestureTypes.hpp"
#include "StabilityTracker.hpp"
#include "CooldownGate.hpp"
#include <fingerlaunch/action/ActionTypes.hpp>
#include <fingerlaunch/action/ActionDispatcher.hpp>

namespace fingerlaunch {
namespace gesture {

/**
 * @brief Outcome of one tick
 */
struct TickResult {
    std::optional<FingerState> finger_state;  ///< Set by process() when a hand was seen
    StabilityStatus stability;                ///< Tracker state after this tick
    std::optional<GestureEvent> event;        ///< Set when stability and cooldown both cleared
    bool acted = false;                       ///< Dispatcher performed the action
};

/**
 * @brief Gesture event callback
 *
 * Called after every dispatch attempt with the event and whether the
 * action was performed.
 */
using GestureEventCallback = std::function<void(const GestureEvent& event, bool acted)>;

/**
 * @brief Combines StabilityTracker and CooldownGate into at most one event per tick
 *
 * On each tick: update stability with the observed count; if stable and the
 * cooldown allows it, look up the action for the held count (NoOp when
 * unmapped) and dispatch it. Only an acted dispatch records the cooldown.
 * A failed dispatch leaves both cooldown and stability untouched, so the
 * next stable tick retries immediately. A held gesture fires again each
 * time the cooldown expires.
 *
 * Thread-safety: Not thread-safe. One instance per tick loop.
 */
class GestureEventEmitter {
public:
    /**
     * @param config Debounce configuration
     * @param mapping Count to action mapping (copied, immutable afterwards)
     * @param dispatcher Action dispatcher, must outlive the emitter
     * @throws core::Exception with ERROR_INVALID_PARAMETER if config is invalid
     */
    GestureEventEmitter(const GestureConfig& config,
                        action::ActionMapping mapping,
                        action::ActionDispatcher& dispatcher);

    /**
     * @brief Process one tick from a tracker observation
     *
     * @param observation Hand seen this tick, std::nullopt if none
     * @param now Tick timestamp
     */
    TickResult process(const std::optional<HandObservation>& observation, Timestamp now);

    /**
     * @brief Process one tick from an already extracted count
     */
    TickResult processCount(std::optional<FingerCount> count, Timestamp now);

    void setEventCallback(GestureEventCallback callback);

    const StabilityTracker& stability() const { return stability_; }

    const CooldownGate& cooldown() const { return cooldown_; }

    const action::ActionMapping& mapping() const { return mapping_; }

    /**
     * @brief Number of acted dispatches so far
     */
    size_t actedCount() const { return acted_count_; }

private:
    StabilityTracker stability_;
    CooldownGate cooldown_;
    action::ActionMapping mapping_;
    action::ActionDispatcher& dispatcher_;
    GestureEventCallback callback_;
    size_t acted_count_ = 0;
    bool unmapped_reported_ = false;
};

} // namespace gesture
} // namespace fingerlaunch

#endif // FINGERLAUNCH_GESTURE_EVENT_EMITTER_HPP
