/**
 * @file CooldownGate.hpp
 * @brief Minimum interval between two acted gestures
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_GESTURE_COOLDOWN_GATE_HPP
#define FINGERLAUNCH_GESTURE_COOLDOWN_GATE_HPP

#include <optional>
#include "GestureTypes.hpp"

namespace fingerlaunch {
namespace gesture {

/**
 * @brief Purely time-based trigger gate
 *
 * allow(now) is true iff now - last_trigger >= cooldown. Before the first
 * record() the last trigger is treated as -infinity and allow() is always
 * true. record() must only follow a dispatch the action layer reported as
 * acted; a stable but undispatchable gesture never consumes the window.
 */
class CooldownGate {
public:
    /**
     * @param cooldown_seconds Minimum interval in seconds (>= 0)
     * @throws core::Exception with ERROR_INVALID_PARAMETER if negative or not finite
     */
    explicit CooldownGate(double cooldown_seconds = 3.0);

    bool allow(Timestamp now) const;

    /**
     * @brief Remember an acted dispatch at time now
     */
    void record(Timestamp now);

    /**
     * @brief Seconds left before allow() turns true, 0 when open
     */
    double remainingSeconds(Timestamp now) const;

    std::optional<Timestamp> lastTriggerTime() const { return last_trigger_time_; }

    double cooldownSeconds() const { return cooldown_seconds_; }

    /**
     * @brief Forget the last trigger (gate opens immediately)
     */
    void reset();

private:
    double cooldown_seconds_;
    std::optional<Timestamp> last_trigger_time_;
};

} // namespace gesture
} // namespace fingerlaunch

#endif // FINGERLAUNCH_GESTURE_COOLDOWN_GATE_HPP
