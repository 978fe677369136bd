/**
 * @file StabilityTracker.hpp
 * @brief Debounce of per-tick finger counts
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_GESTURE_STABILITY_TRACKER_HPP
#define FINGERLAUNCH_GESTURE_STABILITY_TRACKER_HPP

#include <optional>
#include "GestureTypes.hpp"

namespace fingerlaunch {
namespace gesture {

/**
 * @brief Stability status after one tick
 */
struct StabilityStatus {
    std::optional<FingerCount> last_count;  ///< Count currently being held
    int consecutive_ticks = 0;              ///< Ticks the count has been held
    bool is_stable = false;                 ///< consecutive_ticks >= stable_frames
};

/**
 * @brief Tracks how long the same finger count has been observed
 *
 * Advanced exactly once per tick:
 * - no hand: reset to {none, 0}
 * - same count as before: consecutive_ticks + 1
 * - different count: last_count = count, consecutive_ticks = 1
 *
 * The counter is never reset after a trigger, so a held gesture keeps
 * reporting stable on every tick.
 *
 * Thread-safety: Not thread-safe. Owned by the single tick loop.
 */
class StabilityTracker {
public:
    /**
     * @param stable_frames Ticks required for stability (>= 1)
     * @throws core::Exception with ERROR_INVALID_PARAMETER if stable_frames < 1
     */
    explicit StabilityTracker(int stable_frames = 6);

    /**
     * @brief Advance the state machine by one tick
     *
     * @param count Finger count this tick, std::nullopt if no hand was seen
     * @throws core::Exception with ERROR_INVALID_PARAMETER if count is outside [0, 5]
     */
    StabilityStatus update(std::optional<FingerCount> count);

    /**
     * @brief Reset to {none, 0}
     */
    void reset();

    bool isStable() const;

    std::optional<FingerCount> lastCount() const { return last_count_; }

    int consecutiveTicks() const { return consecutive_ticks_; }

    int stableFrames() const { return stable_frames_; }

    StabilityStatus getStatus() const;

private:
    int stable_frames_;
    std::optional<FingerCount> last_count_;
    int consecutive_ticks_ = 0;
};

} // namespace gesture
} // namespace fingerlaunch

#endif // FINGERLAUNCH_GESTURE_STABILITY_TRACKER_HPP
