#include "fingerlaunch/gesture/StabilityTracker.hpp"
#include "fingerlaunch/core/exception.h"
#include <limits>

namespace fingerlaunch {
namespace gesture {

StabilityTracker::StabilityTracker(int stable_frames)
    : stable_frames_(stable_frames) {
    if (stable_frames_ < 1) {
        FINGERLAUNCH_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                                "stable_frames must be >= 1, got " + std::to_string(stable_frames));
    }
}

StabilityStatus StabilityTracker::update(std::optional<FingerCount> count) {
    if (!count) {
        reset();
        return getStatus();
    }

    if (!is_valid_finger_count(*count)) {
        FINGERLAUNCH_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                                "Finger count out of range: " + std::to_string(*count));
    }

    if (last_count_ && *last_count_ == *count) {
        // Saturate instead of overflowing on very long holds
        if (consecutive_ticks_ < std::numeric_limits<int>::max()) {
            ++consecutive_ticks_;
        }
    } else {
        last_count_ = count;
        consecutive_ticks_ = 1;
    }

    return getStatus();
}

void StabilityTracker::reset() {
    last_count_.reset();
    consecutive_ticks_ = 0;
}

bool StabilityTracker::isStable() const {
    return last_count_.has_value() && consecutive_ticks_ >= stable_frames_;
}

StabilityStatus StabilityTracker::getStatus() const {
    StabilityStatus status;
    status.last_count = last_count_;
    status.consecutive_ticks = consecutive_ticks_;
    status.is_stable = isStable();
    return status;
}

} // namespace gesture
} // namespace fingerlaunch
