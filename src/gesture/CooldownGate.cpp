#include "fingerlaunch/gesture/CooldownGate.hpp"
#include "fingerlaunch/core/exception.h"
#include <algorithm>
#include <cmath>

namespace fingerlaunch {
namespace gesture {

CooldownGate::CooldownGate(double cooldown_seconds)
    : cooldown_seconds_(cooldown_seconds) {
    if (!std::isfinite(cooldown_seconds_) || cooldown_seconds_ < 0.0) {
        FINGERLAUNCH_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                                "cooldown_seconds must be a finite value >= 0, got " +
                                std::to_string(cooldown_seconds));
    }
}

bool CooldownGate::allow(Timestamp now) const {
    if (!last_trigger_time_) {
        return true;
    }
    const double elapsed = Seconds(now - *last_trigger_time_).count();
    return elapsed >= cooldown_seconds_;
}

void CooldownGate::record(Timestamp now) {
    last_trigger_time_ = now;
}

double CooldownGate::remainingSeconds(Timestamp now) const {
    if (!last_trigger_time_) {
        return 0.0;
    }
    const double elapsed = Seconds(now - *last_trigger_time_).count();
    return std::max(0.0, cooldown_seconds_ - elapsed);
}

void CooldownGate::reset() {
    last_trigger_time_.reset();
}

} // namespace gesture
} // namespace fingerlaunch
