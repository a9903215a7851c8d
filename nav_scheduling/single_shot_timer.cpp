// TripNavSim/nav_scheduling/single_shot_timer.cpp
#include "single_shot_timer.h"
#include "../common/logger.h"

namespace tripnav {
namespace nav_scheduling {

SingleShotTimer::SingleShotTimer(EventLoop& loop) :
    loop_(loop),
    timer_id_(kInvalidTimerId)
{
}

SingleShotTimer::~SingleShotTimer() {
    cancel();
}

bool SingleShotTimer::start(int64_t delay_ms, Task on_fire) {
    if (isArmed()) {
        TRIPNAV_LOG_DEBUG("SingleShotTimer: start() ignored, timer #%llu already armed.",
                          static_cast<unsigned long long>(timer_id_));
        return false;
    }
    timer_id_ = loop_.scheduleAfter(delay_ms, [this, on_fire]() {
        timer_id_ = kInvalidTimerId;
        if (on_fire) {
            on_fire();
        }
    });
    return true;
}

void SingleShotTimer::cancel() {
    if (!isArmed()) {
        return;
    }
    if (!loop_.cancelTimer(timer_id_)) {
        TRIPNAV_LOG_DEBUG("SingleShotTimer: timer #%llu was no longer armed on the loop.",
                          static_cast<unsigned long long>(timer_id_));
    }
    timer_id_ = kInvalidTimerId;
}

} // namespace nav_scheduling
} // namespace tripnav
