// TripNavSim/nav_scheduling/single_shot_timer.h
#ifndef TRIPNAV_SINGLE_SHOT_TIMER_H
#define TRIPNAV_SINGLE_SHOT_TIMER_H

#include "event_loop.h"

namespace tripnav {
namespace nav_scheduling {

// One cancellable timeout on an EventLoop. The handle is released when the timer fires or is
// cancelled, so a cancelled timer can never fire. Cancelling twice, or after firing, is a no-op.
class SingleShotTimer {
public:
    explicit SingleShotTimer(EventLoop& loop);
    ~SingleShotTimer();

    SingleShotTimer(const SingleShotTimer&) = delete;
    SingleShotTimer& operator=(const SingleShotTimer&) = delete;

    // Does not re-arm: returns false and keeps the original deadline if already armed.
    bool start(int64_t delay_ms, Task on_fire);
    void cancel();
    bool isArmed() const { return timer_id_ != kInvalidTimerId; }

private:
    EventLoop& loop_;
    TimerId timer_id_;
};

} // namespace nav_scheduling
} // namespace tripnav

#endif // TRIPNAV_SINGLE_SHOT_TIMER_H
