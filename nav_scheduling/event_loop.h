// TripNavSim/nav_scheduling/event_loop.h
#ifndef TRIPNAV_EVENT_LOOP_H
#define TRIPNAV_EVENT_LOOP_H

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace tripnav {
namespace nav_scheduling {

using Task = std::function<void()>;
using TimerId = uint64_t;

constexpr TimerId kInvalidTimerId = 0;

// Single ordered event queue with a monotonic millisecond clock.
//
// post() may be called from any thread (position callbacks, network completions).
// Tasks and timers execute one at a time on the thread that calls runPending()/advanceBy(),
// and each task runs to completion before the next one starts.
// The clock only moves through advanceBy(): the demo application advances it with wall time,
// tests advance it explicitly.
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // --- Queue ---
    void post(Task task);
    size_t runPending(); // Runs queued tasks (including ones they post) until empty. Returns count.
    size_t getPendingTaskCount() const;

    // --- Timers ---
    TimerId scheduleAfter(int64_t delay_ms, Task task);
    bool cancelTimer(TimerId id); // false if already fired, cancelled or unknown
    bool isTimerArmed(TimerId id) const;
    size_t getArmedTimerCount() const;

    // --- Clock ---
    int64_t nowMs() const;
    // Moves the clock forward, firing due timers in deadline order (FIFO on ties) and draining
    // the task queue after each one.
    void advanceBy(int64_t delta_ms);

private:
    mutable std::mutex mutex_;
    std::deque<Task> tasks_;
    std::map<std::pair<int64_t, TimerId>, Task> timers_; // (deadline, id) -> task
    std::map<TimerId, int64_t> timer_deadlines_;
    TimerId next_timer_id_;
    int64_t now_ms_;

    bool popDueTimer(int64_t until_ms, Task& out_task);
};

} // namespace nav_scheduling
} // namespace tripnav

#endif // TRIPNAV_EVENT_LOOP_H
