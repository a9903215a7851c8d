// TripNavSim/nav_scheduling/event_loop.cpp
#include "event_loop.h"
#include "../common/logger.h"

namespace tripnav {
namespace nav_scheduling {

EventLoop::EventLoop() :
    next_timer_id_(1),
    now_ms_(0)
{
    TRIPNAV_LOG_DEBUG("EventLoop: Initializing. Clock at 0 ms.");
}

EventLoop::~EventLoop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tasks_.empty() || !timers_.empty()) {
        TRIPNAV_LOG_DEBUG("EventLoop: Shutting down with %zu queued tasks and %zu armed timers discarded.",
                          tasks_.size(), timers_.size());
    }
}

void EventLoop::post(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
}

size_t EventLoop::runPending() {
    size_t executed = 0;
    while (true) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) break;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        if (task) {
            task();
        }
        ++executed;
    }
    return executed;
}

size_t EventLoop::getPendingTaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

TimerId EventLoop::scheduleAfter(int64_t delay_ms, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (delay_ms < 0) delay_ms = 0;
    TimerId id = next_timer_id_++;
    int64_t deadline = now_ms_ + delay_ms;
    timers_.emplace(std::make_pair(deadline, id), std::move(task));
    timer_deadlines_[id] = deadline;
    TRIPNAV_LOG_VERBOSE("EventLoop: Timer #%llu armed for t=%lld ms.",
                        static_cast<unsigned long long>(id), static_cast<long long>(deadline));
    return id;
}

bool EventLoop::cancelTimer(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) {
        return false;
    }
    timers_.erase(std::make_pair(it->second, id));
    timer_deadlines_.erase(it);
    TRIPNAV_LOG_VERBOSE("EventLoop: Timer #%llu cancelled.", static_cast<unsigned long long>(id));
    return true;
}

bool EventLoop::isTimerArmed(TimerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timer_deadlines_.find(id) != timer_deadlines_.end();
}

size_t EventLoop::getArmedTimerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

int64_t EventLoop::nowMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_ms_;
}

bool EventLoop::popDueTimer(int64_t until_ms, Task& out_task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timers_.empty()) return false;
    auto first = timers_.begin();
    if (first->first.first > until_ms) return false;

    now_ms_ = first->first.first;
    timer_deadlines_.erase(first->first.second);
    out_task = std::move(first->second);
    timers_.erase(first);
    return true;
}

void EventLoop::advanceBy(int64_t delta_ms) {
    if (delta_ms < 0) {
        TRIPNAV_LOG_WARNING("EventLoop: Ignoring negative clock advance (%lld ms).", static_cast<long long>(delta_ms));
        delta_ms = 0;
    }
    int64_t target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = now_ms_ + delta_ms;
    }

    runPending();
    Task task;
    while (popDueTimer(target, task)) {
        if (task) {
            task();
        }
        runPending();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ms_ = target;
    }
    runPending();
}

} // namespace nav_scheduling
} // namespace tripnav
