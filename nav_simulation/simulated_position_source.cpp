// TripNavSim/nav_simulation/simulated_position_source.cpp
#include "simulated_position_source.h"
#include "../common/logger.h"
#include "../nav_geometry/geo_distance.h"
#include <utility>

namespace tripnav {
namespace nav_simulation {

SimulatedPositionSource::SimulatedPositionSource(nav_scheduling::EventLoop& loop, int64_t fix_interval_ms, double speed_mps) :
    loop_(loop),
    fix_interval_ms_(fix_interval_ms > 0 ? fix_interval_ms : 1000),
    speed_mps_(speed_mps),
    fail_to_start_(false),
    segment_index_(0),
    segment_progress_m_(0.0),
    current_position_{0.0, 0.0},
    next_id_(1),
    active_id_(nav_providers::kInvalidSubscriptionId),
    tick_timer_(loop),
    fixes_emitted_(0)
{
    TRIPNAV_LOG_INFO("SimulatedPositionSource: Initializing. Fix interval: %lld ms, speed: %.1f m/s.",
                     static_cast<long long>(fix_interval_ms_), speed_mps_);
}

SimulatedPositionSource::~SimulatedPositionSource() {
    tick_timer_.cancel();
    TRIPNAV_LOG_INFO("SimulatedPositionSource: Shutting down. Fixes emitted: %d.", fixes_emitted_);
}

nav_providers::SubscriptionId SimulatedPositionSource::subscribe(nav_providers::FixCallback on_fix,
                                                                 nav_providers::PositionErrorCallback on_error) {
    if (fail_to_start_) {
        TRIPNAV_LOG_ERROR("SimulatedPositionSource: GPS receiver failed to start (simulated).");
        return nav_providers::kInvalidSubscriptionId;
    }
    if (hasSubscriber()) {
        TRIPNAV_LOG_WARNING("SimulatedPositionSource: Replacing subscriber #%llu.",
                            static_cast<unsigned long long>(active_id_));
        tick_timer_.cancel();
    }
    active_id_ = next_id_++;
    on_fix_ = std::move(on_fix);
    on_error_ = std::move(on_error);
    if (!tick_timer_.start(fix_interval_ms_, [this]() { onTick(); })) {
        TRIPNAV_LOG_WARNING("SimulatedPositionSource: Tick timer already running.");
    }
    TRIPNAV_LOG_INFO("SimulatedPositionSource: Subscriber #%llu attached.", static_cast<unsigned long long>(active_id_));
    return active_id_;
}

void SimulatedPositionSource::unsubscribe(nav_providers::SubscriptionId id) {
    if (id != active_id_ || !hasSubscriber()) {
        TRIPNAV_LOG_DEBUG("SimulatedPositionSource: unsubscribe(#%llu) for an inactive subscriber.",
                          static_cast<unsigned long long>(id));
        return;
    }
    tick_timer_.cancel();
    active_id_ = nav_providers::kInvalidSubscriptionId;
    on_fix_ = nullptr;
    on_error_ = nullptr;
    TRIPNAV_LOG_INFO("SimulatedPositionSource: Subscriber #%llu detached.", static_cast<unsigned long long>(id));
}

void SimulatedPositionSource::setPath(const std::vector<Coordinate>& path) {
    path_ = path;
    segment_index_ = 0;
    segment_progress_m_ = 0.0;
    if (!path_.empty()) {
        current_position_ = path_.front();
    }
    TRIPNAV_LOG_DEBUG("SimulatedPositionSource: New path with %zu points.", path_.size());
}

void SimulatedPositionSource::injectError(const std::string& details) {
    if (!hasSubscriber() || !on_error_) {
        return;
    }
    TRIPNAV_LOG_WARNING("SimulatedPositionSource: Reporting error: %s", details.c_str());
    on_error_(details);
}

void SimulatedPositionSource::onTick() {
    if (!hasSubscriber()) {
        return;
    }
    moveAlongPath(speed_mps_ * static_cast<double>(fix_interval_ms_) / 1000.0);
    ++fixes_emitted_;
    PositionFix fix{current_position_, loop_.nowMs()};
    TRIPNAV_LOG_VERBOSE("SimulatedPositionSource: Fix #%d (%.6f, %.6f).",
                        fixes_emitted_, fix.coordinate.latitude, fix.coordinate.longitude);
    if (on_fix_) {
        on_fix_(fix);
    }
    if (hasSubscriber() && !tick_timer_.start(fix_interval_ms_, [this]() { onTick(); })) {
        TRIPNAV_LOG_WARNING("SimulatedPositionSource: Tick timer re-armed by the subscriber callback.");
    }
}

void SimulatedPositionSource::moveAlongPath(double distance_m) {
    while (distance_m > 0.0 && segment_index_ + 1 < path_.size()) {
        const Coordinate& from = path_[segment_index_];
        const Coordinate& to = path_[segment_index_ + 1];
        double segment_length = nav_geometry::distanceMeters(from, to);
        double left_on_segment = segment_length - segment_progress_m_;
        if (distance_m < left_on_segment) {
            segment_progress_m_ += distance_m;
            double ratio = segment_length > 0.0 ? segment_progress_m_ / segment_length : 1.0;
            current_position_ = Coordinate{from.latitude + (to.latitude - from.latitude) * ratio,
                                           from.longitude + (to.longitude - from.longitude) * ratio};
            return;
        }
        distance_m -= left_on_segment;
        ++segment_index_;
        segment_progress_m_ = 0.0;
        current_position_ = to;
    }
}

} // namespace nav_simulation
} // namespace tripnav
