// TripNavSim/nav_guidance/navigation_state_machine.cpp
#include "navigation_state_machine.h"
#include "../common/logger.h"
#include "../common/nav_constants.h"
#include "../nav_geometry/geo_distance.h"
#include "../nav_route/step_formatter.h"
#include <utility>

namespace tripnav {
namespace nav_guidance {

const char* navigationModeToString(NavigationMode mode) {
    switch (mode) {
        case NavigationMode::PREVIEW: return "PREVIEW";
        case NavigationMode::NAVIGATING: return "NAVIGATING";
        case NavigationMode::ARRIVED: return "ARRIVED";
        default: return "UNKNOWN_NAVIGATION_MODE";
    }
}

const char* navigationEventKindToString(NavigationEventKind kind) {
    switch (kind) {
        case NavigationEventKind::TRIP_STARTED: return "TRIP_STARTED";
        case NavigationEventKind::ROUTE_UPDATED: return "ROUTE_UPDATED";
        case NavigationEventKind::NAVIGATION_STARTED: return "NAVIGATION_STARTED";
        case NavigationEventKind::NAVIGATION_STOPPED: return "NAVIGATION_STOPPED";
        case NavigationEventKind::POSITION_UPDATED: return "POSITION_UPDATED";
        case NavigationEventKind::STEP_ADVANCED: return "STEP_ADVANCED";
        case NavigationEventKind::ARRIVED: return "ARRIVED";
        case NavigationEventKind::REROUTE_STARTED: return "REROUTE_STARTED";
        case NavigationEventKind::REROUTE_FINISHED: return "REROUTE_FINISHED";
        case NavigationEventKind::FOLLOW_CHANGED: return "FOLLOW_CHANGED";
        case NavigationEventKind::ERROR_RAISED: return "ERROR_RAISED";
        case NavigationEventKind::TRIP_CLOSED: return "TRIP_CLOSED";
        default: return "UNKNOWN_NAVIGATION_EVENT";
    }
}


NavigationStateMachine::NavigationStateMachine(nav_scheduling::EventLoop& loop,
                                               nav_providers::IPositionSource* position_source,
                                               nav_providers::IRouteProvider* route_provider,
                                               const Coordinate& destination,
                                               EventListener listener) :
    loop_(loop),
    position_source_(position_source),
    route_provider_(route_provider),
    listener_(std::move(listener)),
    mode_(NavigationMode::PREVIEW),
    destination_(destination),
    current_step_index_(0),
    has_fix_(false),
    last_fix_{{0.0, 0.0}, 0},
    has_streamed_fix_(false),
    last_streamed_timestamp_ms_(0),
    reroute_in_flight_(false),
    route_loading_(false),
    initial_route_requested_(false),
    closed_(false),
    last_error_(noError()),
    camera_follow_(),
    reroute_scheduler_(loop, route_provider, destination,
                       [this](uint64_t epoch, const nav_providers::RouteFetchResult& result) {
                           onRerouteResult(epoch, result);
                       }),
    position_subscription_(),
    trip_generation_(1),
    navigation_epoch_(1),
    alive_token_(std::make_shared<bool>(true))
{
    TRIPNAV_LOG_INFO("NavigationStateMachine: Initializing. Destination: (%.6f, %.6f).",
                     destination_.latitude, destination_.longitude);
}

NavigationStateMachine::~NavigationStateMachine() {
    if (!closed_) {
        releaseNavigationResources("session destroyed");
        closed_ = true;
    }
    TRIPNAV_LOG_INFO("NavigationStateMachine: Shutting down. Final mode: %s, step index: %zu.",
                     navigationModeToString(mode_), current_step_index_);
}

// --- Trip lifecycle ---

void NavigationStateMachine::startTrip(bool has_initial_origin, const Coordinate& initial_origin) {
    TRIPNAV_LOG_INFO("NavigationStateMachine: Trip started. Initial origin: %s.",
                     has_initial_origin ? "known" : "unknown (waiting for first fix)");
    if (has_initial_origin) {
        has_fix_ = true;
        last_fix_ = PositionFix{initial_origin, loop_.nowMs()};
        requestInitialRoute(initial_origin);
    }
    publish(NavigationEventKind::TRIP_STARTED);
}

void NavigationStateMachine::changeDestination(const Coordinate& destination) {
    if (closed_) {
        TRIPNAV_LOG_WARNING("NavigationStateMachine: changeDestination() on a closed trip ignored.");
        return;
    }
    TRIPNAV_LOG_INFO("NavigationStateMachine: Destination changed from (%.6f, %.6f) to (%.6f, %.6f). Mode %s -> PREVIEW.",
                     destination_.latitude, destination_.longitude,
                     destination.latitude, destination.longitude, navigationModeToString(mode_));

    releaseNavigationResources("destination change");
    ++trip_generation_;
    destination_ = destination;
    reroute_scheduler_.setDestination(destination);
    active_route_.reset();
    current_step_index_ = 0;
    mode_ = NavigationMode::PREVIEW;
    route_loading_ = false;
    initial_route_requested_ = false;
    clearError();

    if (has_fix_) {
        requestInitialRoute(last_fix_.coordinate);
    }
    publish(NavigationEventKind::TRIP_STARTED);
}

void NavigationStateMachine::closeTrip() {
    if (closed_) {
        TRIPNAV_LOG_DEBUG("NavigationStateMachine: closeTrip() on an already closed trip.");
        return;
    }
    releaseNavigationResources("trip closed");
    ++trip_generation_;
    closed_ = true;
    route_loading_ = false;
    TRIPNAV_LOG_INFO("NavigationStateMachine: Trip closed in mode %s.", navigationModeToString(mode_));
    publish(NavigationEventKind::TRIP_CLOSED);
}

// --- Route fetches ---

void NavigationStateMachine::requestInitialRoute(const Coordinate& origin) {
    initial_route_requested_ = true;
    if (route_provider_ == nullptr) {
        reportNavigationError(NavErrorCode::ROUTE_UNAVAILABLE, "No route provider configured");
        return;
    }

    route_loading_ = true;
    const uint64_t generation = trip_generation_;
    std::weak_ptr<bool> alive = alive_token_;
    nav_scheduling::EventLoop* loop = &loop_;

    TRIPNAV_LOG_INFO("NavigationStateMachine: Calculating route from (%.6f, %.6f) to (%.6f, %.6f)...",
                     origin.latitude, origin.longitude, destination_.latitude, destination_.longitude);

    route_provider_->fetchRoute(origin, destination_,
        [this, alive, loop, generation](const nav_providers::RouteFetchResult& result) {
            loop->post([this, alive, generation, result]() {
                if (!alive.lock()) {
                    return;
                }
                onInitialRouteResult(generation, result);
            });
        });
}

void NavigationStateMachine::onInitialRouteResult(uint64_t trip_generation,
                                                  const nav_providers::RouteFetchResult& result) {
    if (closed_ || trip_generation != trip_generation_) {
        TRIPNAV_LOG_INFO("NavigationStateMachine: Discarding route result of superseded trip generation %llu (current %llu).",
                         static_cast<unsigned long long>(trip_generation),
                         static_cast<unsigned long long>(trip_generation_));
        return;
    }
    route_loading_ = false;

    if (!result.transport_ok) {
        reportNavigationError(NavErrorCode::ROUTE_UNAVAILABLE, "Could not load route: " + result.transport_error);
        return;
    }

    nav_route::RouteHandle route;
    NavError build_error = noError();
    if (!nav_route::buildRouteFromResponse(result.response, route, build_error)) {
        reportNavigationError(build_error.code, build_error.details);
        return;
    }

    applyRoute(route);
    clearError();
    publish(NavigationEventKind::ROUTE_UPDATED);
}

void NavigationStateMachine::onRerouteResult(uint64_t navigation_epoch,
                                             const nav_providers::RouteFetchResult& result) {
    if (closed_ || navigation_epoch != navigation_epoch_ || mode_ != NavigationMode::NAVIGATING) {
        TRIPNAV_LOG_INFO("NavigationStateMachine: Discarding reroute result of epoch %llu (current %llu, mode %s).",
                         static_cast<unsigned long long>(navigation_epoch),
                         static_cast<unsigned long long>(navigation_epoch_), navigationModeToString(mode_));
        return;
    }
    reroute_in_flight_ = false;

    if (!result.transport_ok) {
        reportNavigationError(NavErrorCode::REROUTE_FAILED, "Could not load route: " + result.transport_error);
        publish(NavigationEventKind::REROUTE_FINISHED);
        return;
    }

    nav_route::RouteHandle route;
    NavError build_error = noError();
    if (!nav_route::buildRouteFromResponse(result.response, route, build_error)) {
        reportNavigationError(NavErrorCode::REROUTE_FAILED, build_error.details);
        publish(NavigationEventKind::REROUTE_FINISHED);
        return;
    }

    applyRoute(route);
    clearError();
    TRIPNAV_LOG_INFO("NavigationStateMachine: Route successfully recalculated.");
    publish(NavigationEventKind::ROUTE_UPDATED);
    publish(NavigationEventKind::REROUTE_FINISHED);
}

void NavigationStateMachine::applyRoute(const nav_route::RouteHandle& route) {
    active_route_ = route;
    current_step_index_ = 0;
    TRIPNAV_LOG_INFO("NavigationStateMachine: Route applied. %zu steps, %s, %s.",
                     route->getStepCount(),
                     nav_route::formatDistance(route->getTotalDistanceMeters()).c_str(),
                     nav_route::formatDuration(route->getTotalDurationSeconds()).c_str());
}

// --- Navigation commands ---

bool NavigationStateMachine::beginNavigating() {
    if (closed_) {
        TRIPNAV_LOG_WARNING("NavigationStateMachine: beginNavigating() on a closed trip ignored.");
        return false;
    }
    if (mode_ == NavigationMode::NAVIGATING) {
        TRIPNAV_LOG_DEBUG("NavigationStateMachine: Already navigating.");
        return true;
    }
    if (mode_ == NavigationMode::ARRIVED) {
        TRIPNAV_LOG_WARNING("NavigationStateMachine: Trip already arrived. Start a new trip to navigate again.");
        return false;
    }
    if (!active_route_) {
        reportNavigationError(NavErrorCode::ROUTE_UNAVAILABLE, "Cannot start navigation without a route");
        return false;
    }
    if (!has_fix_) {
        reportNavigationError(NavErrorCode::POSITION_UNAVAILABLE, "Cannot start navigation without a known position");
        return false;
    }

    ++navigation_epoch_;
    if (!acquirePositionSubscription()) {
        reportNavigationError(NavErrorCode::POSITION_UNAVAILABLE, "Position source failed to start");
        return false;
    }

    mode_ = NavigationMode::NAVIGATING;
    camera_follow_.onNavigationStarted();
    clearError();
    TRIPNAV_LOG_INFO("NavigationStateMachine: Guidance ACTIVE. Step %zu/%zu: %s.",
                     current_step_index_ + 1, active_route_->getStepCount(),
                     nav_route::formatStepInstruction(active_route_->getStep(current_step_index_)).c_str());
    publish(NavigationEventKind::NAVIGATION_STARTED);
    return true;
}

bool NavigationStateMachine::acquirePositionSubscription() {
    if (position_source_ == nullptr) {
        TRIPNAV_LOG_INFO("NavigationStateMachine: No position source attached. Expecting externally fed fixes.");
        return true;
    }

    const uint64_t epoch = navigation_epoch_;
    std::weak_ptr<bool> alive = alive_token_;
    nav_scheduling::EventLoop* loop = &loop_;

    nav_providers::SubscriptionId id = position_source_->subscribe(
        [this, alive, loop, epoch](const PositionFix& fix) {
            loop->post([this, alive, epoch, fix]() {
                if (!alive.lock() || epoch != navigation_epoch_) {
                    return;
                }
                handlePositionFix(fix);
            });
        },
        [this, alive, loop, epoch](const std::string& details) {
            loop->post([this, alive, epoch, details]() {
                if (!alive.lock() || epoch != navigation_epoch_) {
                    return;
                }
                handlePositionError(details);
            });
        });

    if (id == nav_providers::kInvalidSubscriptionId) {
        return false;
    }
    position_subscription_ = nav_providers::PositionSubscription(position_source_, id);
    TRIPNAV_LOG_DEBUG("NavigationStateMachine: Position subscription #%llu acquired.",
                      static_cast<unsigned long long>(id));
    return true;
}

bool NavigationStateMachine::stopNavigating() {
    if (mode_ != NavigationMode::NAVIGATING) {
        TRIPNAV_LOG_DEBUG("NavigationStateMachine: stopNavigating() while %s. Nothing to stop.",
                          navigationModeToString(mode_));
        return false;
    }
    releaseNavigationResources("navigation stopped");
    mode_ = NavigationMode::PREVIEW;
    camera_follow_.onNavigationStopped();
    TRIPNAV_LOG_INFO("NavigationStateMachine: Navigation stopped. Route kept, mode PREVIEW.");
    publish(NavigationEventKind::NAVIGATION_STOPPED);
    return true;
}

void NavigationStateMachine::handleRecenterRequest() {
    if (camera_follow_.onRecenterRequested()) {
        publish(NavigationEventKind::FOLLOW_CHANGED);
    }
}

void NavigationStateMachine::handleManualPan() {
    if (camera_follow_.onManualPan()) {
        publish(NavigationEventKind::FOLLOW_CHANGED);
    }
}

// --- Inputs ---

void NavigationStateMachine::handlePositionFix(const PositionFix& fix) {
    if (closed_) {
        return;
    }
    if (has_streamed_fix_ && fix.timestamp_ms < last_streamed_timestamp_ms_) {
        TRIPNAV_LOG_WARNING("NavigationStateMachine: Stale fix (t=%lld ms, last t=%lld ms) discarded.",
                            static_cast<long long>(fix.timestamp_ms),
                            static_cast<long long>(last_streamed_timestamp_ms_));
        return;
    }
    has_streamed_fix_ = true;
    last_streamed_timestamp_ms_ = fix.timestamp_ms;
    has_fix_ = true;
    last_fix_ = fix;

    TRIPNAV_LOG_VERBOSE("NavigationStateMachine: Fix (%.6f, %.6f) at t=%lld ms in mode %s.",
                        fix.coordinate.latitude, fix.coordinate.longitude,
                        static_cast<long long>(fix.timestamp_ms), navigationModeToString(mode_));

    if (mode_ == NavigationMode::NAVIGATING) {
        processNavigatingFix(fix);
        return;
    }

    if (mode_ == NavigationMode::PREVIEW && !active_route_ && !route_loading_ && !initial_route_requested_) {
        TRIPNAV_LOG_INFO("NavigationStateMachine: First position known. Requesting route.");
        requestInitialRoute(fix.coordinate);
    }
    publish(NavigationEventKind::POSITION_UPDATED);
}

void NavigationStateMachine::handlePositionError(const std::string& details) {
    reportNavigationError(NavErrorCode::POSITION_UNAVAILABLE, "Position source error: " + details);
}

void NavigationStateMachine::processNavigatingFix(const PositionFix& fix) {
    const Coordinate& position = fix.coordinate;

    // 1. Arrival wins over everything else on this fix.
    double destination_distance = nav_geometry::distanceMeters(position, destination_);
    if (destination_distance < constants::kArrivalRadiusMeters) {
        enterArrived(destination_distance);
        return;
    }

    if (!active_route_) {
        TRIPNAV_LOG_WARNING("NavigationStateMachine: Navigating without an active route. Fix ignored.");
        publish(NavigationEventKind::POSITION_UPDATED);
        return;
    }

    const auto& steps = active_route_->getSteps();
    const size_t current_index = current_step_index_;

    // 2. Advance at most one step per fix.
    bool step_advanced = false;
    if (current_index + 1 < steps.size()) {
        double next_distance = nav_geometry::distanceMeters(position, steps[current_index + 1].maneuver.location);
        if (next_distance < constants::kStepAdvanceRadiusMeters) {
            current_step_index_ = current_index + 1;
            step_advanced = true;
            TRIPNAV_LOG_INFO("NavigationStateMachine: Maneuver reached (%.1f m). Step %zu/%zu: %s.",
                             next_distance, current_step_index_ + 1, steps.size(),
                             nav_route::formatStepInstruction(steps[current_step_index_]).c_str());
        }
    }

    // 3. Off-route check against the step that was current when the fix arrived.
    bool reroute_started = false;
    if (!reroute_in_flight_) {
        double off_route_distance = nav_geometry::distanceMeters(position, steps[current_index].maneuver.location);
        if (off_route_distance > constants::kOffRouteDistanceMeters) {
            TRIPNAV_LOG_WARNING("NavigationStateMachine: OFF ROUTE detected! %.1f m from current maneuver. Rerouting...",
                                off_route_distance);
            if (reroute_scheduler_.requestReroute(position, navigation_epoch_)) {
                reroute_in_flight_ = true;
                reroute_started = true;
            }
        }
    }

    publish(NavigationEventKind::POSITION_UPDATED);
    if (step_advanced) {
        publish(NavigationEventKind::STEP_ADVANCED);
    }
    if (reroute_started) {
        publish(NavigationEventKind::REROUTE_STARTED);
    }
}

void NavigationStateMachine::enterArrived(double destination_distance_m) {
    releaseNavigationResources("destination reached");
    mode_ = NavigationMode::ARRIVED;
    TRIPNAV_LOG_INFO("NavigationStateMachine: DESTINATION REACHED (%.1f m away).", destination_distance_m);
    publish(NavigationEventKind::ARRIVED);
}

void NavigationStateMachine::releaseNavigationResources(const char* reason) {
    TRIPNAV_LOG_DEBUG("NavigationStateMachine: Releasing navigation resources (%s). Subscription: %s, reroute timer: %s.",
                      reason,
                      position_subscription_.isActive() ? "active" : "none",
                      reroute_scheduler_.isTimerArmed() ? "armed" : "idle");
    position_subscription_.release();
    reroute_scheduler_.cancel();
    reroute_in_flight_ = false;
    ++navigation_epoch_;
}

// --- Errors & notifications ---

void NavigationStateMachine::clearError() {
    if (last_error_.isSet()) {
        TRIPNAV_LOG_DEBUG("NavigationStateMachine: Clearing last error (%s).",
                          navErrorCodeToString(last_error_.code));
        last_error_ = noError();
    }
}

void NavigationStateMachine::reportNavigationError(NavErrorCode code, const std::string& details) {
    last_error_ = NavError{code, details};
    TRIPNAV_LOG_ERROR("NavigationStateMachine: Navigation Error (%s): %s",
                      navErrorCodeToString(code), details.c_str());
    publish(NavigationEventKind::ERROR_RAISED);
}

NavigationSnapshot NavigationStateMachine::makeSnapshot() const {
    NavigationSnapshot snapshot;
    snapshot.trip_active = !closed_;
    snapshot.mode = mode_;
    snapshot.destination = destination_;
    snapshot.active_route = active_route_;
    snapshot.current_step_index = current_step_index_;
    snapshot.has_fix = has_fix_;
    snapshot.last_fix = last_fix_;
    snapshot.follow_camera = camera_follow_.isFollowing();
    snapshot.reroute_in_flight = reroute_in_flight_;
    snapshot.route_loading = route_loading_;
    snapshot.last_error = last_error_;

    if (has_fix_) {
        snapshot.distance_to_destination_m = nav_geometry::distanceMeters(last_fix_.coordinate, destination_);
    }
    if (active_route_ && current_step_index_ < active_route_->getStepCount()) {
        const auto& steps = active_route_->getSteps();
        snapshot.remaining_route_distance_m = active_route_->remainingDistanceMeters(current_step_index_);
        snapshot.remaining_route_duration_s = active_route_->remainingDurationSeconds(current_step_index_);
        snapshot.current_instruction = nav_route::formatStepInstruction(steps[current_step_index_]);
        if (current_step_index_ + 1 < steps.size()) {
            snapshot.next_instruction = nav_route::formatStepInstruction(steps[current_step_index_ + 1]);
            if (has_fix_) {
                snapshot.distance_to_next_maneuver_m = nav_geometry::distanceMeters(
                    last_fix_.coordinate, steps[current_step_index_ + 1].maneuver.location);
            }
        } else if (has_fix_) {
            snapshot.distance_to_next_maneuver_m = snapshot.distance_to_destination_m;
        }
    }
    snapshot.viewport_center = CameraFollowController::viewportCenter(
        mode_, has_fix_, last_fix_.coordinate, destination_);
    return snapshot;
}

void NavigationStateMachine::publish(NavigationEventKind kind) const {
    TRIPNAV_LOG_VERBOSE("NavigationStateMachine: Event %s.", navigationEventKindToString(kind));
    if (listener_) {
        listener_(NavigationEvent{kind, makeSnapshot()});
    }
}

} // namespace nav_guidance
} // namespace tripnav
