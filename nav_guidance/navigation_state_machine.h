// TripNavSim/nav_guidance/navigation_state_machine.h
#ifndef TRIPNAV_NAVIGATION_STATE_MACHINE_H
#define TRIPNAV_NAVIGATION_STATE_MACHINE_H

#include "../common/datatypes.h"
#include "../nav_providers/position_source.h"
#include "../nav_providers/route_provider.h"
#include "../nav_route/route_model.h"
#include "../nav_scheduling/event_loop.h"
#include "camera_follow_controller.h"
#include "navigation_snapshot.h"
#include "reroute_scheduler.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tripnav {
namespace nav_guidance {

// Owns the mutable state of one trip and is the only component that writes it.
//
// Every public handler must be called from the event loop thread; collaborator callbacks are
// re-posted onto the loop before they reach these handlers. Asynchronous results carry the
// trip generation (initial route) or navigation epoch (reroute, position stream) captured when
// they were requested, and are dropped once that token is superseded.
class NavigationStateMachine {
public:
    using EventListener = std::function<void(const NavigationEvent&)>;

    NavigationStateMachine(nav_scheduling::EventLoop& loop,
                           nav_providers::IPositionSource* position_source,
                           nav_providers::IRouteProvider* route_provider,
                           const Coordinate& destination,
                           EventListener listener);
    ~NavigationStateMachine();

    NavigationStateMachine(const NavigationStateMachine&) = delete;
    NavigationStateMachine& operator=(const NavigationStateMachine&) = delete;

    // --- Trip lifecycle ---
    void startTrip(bool has_initial_origin, const Coordinate& initial_origin);
    void changeDestination(const Coordinate& destination);
    void closeTrip();

    // --- Navigation commands ---
    bool beginNavigating();
    bool stopNavigating();
    void handleRecenterRequest();
    void handleManualPan();

    // --- Inputs ---
    void handlePositionFix(const PositionFix& fix);
    void handlePositionError(const std::string& details);

    // --- Queries ---
    NavigationMode getMode() const { return mode_; }
    size_t getCurrentStepIndex() const { return current_step_index_; }
    bool isRerouteInFlight() const { return reroute_in_flight_; }
    bool hasPositionSubscription() const { return position_subscription_.isActive(); }
    bool isRerouteTimerArmed() const { return reroute_scheduler_.isTimerArmed(); }
    NavigationSnapshot makeSnapshot() const;

private:
    nav_scheduling::EventLoop& loop_;
    nav_providers::IPositionSource* position_source_; // Not owned, may be null (external feed)
    nav_providers::IRouteProvider* route_provider_;   // Not owned
    EventListener listener_;

    // --- Session state ---
    NavigationMode mode_;
    Coordinate destination_;
    nav_route::RouteHandle active_route_;
    size_t current_step_index_;
    bool has_fix_;
    PositionFix last_fix_;       // Initial origin until the first streamed fix arrives
    bool has_streamed_fix_;      // Stale-fix ordering only applies between streamed fixes
    int64_t last_streamed_timestamp_ms_;
    bool reroute_in_flight_;
    bool route_loading_;
    bool initial_route_requested_;
    bool closed_;
    NavError last_error_;

    // --- Owned resources ---
    CameraFollowController camera_follow_;
    RerouteScheduler reroute_scheduler_;
    nav_providers::PositionSubscription position_subscription_;

    // --- Validity tokens ---
    uint64_t trip_generation_;
    uint64_t navigation_epoch_;
    std::shared_ptr<bool> alive_token_;

    // Internal helpers
    void requestInitialRoute(const Coordinate& origin);
    void onInitialRouteResult(uint64_t trip_generation, const nav_providers::RouteFetchResult& result);
    void onRerouteResult(uint64_t navigation_epoch, const nav_providers::RouteFetchResult& result);
    bool acquirePositionSubscription();
    void processNavigatingFix(const PositionFix& fix);
    void enterArrived(double destination_distance_m);
    void releaseNavigationResources(const char* reason);
    void applyRoute(const nav_route::RouteHandle& route);
    void clearError();
    void reportNavigationError(NavErrorCode code, const std::string& details);
    void publish(NavigationEventKind kind) const;
};

} // namespace nav_guidance
} // namespace tripnav

#endif // TRIPNAV_NAVIGATION_STATE_MACHINE_H
