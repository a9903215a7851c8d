// TripNavSim/nav_guidance/reroute_scheduler.h
#ifndef TRIPNAV_REROUTE_SCHEDULER_H
#define TRIPNAV_REROUTE_SCHEDULER_H

#include "../common/datatypes.h"
#include "../nav_providers/route_provider.h"
#include "../nav_scheduling/event_loop.h"
#include "../nav_scheduling/single_shot_timer.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace tripnav {
namespace nav_guidance {

// Debounces off-route triggers into at most one route-provider call at a time.
//
// A cycle starts at requestReroute(): it is marked in flight immediately, the debounce timer
// is armed once, and when it fires the fetch is issued with the origin captured at arm time.
// Further requests are no-ops until the cycle's result has been delivered or cancel() is called.
// Results are delivered on the event loop together with the validity token given at request
// time; the owner decides whether the token is still current.
class RerouteScheduler {
public:
    using ResultHandler = std::function<void(uint64_t validity_token,
                                             const nav_providers::RouteFetchResult& result)>;

    RerouteScheduler(nav_scheduling::EventLoop& loop,
                     nav_providers::IRouteProvider* route_provider,
                     const Coordinate& destination,
                     ResultHandler on_result);
    ~RerouteScheduler();

    RerouteScheduler(const RerouteScheduler&) = delete;
    RerouteScheduler& operator=(const RerouteScheduler&) = delete;

    // Returns false (no-op) when a cycle is already in flight.
    bool requestReroute(const Coordinate& origin, uint64_t validity_token);

    // Cancels an armed timer and abandons an issued fetch. Idempotent.
    void cancel();

    void setDestination(const Coordinate& destination);

    bool isInFlight() const { return cycle_in_flight_; }
    bool isTimerArmed() const { return debounce_timer_.isArmed(); }
    bool isFetchOutstanding() const { return fetch_outstanding_; }
    uint64_t getFetchesIssued() const { return fetches_issued_; }

private:
    nav_scheduling::EventLoop& loop_;
    nav_providers::IRouteProvider* route_provider_; // Not owned
    Coordinate destination_;
    ResultHandler on_result_;
    nav_scheduling::SingleShotTimer debounce_timer_;

    bool cycle_in_flight_;
    bool fetch_outstanding_;
    uint64_t cycle_id_;
    uint64_t fetches_issued_;
    std::shared_ptr<bool> alive_token_; // Guards provider completions that outlive this object

    void issueFetch(const Coordinate& origin, uint64_t validity_token, uint64_t cycle_id);
    void onFetchCompleted(uint64_t cycle_id, uint64_t validity_token,
                          const nav_providers::RouteFetchResult& result);
};

} // namespace nav_guidance
} // namespace tripnav

#endif // TRIPNAV_REROUTE_SCHEDULER_H
