// TripNavSim/nav_simulation/simulated_route_provider.h
#ifndef TRIPNAV_SIMULATED_ROUTE_PROVIDER_H
#define TRIPNAV_SIMULATED_ROUTE_PROVIDER_H

#include "../common/datatypes.h"
#include "../nav_providers/route_provider.h"
#include "../nav_route/route_model.h"
#include "../nav_scheduling/event_loop.h"
#include <cstdint>
#include <string>

namespace tripnav {
namespace nav_simulation {

// Street-grid router: drives along the origin's latitude first, then turns onto the
// destination's longitude. Completions are delivered after a fixed latency on the event loop.
class SimulatedRouteProvider : public nav_providers::IRouteProvider {
public:
    SimulatedRouteProvider(nav_scheduling::EventLoop& loop, int64_t latency_ms, double speed_mps);
    ~SimulatedRouteProvider() override;

    void fetchRoute(const Coordinate& origin, const Coordinate& destination,
                    nav_providers::RouteCompletion completion) override;

    // --- Failure injection ---
    void failNextFetches(int count) { transport_failures_remaining_ = count; }
    void returnNoRouteOnNextFetches(int count) { empty_responses_remaining_ = count; }

    int getFetchCount() const { return fetch_count_; }

    // Exposed for the simulator, which steers the traveler along the same grid.
    static Coordinate cornerPoint(const Coordinate& origin, const Coordinate& destination);
    nav_route::RouteResponse buildGridResponse(const Coordinate& origin, const Coordinate& destination) const;

private:
    nav_scheduling::EventLoop& loop_;
    int64_t latency_ms_;
    double speed_mps_;
    int transport_failures_remaining_;
    int empty_responses_remaining_;
    int fetch_count_;

    nav_route::ManeuverModifier turnDirection(const Coordinate& origin, const Coordinate& destination) const;
};

} // namespace nav_simulation
} // namespace tripnav

#endif // TRIPNAV_SIMULATED_ROUTE_PROVIDER_H
