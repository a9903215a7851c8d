// TripNavSim/main_application/trip_simulator.h
#ifndef TRIPNAV_TRIP_SIMULATOR_H
#define TRIPNAV_TRIP_SIMULATOR_H

#include "trip_sim_config.h"
#include "../common/datatypes.h"
#include "../nav_guidance/navigation_snapshot.h"
#include "../nav_route/route_model.h"
#include "../nav_scheduling/event_loop.h"
#include "../nav_session/navigation_session_facade.h"
#include "../nav_simulation/simulated_position_source.h"
#include "../nav_simulation/simulated_route_provider.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace main_application {

// Plays one trip end to end: plans the route, departs, follows (or misses) the turns and
// stops at arrival or when the simulated time runs out.
class TripSimulator {
public:
    explicit TripSimulator(const TripSimConfig& config);
    ~TripSimulator();

    TripSimulator(const TripSimulator&) = delete;
    TripSimulator& operator=(const TripSimulator&) = delete;

    // Returns true when the traveler arrived.
    bool runTrip();

    bool hasArrived() const { return arrived_; }
    int getRoutesReceived() const { return routes_received_; }
    int getReroutesStarted() const { return reroutes_started_; }
    int getRerouteFailures() const { return reroute_failures_; }
    int64_t getElapsedMs() const { return loop_.nowMs(); }
    tripnav::nav_guidance::NavigationSnapshot getFinalSnapshot() const { return facade_->currentSnapshot(); }

private:
    TripSimConfig config_;
    tripnav::nav_scheduling::EventLoop loop_;
    std::unique_ptr<tripnav::nav_simulation::SimulatedRouteProvider> route_provider_;
    std::unique_ptr<tripnav::nav_simulation::SimulatedPositionSource> position_source_;
    std::unique_ptr<tripnav::nav_session::NavigationSessionFacade> facade_; // Declared last, destroyed first

    bool arrived_;
    bool turn_miss_pending_;
    int routes_received_;
    int reroutes_started_;
    int reroute_failures_;

    void onNavigationEvent(const tripnav::nav_guidance::NavigationEvent& event);
    void steerAlongRoute(const tripnav::nav_route::RouteHandle& route);
    bool advanceUntil(const std::function<bool()>& done, int64_t deadline_ms);
    void printGuidance(const tripnav::nav_guidance::NavigationSnapshot& snapshot) const;
};

} // namespace main_application

#endif // TRIPNAV_TRIP_SIMULATOR_H
