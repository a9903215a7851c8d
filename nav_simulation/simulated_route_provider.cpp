// TripNavSim/nav_simulation/simulated_route_provider.cpp
#include "simulated_route_provider.h"
#include "../common/logger.h"
#include "../nav_geometry/geo_distance.h"
#include <utility>

namespace tripnav {
namespace nav_simulation {

using nav_route::ManeuverModifier;
using nav_route::ManeuverType;
using nav_route::Step;

namespace {

// Below this a grid leg is treated as absent and the route becomes a single straight leg.
constexpr double kMinimumLegMeters = 1.0;

} // namespace

SimulatedRouteProvider::SimulatedRouteProvider(nav_scheduling::EventLoop& loop, int64_t latency_ms, double speed_mps) :
    loop_(loop),
    latency_ms_(latency_ms),
    speed_mps_(speed_mps > 0.0 ? speed_mps : 8.3),
    transport_failures_remaining_(0),
    empty_responses_remaining_(0),
    fetch_count_(0)
{
    TRIPNAV_LOG_INFO("SimulatedRouteProvider: Initializing. Latency: %lld ms, speed: %.1f m/s.",
                     static_cast<long long>(latency_ms_), speed_mps_);
}

SimulatedRouteProvider::~SimulatedRouteProvider() {
    TRIPNAV_LOG_INFO("SimulatedRouteProvider: Shutting down after %d fetches.", fetch_count_);
}

Coordinate SimulatedRouteProvider::cornerPoint(const Coordinate& origin, const Coordinate& destination) {
    return Coordinate{origin.latitude, destination.longitude};
}

ManeuverModifier SimulatedRouteProvider::turnDirection(const Coordinate& origin, const Coordinate& destination) const {
    bool heading_east = destination.longitude > origin.longitude;
    bool turning_north = destination.latitude > origin.latitude;
    if (heading_east) {
        return turning_north ? ManeuverModifier::LEFT : ManeuverModifier::RIGHT;
    }
    return turning_north ? ManeuverModifier::RIGHT : ManeuverModifier::LEFT;
}

nav_route::RouteResponse SimulatedRouteProvider::buildGridResponse(const Coordinate& origin,
                                                                  const Coordinate& destination) const {
    nav_route::RouteCandidate candidate;
    Coordinate corner = cornerPoint(origin, destination);
    double first_leg = nav_geometry::distanceMeters(origin, corner);
    double second_leg = nav_geometry::distanceMeters(corner, destination);

    if (first_leg < kMinimumLegMeters || second_leg < kMinimumLegMeters) {
        double leg = nav_geometry::distanceMeters(origin, destination);
        candidate.geometry = {origin, destination};
        candidate.steps.push_back(Step{leg, leg / speed_mps_, "Grid Avenue",
                                       {ManeuverType::DEPART, ManeuverModifier::NONE, origin}});
    } else {
        candidate.geometry = {origin, corner, destination};
        candidate.steps.push_back(Step{first_leg, first_leg / speed_mps_, "Origin Street",
                                       {ManeuverType::DEPART, ManeuverModifier::NONE, origin}});
        candidate.steps.push_back(Step{second_leg, second_leg / speed_mps_, "Destination Avenue",
                                       {ManeuverType::TURN, turnDirection(origin, destination), corner}});
    }
    candidate.steps.push_back(Step{0.0, 0.0, "", {ManeuverType::ARRIVE, ManeuverModifier::NONE, destination}});

    candidate.distance_m = 0.0;
    candidate.duration_s = 0.0;
    for (const auto& step : candidate.steps) {
        candidate.distance_m += step.distance_m;
        candidate.duration_s += step.duration_s;
    }

    nav_route::RouteResponse response;
    response.routes.push_back(candidate);
    return response;
}

void SimulatedRouteProvider::fetchRoute(const Coordinate& origin, const Coordinate& destination,
                                        nav_providers::RouteCompletion completion) {
    ++fetch_count_;
    TRIPNAV_LOG_INFO("SimulatedRouteProvider: Fetch #%d from (%.6f, %.6f) to (%.6f, %.6f). Reply in %lld ms.",
                     fetch_count_, origin.latitude, origin.longitude,
                     destination.latitude, destination.longitude, static_cast<long long>(latency_ms_));

    nav_providers::RouteFetchResult result{true, "", nav_route::RouteResponse{}};
    if (transport_failures_remaining_ > 0) {
        --transport_failures_remaining_;
        result.transport_ok = false;
        result.transport_error = "simulated network timeout";
        TRIPNAV_LOG_WARNING("SimulatedRouteProvider: Fetch #%d will fail (injected transport error).", fetch_count_);
    } else if (empty_responses_remaining_ > 0) {
        --empty_responses_remaining_;
        TRIPNAV_LOG_WARNING("SimulatedRouteProvider: Fetch #%d will return zero routes (injected).", fetch_count_);
    } else {
        result.response = buildGridResponse(origin, destination);
    }

    loop_.scheduleAfter(latency_ms_, [completion, result]() {
        if (completion) {
            completion(result);
        }
    });
}

} // namespace nav_simulation
} // namespace tripnav
