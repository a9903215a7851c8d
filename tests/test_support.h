// TripNavSim/tests/test_support.h
#ifndef TRIPNAV_TEST_SUPPORT_H
#define TRIPNAV_TEST_SUPPORT_H

#include "../common/datatypes.h"
#include "../nav_providers/position_source.h"
#include "../nav_providers/route_provider.h"
#include "../nav_route/route_model.h"
#include <cstddef>
#include <string>
#include <vector>

namespace tripnav {
namespace testing_support {

// Position source driven by the test: fixes are pushed with emitFix().
class FakePositionSource : public nav_providers::IPositionSource {
public:
    nav_providers::SubscriptionId subscribe(nav_providers::FixCallback on_fix,
                                            nav_providers::PositionErrorCallback on_error) override;
    void unsubscribe(nav_providers::SubscriptionId id) override;

    void setFailToStart(bool fail) { fail_to_start_ = fail; }

    // Delivers to the active subscriber only.
    void emitFix(const PositionFix& fix);
    void emitError(const std::string& details);
    // Delivers through the last callback even after unsubscribe, like a watch callback that
    // was already queued by the platform.
    void emitLateFix(const PositionFix& fix);

    bool isSubscribed() const { return active_id_ != nav_providers::kInvalidSubscriptionId; }
    int getSubscribeCalls() const { return subscribe_calls_; }
    int getUnsubscribeCalls() const { return unsubscribe_calls_; }

private:
    bool fail_to_start_ = false;
    nav_providers::SubscriptionId next_id_ = 1;
    nav_providers::SubscriptionId active_id_ = nav_providers::kInvalidSubscriptionId;
    nav_providers::FixCallback on_fix_;
    nav_providers::PositionErrorCallback on_error_;
    int subscribe_calls_ = 0;
    int unsubscribe_calls_ = 0;
};

// Route provider that records requests. The test completes them explicitly.
class FakeRouteProvider : public nav_providers::IRouteProvider {
public:
    struct Request {
        Coordinate origin;
        Coordinate destination;
        nav_providers::RouteCompletion completion;
    };

    void fetchRoute(const Coordinate& origin, const Coordinate& destination,
                    nav_providers::RouteCompletion completion) override;

    size_t getRequestCount() const { return requests_.size(); }
    const Request& getRequest(size_t index) const { return requests_.at(index); }
    void complete(size_t index, const nav_providers::RouteFetchResult& result);

private:
    std::vector<Request> requests_;
};

nav_providers::RouteFetchResult okResult(const nav_route::RouteResponse& response);
nav_providers::RouteFetchResult transportFailure(const std::string& details);

nav_route::Step makeStep(nav_route::ManeuverType type, const Coordinate& location,
                         double distance_m, const std::string& road_name = "",
                         nav_route::ManeuverModifier modifier = nav_route::ManeuverModifier::NONE);

// Route following the maneuver points in order: depart at the first, turn at the inner ones,
// arrive at the last. Step distances come from the planar distance between the points.
nav_route::RouteResponse routeThrough(const std::vector<Coordinate>& points);

bool sameCoordinate(const Coordinate& a, const Coordinate& b);

} // namespace testing_support
} // namespace tripnav

#endif // TRIPNAV_TEST_SUPPORT_H
