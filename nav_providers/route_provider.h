// TripNavSim/nav_providers/route_provider.h
#ifndef TRIPNAV_ROUTE_PROVIDER_H
#define TRIPNAV_ROUTE_PROVIDER_H

#include "../common/datatypes.h"
#include "../nav_route/route_model.h"
#include <functional>
#include <string>

namespace tripnav {
namespace nav_providers {

// Raw outcome of one fetch. transport_ok == false covers network and parse failures;
// otherwise the response still has to pass nav_route::buildRouteFromResponse().
struct RouteFetchResult {
    bool transport_ok;
    std::string transport_error;
    nav_route::RouteResponse response;
};

using RouteCompletion = std::function<void(const RouteFetchResult&)>;

class IRouteProvider {
public:
    virtual ~IRouteProvider() = default;

    // Asynchronous. completion is invoked exactly once, possibly on another thread.
    virtual void fetchRoute(const Coordinate& origin, const Coordinate& destination,
                            RouteCompletion completion) = 0;
};

} // namespace nav_providers
} // namespace tripnav

#endif // TRIPNAV_ROUTE_PROVIDER_H
