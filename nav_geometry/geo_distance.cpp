// TripNavSim/nav_geometry/geo_distance.cpp
#include "geo_distance.h"
#include "../common/nav_constants.h"
#include <cmath>

namespace tripnav {
namespace nav_geometry {

double distanceMeters(const Coordinate& a, const Coordinate& b) {
    double lat_diff = a.latitude - b.latitude;
    double lon_diff = a.longitude - b.longitude;
    return std::hypot(lat_diff, lon_diff) * constants::kMetersPerDegree;
}

Coordinate midpoint(const Coordinate& a, const Coordinate& b) {
    return Coordinate{(a.latitude + b.latitude) / 2.0, (a.longitude + b.longitude) / 2.0};
}

} // namespace nav_geometry
} // namespace tripnav
