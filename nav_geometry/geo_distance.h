// TripNavSim/nav_geometry/geo_distance.h
#ifndef TRIPNAV_GEO_DISTANCE_H
#define TRIPNAV_GEO_DISTANCE_H

#include "../common/datatypes.h"

namespace tripnav {
namespace nav_geometry {

// Planar small-angle approximation: hypot(dLat, dLon) * 111000.
// Only sub-kilometer distances are evaluated, so the flat-earth error is negligible.
// The guidance thresholds in nav_constants.h assume exactly this scale.
double distanceMeters(const Coordinate& a, const Coordinate& b);

// Arithmetic mean of both coordinates (viewport centering).
Coordinate midpoint(const Coordinate& a, const Coordinate& b);

} // namespace nav_geometry
} // namespace tripnav

#endif // TRIPNAV_GEO_DISTANCE_H
