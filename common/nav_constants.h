// TripNavSim/common/nav_constants.h
#ifndef TRIPNAV_NAV_CONSTANTS_H
#define TRIPNAV_NAV_CONSTANTS_H

#include <cstdint>

namespace tripnav {
namespace constants {

// Degrees-to-meters scale applied to both latitude and longitude deltas.
constexpr double kMetersPerDegree = 111000.0;

// Guidance thresholds. These are tuned against kMetersPerDegree and are not per-route settings.
constexpr double kArrivalRadiusMeters = 25.0;
constexpr double kStepAdvanceRadiusMeters = 35.0;
constexpr double kOffRouteDistanceMeters = 120.0;
constexpr int64_t kRerouteDebounceMs = 1500;

} // namespace constants
} // namespace tripnav

#endif // TRIPNAV_NAV_CONSTANTS_H
