// TripNavSim/nav_route/step_formatter.h
#ifndef TRIPNAV_STEP_FORMATTER_H
#define TRIPNAV_STEP_FORMATTER_H

#include "route_model.h"
#include <string>

namespace tripnav {
namespace nav_route {

// "Start on Main St", "Slight left onto Oak Ave", "Continue", "Arrive at destination"
std::string formatStepInstruction(const Step& step);

// "350 m" below one kilometer, "1.2 km" above.
std::string formatDistance(double meters);

// "12 min" below one hour, "1h 5m" above.
std::string formatDuration(double seconds);

} // namespace nav_route
} // namespace tripnav

#endif // TRIPNAV_STEP_FORMATTER_H
