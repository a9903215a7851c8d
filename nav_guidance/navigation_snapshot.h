// TripNavSim/nav_guidance/navigation_snapshot.h
#ifndef TRIPNAV_NAVIGATION_SNAPSHOT_H
#define TRIPNAV_NAVIGATION_SNAPSHOT_H

#include "../common/datatypes.h"
#include "../nav_route/route_model.h"
#include <cstddef>
#include <string>

namespace tripnav {
namespace nav_guidance {

enum class NavigationMode {
    PREVIEW,    // Route computed (or pending), traveler not yet departing
    NAVIGATING, // Tracking live position
    ARRIVED     // Terminal for the current trip
};

enum class NavigationEventKind {
    TRIP_STARTED,
    ROUTE_UPDATED,
    NAVIGATION_STARTED,
    NAVIGATION_STOPPED,
    POSITION_UPDATED,
    STEP_ADVANCED,
    ARRIVED,
    REROUTE_STARTED,
    REROUTE_FINISHED,
    FOLLOW_CHANGED,
    ERROR_RAISED,
    TRIP_CLOSED
};

// Read-only copy of the session handed to the presentation layer.
struct NavigationSnapshot {
    bool trip_active = false;
    NavigationMode mode = NavigationMode::PREVIEW;
    Coordinate destination{0.0, 0.0};
    nav_route::RouteHandle active_route; // Shared immutable route, null if absent
    size_t current_step_index = 0;
    bool has_fix = false;
    PositionFix last_fix{{0.0, 0.0}, 0};
    bool follow_camera = false;
    bool reroute_in_flight = false;
    bool route_loading = false;
    NavError last_error = noError();

    // --- Derived guidance (negative distances mean "unknown") ---
    double distance_to_destination_m = -1.0;
    double distance_to_next_maneuver_m = -1.0;
    double remaining_route_distance_m = 0.0;
    double remaining_route_duration_s = 0.0;
    std::string current_instruction;
    std::string next_instruction;
    Coordinate viewport_center{0.0, 0.0};
};

struct NavigationEvent {
    NavigationEventKind kind;
    NavigationSnapshot snapshot;
};

const char* navigationModeToString(NavigationMode mode);
const char* navigationEventKindToString(NavigationEventKind kind);

} // namespace nav_guidance
} // namespace tripnav

#endif // TRIPNAV_NAVIGATION_SNAPSHOT_H
