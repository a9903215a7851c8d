// TripNavSim/nav_route/route_model.h
#ifndef TRIPNAV_ROUTE_MODEL_H
#define TRIPNAV_ROUTE_MODEL_H

#include "../common/datatypes.h"
#include <memory>
#include <string>
#include <vector>

namespace tripnav {
namespace nav_route {

enum class ManeuverType {
    DEPART,
    ARRIVE,
    TURN,
    NEW_NAME,
    CONTINUE,
    MERGE,
    ON_RAMP,
    OFF_RAMP,
    FORK,
    END_OF_ROAD,
    ROUNDABOUT,
    ROTARY,
    NOTIFICATION,
    UNKNOWN
};

enum class ManeuverModifier {
    NONE,
    UTURN,
    SHARP_RIGHT,
    RIGHT,
    SLIGHT_RIGHT,
    STRAIGHT,
    SLIGHT_LEFT,
    LEFT,
    SHARP_LEFT
};

struct Maneuver {
    ManeuverType type;
    ManeuverModifier modifier;
    Coordinate location;
};

// One maneuver and the leg that follows it up to the next maneuver.
struct Step {
    double distance_m;
    double duration_s;
    std::string road_name; // May be empty
    Maneuver maneuver;
};

// Immutable once constructed. The active route is replaced by swapping the whole object.
class Route {
public:
    Route(double total_distance_m, double total_duration_s,
          std::vector<Coordinate> geometry, std::vector<Step> steps);

    double getTotalDistanceMeters() const { return total_distance_m_; }
    double getTotalDurationSeconds() const { return total_duration_s_; }
    const std::vector<Coordinate>& getGeometry() const { return geometry_; }
    const std::vector<Step>& getSteps() const { return steps_; }
    size_t getStepCount() const { return steps_.size(); }
    const Step& getStep(size_t index) const { return steps_.at(index); }

    // Sum over steps[from_index..last]. Returns 0 when from_index is past the end.
    double remainingDistanceMeters(size_t from_index) const;
    double remainingDurationSeconds(size_t from_index) const;

private:
    const double total_distance_m_;
    const double total_duration_s_;
    const std::vector<Coordinate> geometry_;
    const std::vector<Step> steps_;
};

using RouteHandle = std::shared_ptr<const Route>;

// --- Provider payload (before validation) ---
struct RouteCandidate {
    double distance_m;
    double duration_s;
    std::vector<Coordinate> geometry;
    std::vector<Step> steps;
};

struct RouteResponse {
    std::vector<RouteCandidate> routes; // Best candidate first
};

// Builds the active route from the first candidate of a provider response.
// Zero candidates -> ROUTE_UNAVAILABLE. Missing geometry, empty step list, a first step that
// is not DEPART, a last step that is not ARRIVE or negative distances -> MALFORMED_ROUTE.
bool buildRouteFromResponse(const RouteResponse& response, RouteHandle& out_route, NavError& out_error);

// Provider vocabulary ("turn", "end of road", "slight left", ...).
ManeuverType maneuverTypeFromString(const std::string& text);
ManeuverModifier maneuverModifierFromString(const std::string& text);
const char* maneuverTypeToString(ManeuverType type);
const char* maneuverModifierToString(ManeuverModifier modifier);

} // namespace nav_route
} // namespace tripnav

#endif // TRIPNAV_ROUTE_MODEL_H
