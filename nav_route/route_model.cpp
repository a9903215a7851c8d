// TripNavSim/nav_route/route_model.cpp
#include "route_model.h"
#include "../common/logger.h"
#include <utility>

namespace tripnav {
namespace nav_route {

Route::Route(double total_distance_m, double total_duration_s,
             std::vector<Coordinate> geometry, std::vector<Step> steps) :
    total_distance_m_(total_distance_m),
    total_duration_s_(total_duration_s),
    geometry_(std::move(geometry)),
    steps_(std::move(steps))
{
}

double Route::remainingDistanceMeters(size_t from_index) const {
    double total = 0.0;
    for (size_t i = from_index; i < steps_.size(); ++i) {
        total += steps_[i].distance_m;
    }
    return total;
}

double Route::remainingDurationSeconds(size_t from_index) const {
    double total = 0.0;
    for (size_t i = from_index; i < steps_.size(); ++i) {
        total += steps_[i].duration_s;
    }
    return total;
}

namespace {

bool rejectMalformed(const std::string& details, NavError& out_error) {
    out_error = NavError{NavErrorCode::MALFORMED_ROUTE, details};
    TRIPNAV_LOG_WARNING("RouteModel: Rejecting provider route: %s", details.c_str());
    return false;
}

} // namespace

bool buildRouteFromResponse(const RouteResponse& response, RouteHandle& out_route, NavError& out_error) {
    if (response.routes.empty()) {
        out_error = NavError{NavErrorCode::ROUTE_UNAVAILABLE, "No route found"};
        TRIPNAV_LOG_WARNING("RouteModel: Provider returned zero route candidates.");
        return false;
    }

    const RouteCandidate& candidate = response.routes.front();
    if (candidate.steps.empty()) {
        return rejectMalformed("Route has no steps", out_error);
    }
    if (candidate.geometry.empty()) {
        return rejectMalformed("Route has no geometry", out_error);
    }
    if (candidate.steps.front().maneuver.type != ManeuverType::DEPART) {
        return rejectMalformed("First step is not a depart maneuver", out_error);
    }
    if (candidate.steps.back().maneuver.type != ManeuverType::ARRIVE) {
        return rejectMalformed("Last step is not an arrive maneuver", out_error);
    }
    if (candidate.distance_m < 0.0 || candidate.duration_s < 0.0) {
        return rejectMalformed("Negative route distance or duration", out_error);
    }
    for (const auto& step : candidate.steps) {
        if (step.distance_m < 0.0 || step.duration_s < 0.0) {
            return rejectMalformed("Negative step distance or duration", out_error);
        }
    }

    out_route = std::make_shared<const Route>(candidate.distance_m, candidate.duration_s,
                                              candidate.geometry, candidate.steps);
    out_error = noError();
    TRIPNAV_LOG_DEBUG("RouteModel: Built route. %zu steps, %zu geometry points, %.0f m, %.0f s.",
                      candidate.steps.size(), candidate.geometry.size(),
                      candidate.distance_m, candidate.duration_s);
    return true;
}

ManeuverType maneuverTypeFromString(const std::string& text) {
    if (text == "depart") return ManeuverType::DEPART;
    if (text == "arrive") return ManeuverType::ARRIVE;
    if (text == "turn") return ManeuverType::TURN;
    if (text == "new name") return ManeuverType::NEW_NAME;
    if (text == "continue") return ManeuverType::CONTINUE;
    if (text == "merge") return ManeuverType::MERGE;
    if (text == "on ramp") return ManeuverType::ON_RAMP;
    if (text == "off ramp") return ManeuverType::OFF_RAMP;
    if (text == "fork") return ManeuverType::FORK;
    if (text == "end of road") return ManeuverType::END_OF_ROAD;
    if (text == "roundabout") return ManeuverType::ROUNDABOUT;
    if (text == "rotary") return ManeuverType::ROTARY;
    if (text == "notification") return ManeuverType::NOTIFICATION;
    return ManeuverType::UNKNOWN;
}

ManeuverModifier maneuverModifierFromString(const std::string& text) {
    if (text == "uturn") return ManeuverModifier::UTURN;
    if (text == "sharp right") return ManeuverModifier::SHARP_RIGHT;
    if (text == "right") return ManeuverModifier::RIGHT;
    if (text == "slight right") return ManeuverModifier::SLIGHT_RIGHT;
    if (text == "straight") return ManeuverModifier::STRAIGHT;
    if (text == "slight left") return ManeuverModifier::SLIGHT_LEFT;
    if (text == "left") return ManeuverModifier::LEFT;
    if (text == "sharp left") return ManeuverModifier::SHARP_LEFT;
    return ManeuverModifier::NONE;
}

const char* maneuverTypeToString(ManeuverType type) {
    switch (type) {
        case ManeuverType::DEPART: return "depart";
        case ManeuverType::ARRIVE: return "arrive";
        case ManeuverType::TURN: return "turn";
        case ManeuverType::NEW_NAME: return "new name";
        case ManeuverType::CONTINUE: return "continue";
        case ManeuverType::MERGE: return "merge";
        case ManeuverType::ON_RAMP: return "on ramp";
        case ManeuverType::OFF_RAMP: return "off ramp";
        case ManeuverType::FORK: return "fork";
        case ManeuverType::END_OF_ROAD: return "end of road";
        case ManeuverType::ROUNDABOUT: return "roundabout";
        case ManeuverType::ROTARY: return "rotary";
        case ManeuverType::NOTIFICATION: return "notification";
        case ManeuverType::UNKNOWN: return "unknown";
        default: return "unknown";
    }
}

const char* maneuverModifierToString(ManeuverModifier modifier) {
    switch (modifier) {
        case ManeuverModifier::NONE: return "";
        case ManeuverModifier::UTURN: return "uturn";
        case ManeuverModifier::SHARP_RIGHT: return "sharp right";
        case ManeuverModifier::RIGHT: return "right";
        case ManeuverModifier::SLIGHT_RIGHT: return "slight right";
        case ManeuverModifier::STRAIGHT: return "straight";
        case ManeuverModifier::SLIGHT_LEFT: return "slight left";
        case ManeuverModifier::LEFT: return "left";
        case ManeuverModifier::SHARP_LEFT: return "sharp left";
        default: return "";
    }
}

} // namespace nav_route
} // namespace tripnav
