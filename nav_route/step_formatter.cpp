// TripNavSim/nav_route/step_formatter.cpp
#include "step_formatter.h"
#include <cctype>
#include <cmath>
#include <cstdio>

namespace tripnav {
namespace nav_route {

namespace {

// Half-up rounding, matching what the presentation layer shows.
long long roundHalfUp(double value) {
    return static_cast<long long>(std::floor(value + 0.5));
}

std::string capitalizedModifier(ManeuverModifier modifier) {
    std::string text = maneuverModifierToString(modifier);
    for (auto& c : text) {
        if (c == '-') c = ' ';
    }
    if (!text.empty()) {
        text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    }
    return text;
}

} // namespace

std::string formatStepInstruction(const Step& step) {
    const std::string& name = step.road_name;
    if (step.maneuver.type == ManeuverType::DEPART) {
        return name.empty() ? "Depart" : "Start on " + name;
    }
    if (step.maneuver.type == ManeuverType::ARRIVE) {
        return "Arrive at destination";
    }
    if (step.maneuver.modifier != ManeuverModifier::NONE) {
        std::string direction = capitalizedModifier(step.maneuver.modifier);
        return name.empty() ? direction : direction + " onto " + name;
    }
    return name.empty() ? "Continue" : "Continue on " + name;
}

std::string formatDistance(double meters) {
    char buffer[32];
    if (meters < 1000.0) {
        std::snprintf(buffer, sizeof(buffer), "%lld m", roundHalfUp(meters));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f km", meters / 1000.0);
    }
    return buffer;
}

std::string formatDuration(double seconds) {
    long long minutes = roundHalfUp(seconds / 60.0);
    if (minutes < 60) {
        return std::to_string(minutes) + " min";
    }
    return std::to_string(minutes / 60) + "h " + std::to_string(minutes % 60) + "m";
}

} // namespace nav_route
} // namespace tripnav
