// TripNavSim/common/datatypes.h
#ifndef TRIPNAV_DATATYPES_H
#define TRIPNAV_DATATYPES_H

#include <cstdint>
#include <string>

namespace tripnav {

// Latitude / longitude pair in degrees. Range is not enforced (GPS noise is accepted as-is).
struct Coordinate {
    double latitude;
    double longitude;
};

// One reported position sample. timestamp_ms is the monotonic receipt time.
struct PositionFix {
    Coordinate coordinate;
    int64_t timestamp_ms;
};

enum class NavErrorCode {
    NONE,
    ROUTE_UNAVAILABLE,    // Provider returned no usable route
    POSITION_UNAVAILABLE, // Position source failed or no fix known
    REROUTE_FAILED,       // Reroute fetch failed, stale route kept
    MALFORMED_ROUTE       // Provider response missing required fields
};

struct NavError {
    NavErrorCode code;
    std::string details;

    bool isSet() const { return code != NavErrorCode::NONE; }
};

inline NavError noError() {
    return NavError{NavErrorCode::NONE, ""};
}

const char* navErrorCodeToString(NavErrorCode code);

} // namespace tripnav

#endif // TRIPNAV_DATATYPES_H
