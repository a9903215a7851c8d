// TripNavSim/common/datatypes.cpp
#include "datatypes.h"

namespace tripnav {

const char* navErrorCodeToString(NavErrorCode code) {
    switch (code) {
        case NavErrorCode::NONE: return "NONE";
        case NavErrorCode::ROUTE_UNAVAILABLE: return "ROUTE_UNAVAILABLE";
        case NavErrorCode::POSITION_UNAVAILABLE: return "POSITION_UNAVAILABLE";
        case NavErrorCode::REROUTE_FAILED: return "REROUTE_FAILED";
        case NavErrorCode::MALFORMED_ROUTE: return "MALFORMED_ROUTE";
        default: return "UNKNOWN_NAV_ERROR";
    }
}

} // namespace tripnav
