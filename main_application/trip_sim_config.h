// TripNavSim/main_application/trip_sim_config.h
#ifndef TRIPNAV_TRIP_SIM_CONFIG_H
#define TRIPNAV_TRIP_SIM_CONFIG_H

#include "../common/datatypes.h"
#include "../common/logger.h"
#include <cstdint>
#include <string>

namespace main_application {

// Runtime settings of the demo trip. Guidance thresholds are not part of this: they are fixed
// in common/nav_constants.h.
struct TripSimConfig {
    tripnav::Coordinate origin;
    tripnav::Coordinate destination;
    double speed_mps;
    int64_t fix_interval_ms;
    int64_t provider_latency_ms;
    int provider_failures;      // Transport failures injected into the first fetches
    bool miss_turn;             // Traveler overshoots the first turn to force a reroute
    bool gps_fails_to_start;
    int64_t max_sim_ms;
    int64_t tick_sleep_ms;      // Wall-clock pause per tick, 0 runs as fast as possible
    tripnav::logging::LogLevel log_level;

    void initDefaults();

    // Accepts "key=value". Returns false on an unknown key or unparsable value.
    bool applyArgument(const std::string& argument);
};

// Applies argv[1..] on top of the defaults. Stops at the first bad argument.
bool parseTripSimArguments(int argc, char* argv[], TripSimConfig& config);

} // namespace main_application

#endif // TRIPNAV_TRIP_SIM_CONFIG_H
